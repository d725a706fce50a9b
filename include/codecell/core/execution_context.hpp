/**
 * @file execution_context.hpp
 * @brief Disposable per-run workspace
 *
 * Every run gets a fresh directory under the workspace root, owned by the
 * run identity and removed again on every exit path. The untrusted payload
 * is materialized into it before the runner starts.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"
#include "codecell/sandbox/privilege_deescalator.hpp"

#include <string>
#include <optional>
#include <filesystem>

namespace codecell {
namespace core {

/**
 * @class ExecutionContext
 * @brief RAII owner of one run's workspace directory
 *
 * **Layout**:
 * @code
 * <workspace_root>/            mode 0711, owned by the orchestrator
 *   <request_id>-XXXXXX/       mode 0700, owned by the run identity
 *     solution.py
 *     tests/test_solution.py
 *     requirements.txt         (manifest, when present)
 * @endcode
 *
 * **Thread Safety**: one instance per run; not shared.
 */
class ExecutionContext {
public:
    /**
     * @brief Create the workspace directory
     * @param root Workspace root (must already exist)
     * @param request_id Prefix of the directory name
     * @param owner Identity to hand the workspace to (only applied as root)
     * @param preserve Keep the directory on destruction
     * @throws WorkspaceError if the directory cannot be created
     */
    ExecutionContext(const std::filesystem::path& root,
                     const std::string& request_id,
                     std::optional<sandbox::Identity> owner,
                     bool preserve = false);

    ~ExecutionContext();

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    /**
     * @brief Write the request's files and manifest into the workspace
     * @throws WorkspaceError on unsafe paths or I/O failure
     */
    void Materialize(const ExecutionRequest& request, const std::string& manifest_filename);

    /**
     * @brief Write one file, creating parent directories
     * @throws WorkspaceError on unsafe paths or I/O failure
     */
    void WriteFile(const std::string& relative_path, const std::string& content);

    /**
     * @brief Delete the workspace now
     * @return true if nothing is left behind
     */
    bool Remove();

    /**
     * @brief Resolve a payload path inside a directory
     *
     * Rejects empty and absolute paths, "." and ".." components, and
     * embedded NUL bytes.
     *
     * @throws WorkspaceError if the path would leave the directory
     */
    static std::filesystem::path ResolveInside(const std::filesystem::path& directory,
                                               const std::string& relative_path);

    /**
     * @brief Create the workspace root with mode 0711
     * @throws WorkspaceError if it cannot be created
     */
    static void PrepareRoot(const std::filesystem::path& root);

private:
    void HandOver(const std::filesystem::path& path) const;

    std::filesystem::path path_;
    std::optional<sandbox::Identity> owner_;
    bool preserve_;
    bool removed_{false};
};

} // namespace core
} // namespace codecell
