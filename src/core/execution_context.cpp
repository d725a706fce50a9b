/**
 * @file execution_context.cpp
 * @brief Implementation of the per-run workspace
 *
 * @date 2025
 */

#include "codecell/core/execution_context.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <cerrno>
#include <cstring>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace codecell {
namespace core {

namespace fs = std::filesystem;

namespace {

std::string Errno(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Untrusted code may leave directories without write or search permission
void MakeRemovable(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::is_directory(status)) {
        return;
    }

    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);

    std::vector<fs::path> children;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    for (const auto& child : children) {
        MakeRemovable(child);
    }
}

} // namespace

ExecutionContext::ExecutionContext(const fs::path& root,
                                   const std::string& request_id,
                                   std::optional<sandbox::Identity> owner,
                                   bool preserve)
    : owner_(owner), preserve_(preserve) {

    std::string name_template = (root / (request_id + "-XXXXXX")).string();
    std::vector<char> buffer(name_template.begin(), name_template.end());
    buffer.push_back('\0');

    // mkdtemp creates the directory with mode 0700
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw WorkspaceError(Errno("Cannot create workspace under " + root.string()));
    }
    path_ = fs::path(buffer.data());

    try {
        HandOver(path_);
    }
    catch (const WorkspaceError&) {
        Remove();
        throw;
    }

    spdlog::debug("Workspace created: {}", path_.string());
}

ExecutionContext::~ExecutionContext() {
    if (preserve_) {
        if (!removed_) {
            spdlog::info("Workspace preserved: {}", path_.string());
        }
        return;
    }
    if (!Remove()) {
        spdlog::error("Workspace {} could not be removed", path_.string());
    }
}

fs::path ExecutionContext::ResolveInside(const fs::path& directory,
                                         const std::string& relative_path) {
    if (relative_path.empty()) {
        throw WorkspaceError("Empty file path in payload");
    }
    if (relative_path.find('\0') != std::string::npos) {
        throw WorkspaceError("File path contains a NUL byte");
    }

    fs::path relative(relative_path);
    if (relative.is_absolute() || relative.has_root_name() || relative_path[0] == '/') {
        throw WorkspaceError("Absolute file path in payload: " + relative_path);
    }

    fs::path resolved = directory;
    bool has_name = false;
    for (const auto& component : relative) {
        const std::string part = component.string();
        if (part.empty()) {
            continue;  // trailing separator
        }
        if (part == "." || part == "..") {
            throw WorkspaceError("File path leaves the workspace: " + relative_path);
        }
        resolved /= component;
        has_name = true;
    }
    if (!has_name || utils::StringUtils::EndsWith(relative_path, "/")) {
        throw WorkspaceError("File path names a directory: " + relative_path);
    }

    return resolved;
}

void ExecutionContext::PrepareRoot(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw WorkspaceError("Cannot create workspace root " + root.string() + ": " + ec.message());
    }
    if (!fs::is_directory(root)) {
        throw WorkspaceError("Workspace root is not a directory: " + root.string());
    }

    // Run identities may traverse into their own directory but not list others
    if (::chmod(root.c_str(), 0711) != 0) {
        throw WorkspaceError(Errno("Cannot set permissions on " + root.string()));
    }
}

void ExecutionContext::Materialize(const ExecutionRequest& request,
                                   const std::string& manifest_filename) {
    for (const auto& [relative_path, content] : request.files) {
        WriteFile(relative_path, content);
    }

    if (request.manifest) {
        if (request.files.count(manifest_filename) != 0) {
            throw WorkspaceError("Payload file collides with the manifest: " + manifest_filename);
        }
        WriteFile(manifest_filename, *request.manifest);
    }

    spdlog::debug("Materialized {} file(s){} into {}", request.files.size(),
                  request.manifest ? " and the manifest" : "", path_.string());
}

void ExecutionContext::WriteFile(const std::string& relative_path, const std::string& content) {
    fs::path target = ResolveInside(path_, relative_path);

    // Create missing parents one by one so each can be handed over
    fs::path current = path_;
    for (const auto& component : target.lexically_relative(path_).parent_path()) {
        current /= component;
        std::error_code ec;
        auto status = fs::symlink_status(current, ec);
        if (!ec && fs::exists(status)) {
            if (!fs::is_directory(status)) {
                throw WorkspaceError("Path component is not a directory: " + relative_path);
            }
            continue;
        }
        if (::mkdir(current.c_str(), 0755) != 0) {
            throw WorkspaceError(Errno("Cannot create directory for " + relative_path));
        }
        HandOver(current);
    }

    std::error_code ec;
    if (fs::exists(fs::symlink_status(target, ec))) {
        throw WorkspaceError("Duplicate file path in payload: " + relative_path);
    }

    std::ofstream file(target, std::ios::binary);
    if (!file) {
        throw WorkspaceError("Cannot create file " + relative_path);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        throw WorkspaceError("Cannot write file " + relative_path);
    }

    HandOver(target);
}

void ExecutionContext::HandOver(const fs::path& path) const {
    if (!owner_ || geteuid() != 0) {
        return;
    }
    if (::lchown(path.c_str(), owner_->uid, owner_->gid) != 0) {
        throw WorkspaceError(Errno("Cannot hand " + path.string() + " to the run identity"));
    }
}

bool ExecutionContext::Remove() {
    if (removed_ || path_.empty()) {
        return true;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::debug("Retrying workspace removal after fixing permissions: {}", ec.message());
        MakeRemovable(path_);
        ec.clear();
        fs::remove_all(path_, ec);
    }
    if (ec) {
        spdlog::error("Failed to remove workspace {}: {}", path_.string(), ec.message());
        return false;
    }

    removed_ = true;
    spdlog::debug("Workspace removed: {}", path_.string());
    return true;
}

} // namespace core
} // namespace codecell
