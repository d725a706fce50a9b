/**
 * @file process_monitor.cpp
 * @brief Implementation of process tree sampling
 *
 * **Fields read**:
 * - /proc/[pid]/stat: name, state, ppid, pgrp, session, num_threads, rss
 * - /proc/[pid]/status: real and effective uid
 *
 * Processes vanish at any time; every read tolerates ENOENT by dropping the
 * entry.
 *
 * @date 2025
 */

#include "codecell/monitors/process_monitor.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <map>
#include <set>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <utility>

#include <dirent.h>
#include <signal.h>
#include <unistd.h>

namespace codecell {
namespace monitors {

namespace {

long PageSize() {
    static const long page_size = sysconf(_SC_PAGESIZE) > 0 ? sysconf(_SC_PAGESIZE) : 4096;
    return page_size;
}

bool IsNumeric(const char* name) {
    if (*name == '\0') {
        return false;
    }
    for (const char* p = name; *p != '\0'; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) {
            return false;
        }
    }
    return true;
}

// Walk the ppid chain of pid inside a snapshot
bool DescendsFrom(int pid, int root_pid, const std::map<int, ProcessInfo>& by_pid) {
    std::set<int> seen;
    int current = pid;
    while (current > 1 && seen.insert(current).second) {
        if (current == root_pid) {
            return true;
        }
        auto it = by_pid.find(current);
        if (it == by_pid.end()) {
            return false;
        }
        current = it->second.ppid;
    }
    return false;
}

} // namespace

ProcessMonitor::ProcessMonitor(std::filesystem::path proc_root)
    : proc_root_(std::move(proc_root)) {
}

std::vector<int> ProcessMonitor::ListPids() const {
    std::vector<int> pids;

    DIR* proc_dir = opendir(proc_root_.c_str());
    if (!proc_dir) {
        spdlog::warn("Cannot open {}: errno {}", proc_root_.string(), errno);
        return pids;
    }

    struct dirent* entry;
    while ((entry = readdir(proc_dir)) != nullptr) {
        if (IsNumeric(entry->d_name)) {
            pids.push_back(std::atoi(entry->d_name));
        }
    }
    closedir(proc_dir);

    return pids;
}

// Read process info from /proc/[pid]
std::optional<ProcessInfo> ProcessMonitor::ReadProcessInfo(int pid) const {
    ProcessInfo info;
    info.pid = pid;

    const auto base = proc_root_ / std::to_string(pid);

    std::ifstream stat_file(base / "stat");
    if (!stat_file.is_open()) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(stat_file, line)) {
        return std::nullopt;
    }

    // Format: pid (comm) state ppid pgrp session ... ; comm may contain spaces and ')'
    std::size_t start = line.find('(');
    std::size_t end = line.rfind(')');
    if (start == std::string::npos || end == std::string::npos || end + 2 > line.size()) {
        return std::nullopt;
    }
    info.name = line.substr(start + 1, end - start - 1);

    std::istringstream iss(line.substr(end + 2));
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    // fields[0] is stat field 3 (state)
    if (fields.size() < 22) {
        return std::nullopt;
    }
    try {
        info.state = fields[0].empty() ? '?' : fields[0][0];
        info.ppid = std::stoi(fields[1]);
        info.pgid = std::stoi(fields[2]);
        info.sid = std::stoi(fields[3]);
        info.thread_count = std::stoi(fields[17]);
        info.rss_bytes = std::stoull(fields[21]) * static_cast<std::uint64_t>(PageSize());
    }
    catch (const std::exception&) {
        return std::nullopt;
    }

    // Read /proc/[pid]/status for UID
    std::ifstream status_file(base / "status");
    if (status_file.is_open()) {
        while (std::getline(status_file, line)) {
            if (line.compare(0, 4, "Uid:") == 0) {
                std::istringstream uid_stream(line.substr(4));
                uid_stream >> info.uid >> info.euid;
                break;
            }
        }
    }

    return info;
}

std::vector<ProcessInfo> ProcessMonitor::Snapshot() const {
    std::vector<ProcessInfo> processes;
    for (int pid : ListPids()) {
        if (auto info = ReadProcessInfo(pid)) {
            processes.push_back(std::move(*info));
        }
    }
    return processes;
}

TreeSample ProcessMonitor::SampleTree(int root_pid, int sid) const {
    std::map<int, ProcessInfo> by_pid;
    for (auto& info : Snapshot()) {
        by_pid.emplace(info.pid, std::move(info));
    }

    TreeSample sample;
    for (const auto& [pid, info] : by_pid) {
        bool member = (sid > 0 && info.sid == sid) || DescendsFrom(pid, root_pid, by_pid);
        if (!member || info.state == 'Z') {
            continue;
        }
        sample.task_count += static_cast<std::uint64_t>(info.thread_count > 0 ? info.thread_count : 1);
        sample.rss_bytes += info.rss_bytes;
        sample.processes.push_back(info);
    }

    return sample;
}

std::uint64_t ProcessMonitor::CountTasksOfUser(int uid) const {
    std::uint64_t count = 0;
    for (const auto& info : Snapshot()) {
        if (info.uid == uid) {
            count += static_cast<std::uint64_t>(info.thread_count > 0 ? info.thread_count : 1);
        }
    }
    return count;
}

int ProcessMonitor::KillTree(int root_pid, int sid, int max_passes) const {
    int killed = 0;
    const pid_t self = getpid();

    for (int pass = 0; pass < max_passes; ++pass) {
        auto sample = SampleTree(root_pid, sid);
        int sent = 0;
        for (const auto& info : sample.processes) {
            if (info.pid == self || info.pid <= 1) {
                continue;
            }
            if (kill(info.pid, SIGKILL) == 0) {
                ++sent;
            }
        }
        killed += sent;
        if (sent == 0) {
            break;
        }
        // Give the kernel a moment to deliver before re-scanning
        usleep(2000);
    }

    if (killed > 0) {
        spdlog::debug("Killed {} process(es) in tree of pid {}", killed, root_pid);
    }
    return killed;
}

} // namespace monitors
} // namespace codecell
