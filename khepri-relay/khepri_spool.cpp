#include "khepri_spool.hpp"
#include "khepri_common.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>

SpoolQueue::SpoolQueue(std::string incoming, std::string managed, std::string marker)
    : incoming_(std::move(incoming)), managed_(std::move(managed)), marker_(std::move(marker)) {}

std::string SpoolQueue::processing_path() const { return khepri_join(managed_, constants::STAGE_PROCESSING); }
std::string SpoolQueue::done_path() const { return khepri_join(managed_, constants::STAGE_DONE); }
std::string SpoolQueue::unmatched_path() const { return khepri_join(managed_, constants::STAGE_UNMATCHED); }
std::string SpoolQueue::error_path() const { return khepri_join(managed_, constants::STAGE_ERROR); }

bool SpoolQueue::check_layout() {
    bool ok = true;
    for (const auto& dir : {incoming_, managed_, processing_path(), done_path(),
                            unmatched_path(), error_path()}) {
        if (khepri_mkdir_p_safe(dir) != 0) {
            KHEPRI_LOG_ERROR("spool", "Cannot create spool directory %s: %s", dir.c_str(), strerror(errno));
            ok = false;
        }
    }
    return ok;
}

bool SpoolQueue::is_empty_except_marker(const std::string& dir) {
    std::vector<std::string> files = khepri_files_in_tree(dir);
    if (marker_.empty()) {
        return files.empty();
    }

    if (files.size() == 1 && files[0] == marker_) {
        return true;
    }

    std::string marker_path = khepri_join(dir, marker_);
    if (!khepri_path_exists(marker_path)) {
        unique_fd fd(open(marker_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (fd) {
            KHEPRI_LOG_DEBUG("spool", "Created marker file %s", marker_path.c_str());
        } else {
            KHEPRI_LOG_DEBUG("spool", "Could not create marker %s: %s", marker_path.c_str(), strerror(errno));
        }
    }

    return files.empty();
}

void SpoolQueue::collect_orphaned(const std::string& user_dir) {
    std::vector<std::string> files = khepri_list_dir(user_dir, EntryKind::File);
    files.erase(std::remove(files.begin(), files.end(), marker_), files.end());
    if (files.empty()) return;

    std::string orphaned = khepri_join(user_dir, constants::ORPHANED_DIR);
    if (khepri_path_exists(orphaned)) {
        KHEPRI_LOG_INFO("spool", "Orphaned directory already exists in %s, skipping individual files",
                        user_dir.c_str());
        return;
    }

    if (khepri_mkdir_p_safe(orphaned) != 0) {
        KHEPRI_LOG_ERROR("spool", "Cannot create %s: %s", orphaned.c_str(), strerror(errno));
        return;
    }

    KHEPRI_LOG_DEBUG("spool", "Collecting %zu individual files in %s", files.size(), orphaned.c_str());
    for (const auto& f : files) {
        if (khepri_move_collision_safe(khepri_join(user_dir, f), khepri_join(orphaned, f)).empty()) {
            KHEPRI_LOG_ERROR("spool", "Failed to collect orphaned file %s/%s", user_dir.c_str(), f.c_str());
        }
    }
}

std::vector<std::string> SpoolQueue::ready_users() {
    std::vector<std::string> ready;
    for (const auto& user : khepri_list_dir(incoming_, EntryKind::Directory)) {
        if (is_ignored(user)) continue;
        if (!is_empty_except_marker(khepri_join(incoming_, user))) {
            ready.push_back(user);
        }
    }
    return ready;
}

PromoteResult SpoolQueue::promote(const std::string& user, bool matched, const std::string& timestamp) {
    std::string src = khepri_join(incoming_, user);
    collect_orphaned(src);

    std::string stage = matched ? processing_path() : unmatched_path();
    std::string target = khepri_join(khepri_join(stage, timestamp), user);

    if (!matched) {
        KHEPRI_LOG_ERROR("spool", "No destination account for user %s, moving data to %s",
                         user.c_str(), target.c_str());
    }

    if (!khepri_move_entries(src, target, marker_)) {
        ignored_.insert(user);
        KHEPRI_LOG_ERROR("spool", "Moving %s to %s failed, ignoring %s until restart",
                         src.c_str(), target.c_str(), user.c_str());
        if (khepri_is_directory(target)) {
            std::string kept = quarantine(target, timestamp);
            if (!kept.empty()) {
                KHEPRI_LOG_ERROR("spool", "Partially moved data preserved in %s", kept.c_str());
            }
        }
        return PromoteResult::Failed;
    }

    KHEPRI_LOG_INFO("spool", "Queued data of %s as %s", user.c_str(), target.c_str());
    return matched ? PromoteResult::Promoted : PromoteResult::Unmatched;
}

std::string SpoolQueue::next_transfer_source() {
    const std::string processing = processing_path();

    for (const auto& batch : khepri_list_dir(processing, EntryKind::Directory)) {
        std::string batch_dir = khepri_join(processing, batch);
        std::vector<std::string> users = khepri_list_dir(batch_dir, EntryKind::Directory);
        if (!users.empty()) {
            return khepri_join(batch_dir, users.front());
        }

        KHEPRI_LOG_WARN("spool", "Batch %s has no user directories, removing it", batch_dir.c_str());
        if (!khepri_remove_empty_dir(batch_dir)) {
            // Loose files only; keep them out of the queue.
            if (quarantine(batch_dir, khepri_timestamp()).empty()) {
                KHEPRI_LOG_ERROR("spool", "Batch %s is stuck in processing", batch_dir.c_str());
            }
        }
    }
    return std::string();
}

std::string SpoolQueue::retire_to_grace(const std::string& source, const std::string& timestamp) {
    std::string user = khepri_basename(source);
    std::string user_grace = khepri_join(done_path(), user);

    if (khepri_mkdir_p_safe(user_grace) != 0) {
        KHEPRI_LOG_ERROR("spool", "Cannot create %s: %s", user_grace.c_str(), strerror(errno));
        return std::string();
    }

    std::string final_path = khepri_move_collision_safe(source, khepri_join(user_grace, timestamp));
    if (final_path.empty()) {
        return std::string();
    }

    std::string batch_dir = khepri_dirname(source);
    if (khepri_dirname(batch_dir) == processing_path()) {
        khepri_remove_empty_dir(batch_dir);
    }

    KHEPRI_LOG_INFO("spool", "Retired %s to grace location %s", source.c_str(), final_path.c_str());
    return final_path;
}

std::string SpoolQueue::quarantine(const std::string& path, const std::string& timestamp) {
    std::string error_batch = khepri_join(error_path(), timestamp);
    if (khepri_mkdir_p_safe(error_batch) != 0) {
        KHEPRI_LOG_ERROR("spool", "Cannot create %s: %s", error_batch.c_str(), strerror(errno));
        return std::string();
    }

    std::string final_path = khepri_move_collision_safe(path, khepri_join(error_batch, khepri_basename(path)));
    if (final_path.empty()) {
        KHEPRI_LOG_ERROR("spool", "Failed to move %s to error location", path.c_str());
        return std::string();
    }

    std::string parent = khepri_dirname(path);
    std::string stage = khepri_dirname(parent);
    if (stage == processing_path() || stage == unmatched_path()) {
        khepri_remove_empty_dir(parent);
    }

    KHEPRI_LOG_WARN("spool", "Moved %s to %s", path.c_str(), final_path.c_str());
    return final_path;
}

int SpoolQueue::create_incoming_dirs(const std::vector<std::string>& local_users,
                                     const std::vector<std::string>& remote_users,
                                     const std::string& tmp_transfer_dir) {
    int created = 0;
    for (const auto& user : local_users) {
        if (user == tmp_transfer_dir) continue;
        if (std::find(remote_users.begin(), remote_users.end(), user) == remote_users.end()) continue;

        std::string dir = khepri_join(incoming_, user);
        if (khepri_is_directory(dir)) continue;

        if (khepri_mkdir_p_safe(dir) != 0) {
            KHEPRI_LOG_WARN("spool", "Cannot create incoming directory %s: %s", dir.c_str(), strerror(errno));
            continue;
        }
        KHEPRI_LOG_INFO("spool", "Created incoming directory for %s", user.c_str());
        ++created;
    }
    return created;
}
