#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: spool queue stages and the move protocol between them
// -----------------------------------------------------------------------------
//
//   Incoming/<user>/...                 new data lands here
//   Processing/<timestamp>/<user>/...   queued, one batch per timestamp
//   Done/<user>/<timestamp>/...         grace-period holding area
//   Unmatched/<timestamp>/<user>/...    no matching destination account
//   Error/<timestamp>/...               failed batches, kept for inspection

#include <set>
#include <string>
#include <vector>

enum class PromoteResult { Promoted, Unmatched, Failed };

class SpoolQueue {
public:
    SpoolQueue(std::string incoming, std::string managed, std::string marker);

    // Creates incoming, managed and the four managed stages when missing.
    bool check_layout();

    const std::string& incoming_path() const noexcept { return incoming_; }
    std::string processing_path() const;
    std::string done_path() const;
    std::string unmatched_path() const;
    std::string error_path() const;

    // True when dir holds nothing but (optionally) the marker file. Creates a
    // missing marker as a side effect.
    bool is_empty_except_marker(const std::string& dir);

    // Moves loose top-level files of a user directory into "orphaned".
    void collect_orphaned(const std::string& user_dir);

    // Incoming user directories that hold data and are not on the ignore list.
    std::vector<std::string> ready_users();

    PromoteResult promote(const std::string& user, bool matched, const std::string& timestamp);

    // Oldest Processing batch's first user directory, or an empty string.
    // Empty batch directories met on the way are removed.
    std::string next_transfer_source();

    // Moves a transferred source to Done/<user>/<timestamp> and removes its
    // batch directory once empty. Returns the grace path, empty on failure.
    std::string retire_to_grace(const std::string& source, const std::string& timestamp);

    // Moves path to Error/<timestamp>/<name>. Returns the new path, empty on failure.
    std::string quarantine(const std::string& path, const std::string& timestamp);

    // Creates Incoming/<user> for users that exist both locally and on the destination.
    int create_incoming_dirs(const std::vector<std::string>& local_users,
                             const std::vector<std::string>& remote_users,
                             const std::string& tmp_transfer_dir);

    bool is_ignored(const std::string& user) const { return ignored_.count(user) != 0; }

private:
    std::string incoming_;
    std::string managed_;
    std::string marker_;
    std::set<std::string> ignored_;
};
