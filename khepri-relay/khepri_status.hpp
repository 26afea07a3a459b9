#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: persisted service status (write-through)
// -----------------------------------------------------------------------------

#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>

struct PersistedStatus {
    std::string current_transfer_source;
    std::string transfer_target_user;
    bool transfer_in_progress = false;
    uint64_t current_transfer_size = 0;
    uint64_t bytes_completed = 0;
    uint64_t bytes_current_file = 0;
    int percent_complete = 0;
    bool service_suspended = false;
    std::string suspend_reason;
    time_t last_heartbeat = 0;
    time_t last_storage_notification = 0;
    time_t last_admin_notification = 0;
    time_t last_grace_notification = 0;
    bool clean_shutdown = false;
};

// Single owner of PersistedStatus. Every mutation is applied and written to
// disk under one lock; the file is replaced atomically.
class StatusStore {
public:
    explicit StatusStore(std::string path);

    // Reads the status file. A missing or unreadable file leaves defaults in
    // place and returns false.
    bool load();

    // Clears fields that point at paths which no longer exist.
    void validate(const std::string& tmp_transfer_path);

    // Records the previous shutdown flag and sets clean_shutdown=false.
    void mark_started();
    bool previous_shutdown_clean() const noexcept { return previous_clean_; }

    PersistedStatus snapshot() const;
    std::string summary() const;
    const std::string& path() const noexcept { return path_; }

    void set_heartbeat(time_t t);
    void set_suspended(bool suspended, const std::string& reason);
    void set_current_transfer_source(const std::string& src);
    void set_transfer_target_user(const std::string& user);
    void set_transfer_in_progress(bool in_progress);
    void set_current_transfer_size(uint64_t size);
    void set_last_storage_notification(time_t t);
    void set_last_admin_notification(time_t t);
    void set_last_grace_notification(time_t t);
    void set_clean_shutdown(bool clean);

    // Applies several field changes with a single persist.
    template <typename Fn>
    void update(Fn&& fn) {
        std::lock_guard<std::mutex> lk(mtx_);
        fn(status_);
        persist_locked();
    }

    // False when the last write to disk failed.
    bool persisted() const;

    static std::string serialize(const PersistedStatus& st);
    static bool parse(const std::string& text, PersistedStatus& out);

private:
    void persist_locked();

    std::string path_;
    mutable std::mutex mtx_;
    PersistedStatus status_;
    bool previous_clean_ = true;
    bool persist_ok_ = true;
};
