#include "khepri_status.hpp"
#include "khepri_common.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fcntl.h>

StatusStore::StatusStore(std::string path) : path_(std::move(path)) {}

std::string StatusStore::serialize(const PersistedStatus& st) {
    std::ostringstream out;
    out << "last_heartbeat " << static_cast<long long>(st.last_heartbeat) << "\n"
        << "service_suspended " << (st.service_suspended ? 1 : 0) << "\n"
        << "suspend_reason " << st.suspend_reason << "\n"
        << "current_transfer_source " << st.current_transfer_source << "\n"
        << "transfer_target_user " << st.transfer_target_user << "\n"
        << "transfer_in_progress " << (st.transfer_in_progress ? 1 : 0) << "\n"
        << "current_transfer_size " << st.current_transfer_size << "\n"
        << "bytes_completed " << st.bytes_completed << "\n"
        << "bytes_current_file " << st.bytes_current_file << "\n"
        << "percent_complete " << st.percent_complete << "\n"
        << "last_storage_notification " << static_cast<long long>(st.last_storage_notification) << "\n"
        << "last_admin_notification " << static_cast<long long>(st.last_admin_notification) << "\n"
        << "last_grace_notification " << static_cast<long long>(st.last_grace_notification) << "\n"
        << "clean_shutdown " << (st.clean_shutdown ? 1 : 0) << "\n";
    return out.str();
}

bool StatusStore::parse(const std::string& text, PersistedStatus& out) {
    PersistedStatus st;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    auto to_u64 = [](const std::string& v) -> uint64_t { return std::stoull(v); };
    auto to_time = [](const std::string& v) -> time_t { return static_cast<time_t>(std::stoll(v)); };
    auto to_bool = [](const std::string& v) -> bool { return v == "1" || v == "true"; };

    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;

        auto space = line.find(' ');
        std::string key = line.substr(0, space);
        std::string value = space == std::string::npos ? std::string() : line.substr(space + 1);

        try {
            if (key == "last_heartbeat") st.last_heartbeat = to_time(value);
            else if (key == "service_suspended") st.service_suspended = to_bool(value);
            else if (key == "suspend_reason") st.suspend_reason = value;
            else if (key == "current_transfer_source") st.current_transfer_source = value;
            else if (key == "transfer_target_user") st.transfer_target_user = value;
            else if (key == "transfer_in_progress") st.transfer_in_progress = to_bool(value);
            else if (key == "current_transfer_size") st.current_transfer_size = to_u64(value);
            else if (key == "bytes_completed") st.bytes_completed = to_u64(value);
            else if (key == "bytes_current_file") st.bytes_current_file = to_u64(value);
            else if (key == "percent_complete") st.percent_complete = std::stoi(value);
            else if (key == "last_storage_notification") st.last_storage_notification = to_time(value);
            else if (key == "last_admin_notification") st.last_admin_notification = to_time(value);
            else if (key == "last_grace_notification") st.last_grace_notification = to_time(value);
            else if (key == "clean_shutdown") st.clean_shutdown = to_bool(value);
            else KHEPRI_LOG_DEBUG("status", "Ignoring unknown status key '%s'", key.c_str());
        } catch (const std::exception& e) {
            KHEPRI_LOG_WARN("status", "Malformed status line %d (%s): %s", line_no, key.c_str(), e.what());
            return false;
        }
    }

    out = st;
    return true;
}

bool StatusStore::load() {
    std::ifstream in(path_);
    if (!in) {
        KHEPRI_LOG_WARN("status", "No status file at %s, starting with defaults", path_.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    PersistedStatus parsed;
    if (!parse(buffer.str(), parsed)) {
        KHEPRI_LOG_WARN("status", "Status file %s unreadable, starting with defaults", path_.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    status_ = parsed;
    return true;
}

void StatusStore::validate(const std::string& tmp_transfer_path) {
    std::lock_guard<std::mutex> lk(mtx_);
    bool changed = false;

    if (!status_.current_transfer_source.empty() &&
        !khepri_is_directory(status_.current_transfer_source)) {
        KHEPRI_LOG_WARN("status", "Recorded transfer source %s no longer exists, resetting it",
                        status_.current_transfer_source.c_str());
        status_.current_transfer_source.clear();
        changed = true;
    }

    if (!status_.transfer_target_user.empty() &&
        !khepri_is_directory(khepri_join(tmp_transfer_path, status_.transfer_target_user))) {
        KHEPRI_LOG_WARN("status", "Temporary target for user %s is missing, resetting it",
                        status_.transfer_target_user.c_str());
        status_.transfer_target_user.clear();
        changed = true;
    }

    if (changed) persist_locked();
}

void StatusStore::mark_started() {
    std::lock_guard<std::mutex> lk(mtx_);
    previous_clean_ = status_.clean_shutdown;
    if (!previous_clean_) {
        KHEPRI_LOG_WARN("status", "Previous run did not shut down cleanly");
    }
    status_.clean_shutdown = false;
    persist_locked();
}

bool StatusStore::persisted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return persist_ok_;
}

PersistedStatus StatusStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return status_;
}

std::string StatusStore::summary() const {
    PersistedStatus st = snapshot();
    char buf[2048];
    snprintf(buf, sizeof(buf),
             "heartbeat: %s\n"
             "suspended: %s%s%s\n"
             "transfer in progress: %s\n"
             "transfer source: %s\n"
             "target user: %s\n"
             "progress: %d%% (%s of %s, current file %s)\n"
             "clean shutdown: %s",
             st.last_heartbeat ? khepri_timestamp(st.last_heartbeat).c_str() : "never",
             st.service_suspended ? "yes" : "no",
             st.suspend_reason.empty() ? "" : " - ",
             st.suspend_reason.c_str(),
             st.transfer_in_progress ? "yes" : "no",
             st.current_transfer_source.empty() ? "(none)" : st.current_transfer_source.c_str(),
             st.transfer_target_user.empty() ? "(none)" : st.transfer_target_user.c_str(),
             st.percent_complete,
             khepri_bytes_to_human(st.bytes_completed).c_str(),
             khepri_bytes_to_human(st.current_transfer_size).c_str(),
             khepri_bytes_to_human(st.bytes_current_file).c_str(),
             st.clean_shutdown ? "yes" : "no");
    return buf;
}

void StatusStore::persist_locked() {
    persist_ok_ = false;
    std::string data = serialize(status_);
    std::string tmp = path_ + ".tmp";

    unique_fd fd(open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd) {
        KHEPRI_LOG_ERROR("status", "Cannot write status file %s: %s", tmp.c_str(), strerror(errno));
        return;
    }

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd.get(), data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            KHEPRI_LOG_ERROR("status", "Write to %s failed: %s", tmp.c_str(), strerror(errno));
            return;
        }
        off += static_cast<size_t>(n);
    }

    if (fsync(fd.get()) != 0) {
        KHEPRI_LOG_WARN("status", "fsync %s failed: %s", tmp.c_str(), strerror(errno));
    }
    fd.reset();

    if (rename(tmp.c_str(), path_.c_str()) != 0) {
        KHEPRI_LOG_ERROR("status", "Replacing %s failed: %s", path_.c_str(), strerror(errno));
        return;
    }
    persist_ok_ = true;
}

void StatusStore::set_heartbeat(time_t t) {
    update([t](PersistedStatus& st) { st.last_heartbeat = t; });
}

void StatusStore::set_suspended(bool suspended, const std::string& reason) {
    update([&](PersistedStatus& st) {
        st.service_suspended = suspended;
        st.suspend_reason = reason;
    });
}

void StatusStore::set_current_transfer_source(const std::string& src) {
    update([&](PersistedStatus& st) { st.current_transfer_source = src; });
}

void StatusStore::set_transfer_target_user(const std::string& user) {
    update([&](PersistedStatus& st) { st.transfer_target_user = user; });
}

void StatusStore::set_transfer_in_progress(bool in_progress) {
    update([in_progress](PersistedStatus& st) { st.transfer_in_progress = in_progress; });
}

void StatusStore::set_current_transfer_size(uint64_t size) {
    update([size](PersistedStatus& st) { st.current_transfer_size = size; });
}

void StatusStore::set_last_storage_notification(time_t t) {
    update([t](PersistedStatus& st) { st.last_storage_notification = t; });
}

void StatusStore::set_last_admin_notification(time_t t) {
    update([t](PersistedStatus& st) { st.last_admin_notification = t; });
}

void StatusStore::set_last_grace_notification(time_t t) {
    update([t](PersistedStatus& st) { st.last_grace_notification = t; });
}

void StatusStore::set_clean_shutdown(bool clean) {
    update([clean](PersistedStatus& st) { st.clean_shutdown = clean; });
}
