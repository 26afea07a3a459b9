#include "khepri_storage.hpp"
#include "khepri_common.hpp"
#include "khepri_system.hpp"

#include <sstream>

StorageStatus::StorageStatus(std::string grace_root, const std::vector<DriveSpec>& drives,
                             int grace_period_days, std::chrono::seconds update_delta, HostProbe& probe)
    : grace_root_(std::move(grace_root)),
      grace_period_days_(grace_period_days),
      update_delta_(update_delta),
      probe_(probe) {
    reconfigure(drives, grace_period_days, update_delta);
}

void StorageStatus::reconfigure(const std::vector<DriveSpec>& drives, int grace_period_days,
                                std::chrono::seconds update_delta) {
    std::vector<DriveWatch> watches;
    for (const auto& d : drives) {
        DriveWatch w;
        w.path = d.path;
        w.threshold_gb = d.threshold_gb;
        watches.push_back(w);
    }
    drives_ = std::move(watches);
    grace_period_days_ = grace_period_days;
    update_delta_ = update_delta;
    space_scanned_ = false;
    grace_scanned_ = false;
}

bool StorageStatus::due(bool& scanned, std::chrono::steady_clock::time_point& last, bool force) {
    auto now = std::chrono::steady_clock::now();
    if (!force && scanned && now - last < update_delta_) {
        return false;
    }
    scanned = true;
    last = now;
    return true;
}

bool StorageStatus::update_free_space(bool force) {
    if (!due(space_scanned_, last_space_update_, force)) return false;

    for (auto& drive : drives_) {
        uint64_t free_bytes = 0;
        if (probe_.free_bytes(drive.path, free_bytes)) {
            drive.free_bytes = free_bytes;
            drive.sampled = true;
        } else {
            drive.sampled = false;
        }
    }
    KHEPRI_LOG_DEBUG("storage", "Free space updated: %s", free_space_summary().c_str());
    return true;
}

bool StorageStatus::update_grace(bool force, time_t now) {
    if (!due(grace_scanned_, last_grace_update_, force)) return false;

    std::map<std::string, std::vector<ExpiredBatch>> expired;
    std::set<std::string> unparsable;
    if (!khepri_is_directory(grace_root_)) {
        KHEPRI_LOG_WARN("storage", "Grace location %s does not exist", grace_root_.c_str());
        expired_.swap(expired);
        unparsable_.swap(unparsable);
        return true;
    }

    for (const auto& user : khepri_list_dir(grace_root_, EntryKind::Directory)) {
        std::string user_dir = khepri_join(grace_root_, user);
        for (const auto& batch : khepri_list_dir(user_dir, EntryKind::Directory)) {
            int age = khepri_dir_name_to_age(batch, now);
            if (age < 0) {
                std::string entry = khepri_join(user, batch);
                // Reported once for as long as the entry stays around.
                if (!unparsable_.count(entry)) {
                    KHEPRI_LOG_WARN("storage", "Cannot derive an age from %s, it is never reported as expired",
                                    khepri_join(grace_root_, entry).c_str());
                }
                unparsable.insert(entry);
                continue;
            }
            if (age < grace_period_days_) continue;

            ExpiredBatch e;
            e.name = batch;
            e.age_days = age;
            e.size_bytes = khepri_dir_size(khepri_join(user_dir, batch));
            expired[user].push_back(e);
        }
    }

    expired_.swap(expired);
    unparsable_.swap(unparsable);
    KHEPRI_LOG_DEBUG("storage", "Grace location scanned: %zu expired batches", expired_count());
    return true;
}

bool StorageStatus::any_drive_low() const {
    for (const auto& d : drives_) {
        if (d.low()) return true;
    }
    return false;
}

std::string StorageStatus::free_space_summary() const {
    std::ostringstream out;
    bool first = true;
    for (const auto& d : drives_) {
        if (!first) out << "\n";
        first = false;
        out << d.path << ": ";
        if (!d.sampled) {
            out << "unknown";
        } else {
            out << khepri_bytes_to_human(d.free_bytes) << " free (threshold " << d.threshold_gb << " GB)";
            if (d.low()) out << " LOW";
        }
    }
    return out.str();
}

size_t StorageStatus::expired_count() const {
    size_t n = 0;
    for (const auto& kv : expired_) n += kv.second.size();
    return n;
}

uint64_t StorageStatus::expired_bytes() const {
    uint64_t total = 0;
    for (const auto& kv : expired_) {
        for (const auto& e : kv.second) total += e.size_bytes;
    }
    return total;
}

std::string StorageStatus::grace_summary() const {
    std::ostringstream out;
    out << "Expired batches in grace location (" << grace_period_days_ << " days): "
        << expired_count() << ", " << khepri_bytes_to_human(expired_bytes());
    for (const auto& kv : expired_) {
        out << "\n- " << kv.first << ":";
        for (const auto& e : kv.second) {
            out << "\n    " << e.name << " [" << e.age_days << " days, "
                << khepri_bytes_to_human(e.size_bytes) << "]";
        }
    }
    return out.str();
}
