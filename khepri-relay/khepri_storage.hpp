#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: free space and grace location tracking
// -----------------------------------------------------------------------------

#include "khepri_config.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <map>
#include <set>
#include <string>
#include <vector>

class HostProbe;

struct DriveWatch {
    std::string path;
    uint64_t threshold_gb = 0;
    uint64_t free_bytes = 0;
    bool sampled = false;

    bool low() const noexcept {
        return sampled && free_bytes < threshold_gb * 1024ULL * 1024 * 1024;
    }
};

struct ExpiredBatch {
    std::string name;
    int age_days = 0;
    uint64_t size_bytes = 0;
};

// Report-only: nothing in here deletes data.
class StorageStatus {
public:
    StorageStatus(std::string grace_root, const std::vector<DriveSpec>& drives,
                  int grace_period_days, std::chrono::seconds update_delta, HostProbe& probe);

    void reconfigure(const std::vector<DriveSpec>& drives, int grace_period_days,
                     std::chrono::seconds update_delta);

    // Rate-limited unless force is set. Return true when a scan actually ran.
    bool update_free_space(bool force = false);
    bool update_grace(bool force = false, time_t now = time(nullptr));

    bool any_drive_low() const;
    std::string free_space_summary() const;

    const std::map<std::string, std::vector<ExpiredBatch>>& expired() const noexcept { return expired_; }
    size_t expired_count() const;
    uint64_t expired_bytes() const;
    std::string grace_summary() const;

    // Grace entries ("user/name") whose name carries no timestamp.
    const std::set<std::string>& unparsable() const noexcept { return unparsable_; }

    const std::vector<DriveWatch>& drives() const noexcept { return drives_; }
    int grace_period_days() const noexcept { return grace_period_days_; }

private:
    bool due(bool& scanned, std::chrono::steady_clock::time_point& last, bool force);

    std::string grace_root_;
    std::vector<DriveWatch> drives_;
    int grace_period_days_;
    std::chrono::seconds update_delta_;
    HostProbe& probe_;

    std::chrono::steady_clock::time_point last_space_update_{};
    std::chrono::steady_clock::time_point last_grace_update_{};
    bool space_scanned_ = false;
    bool grace_scanned_ = false;

    std::map<std::string, std::vector<ExpiredBatch>> expired_;
    std::set<std::string> unparsable_;
};
