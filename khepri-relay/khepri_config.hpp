#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: environment-based configuration
// -----------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct DriveSpec {
    std::string path;
    uint64_t threshold_gb = 0;
};

struct Config {
    std::string incoming_path = "/srv/khepri/incoming";
    std::string managed_path = "/srv/khepri/managed";
    std::string destination_path = "/mnt/khepri/destination";
    std::string tmp_transfer_dir = ".khepri-tmp";
    std::string home_root = "/home";
    std::string marker_file = "_DO_NOT_ACQUIRE_HERE_.txt";
    std::string status_file = "/var/lib/khepri/status";

    int service_timer_ms = 1000;

    double max_cpu_usage = 25.0;
    int cpu_probation = 16;
    int cpu_interval_ms = 250;
    double max_disk_queue = 1.0;
    int disk_probation = 40;
    int disk_interval_ms = 250;
    bool monitor_start_high = false;
    long min_available_memory_mb = 512;
    std::vector<std::string> blacklisted_processes;
    bool ignore_limits_without_session = true;

    std::vector<DriveSpec> space_monitoring{{"/", 10}};
    int grace_period_days = 30;
    int storage_update_sec = 20;

    int cooldown_cycles = 2;
    int storage_notification_min = 720;
    int admin_notification_min = 60;
    int grace_notification_min = 720;
    int max_copy_retries = 5;

    std::string rsync_path = "/usr/bin/rsync";
    uint64_t bandwidth_limit_kbps = 0;

    std::string log_level = "info";
    std::string run_as_user;
    bool use_syslog = true;
    bool daemonize = true;

    std::string processing_path() const;
    std::string done_path() const;
    std::string unmatched_path() const;
    std::string error_path() const;
    std::string tmp_transfer_path() const;
};

// "path:thresholdGB,path:thresholdGB". Fails on any malformed entry.
bool khepri_parse_drive_list(const std::string& value, std::vector<DriveSpec>& out) noexcept;

// Parses and validates the environment; nullptr means the configuration is
// unusable and startup must fail.
std::shared_ptr<const Config> khepri_load_config_from_env() noexcept;

// Startup checks against the filesystem: destination root and its temporary
// directory exist, incoming and managed share one filesystem.
bool khepri_check_config_paths(const Config& cfg) noexcept;

class ConfigHolder {
    mutable std::mutex mtx_;
    std::shared_ptr<const Config> ptr_;

public:
    void store(std::shared_ptr<const Config> p) noexcept {
        std::lock_guard<std::mutex> lk(mtx_);
        ptr_ = std::move(p);
    }

    std::shared_ptr<const Config> load() const noexcept {
        std::lock_guard<std::mutex> lk(mtx_);
        return ptr_;
    }
};
