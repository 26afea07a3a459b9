#include "khepri_config.hpp"
#include "khepri_common.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

std::string Config::processing_path() const { return khepri_join(managed_path, constants::STAGE_PROCESSING); }
std::string Config::done_path() const { return khepri_join(managed_path, constants::STAGE_DONE); }
std::string Config::unmatched_path() const { return khepri_join(managed_path, constants::STAGE_UNMATCHED); }
std::string Config::error_path() const { return khepri_join(managed_path, constants::STAGE_ERROR); }
std::string Config::tmp_transfer_path() const { return khepri_join(destination_path, tmp_transfer_dir); }

bool khepri_parse_drive_list(const std::string& value, std::vector<DriveSpec>& out) noexcept {
    try {
        std::vector<DriveSpec> drives;
        for (const auto& entry : khepri_split(value, ',')) {
            auto colon = entry.rfind(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == entry.size()) {
                KHEPRI_LOG_ERROR("config", "Drive entry '%s' is not of the form path:GB", entry.c_str());
                return false;
            }
            DriveSpec d;
            d.path = khepri_trim(entry.substr(0, colon));
            std::string gb = khepri_trim(entry.substr(colon + 1));
            if (d.path.empty() || d.path[0] != '/' ||
                gb.find_first_not_of("0123456789") != std::string::npos) {
                KHEPRI_LOG_ERROR("config", "Invalid drive entry '%s'", entry.c_str());
                return false;
            }
            d.threshold_gb = std::stoull(gb);
            drives.push_back(d);
        }
        out = std::move(drives);
        return true;
    } catch (const std::exception& e) {
        KHEPRI_LOG_ERROR("config", "Drive list '%s' rejected: %s", value.c_str(), e.what());
        return false;
    }
}

std::shared_ptr<const Config> khepri_load_config_from_env() noexcept {
    std::shared_ptr<Config> cfg;
    try {
        cfg = std::make_shared<Config>();
    } catch (const std::bad_alloc&) {
        return nullptr;
    }

    if (const char* v = getenv("INCOMING_PATH")) cfg->incoming_path = v;
    if (const char* v = getenv("MANAGED_PATH")) cfg->managed_path = v;
    if (const char* v = getenv("DESTINATION_PATH")) cfg->destination_path = v;
    if (const char* v = getenv("TMP_TRANSFER_DIR")) cfg->tmp_transfer_dir = v;
    if (const char* v = getenv("HOME_ROOT")) cfg->home_root = v;
    if (const char* v = getenv("MARKER_FILE")) cfg->marker_file = v;
    if (const char* v = getenv("STATUS_FILE")) cfg->status_file = v;
    if (const char* v = getenv("RSYNC_PATH")) cfg->rsync_path = v;
    if (const char* v = getenv("LOG_LEVEL")) cfg->log_level = v;
    if (const char* v = getenv("RUN_AS_USER")) cfg->run_as_user = v;

    auto safe_stoull = [](const char* v, uint64_t default_val) -> uint64_t {
        if (!v) return default_val;
        try { return std::stoull(v); } catch (const std::exception&) { return default_val; }
    };

    auto safe_stoi = [](const char* v, int default_val) -> int {
        if (!v) return default_val;
        try { return std::stoi(v); } catch (const std::exception&) { return default_val; }
    };

    auto safe_stod = [](const char* v, double default_val) -> double {
        if (!v) return default_val;
        try { return std::stod(v); } catch (const std::exception&) { return default_val; }
    };

    auto parse_bool = [](const char* v, bool default_val) -> bool {
        if (!v) return default_val;
        return strcmp(v, "0") != 0 && strcmp(v, "false") != 0 && strcmp(v, "no") != 0;
    };

    cfg->service_timer_ms = safe_stoi(getenv("SERVICE_TIMER_MS"), cfg->service_timer_ms);
    cfg->max_cpu_usage = safe_stod(getenv("MAX_CPU_USAGE"), cfg->max_cpu_usage);
    cfg->cpu_probation = safe_stoi(getenv("CPU_PROBATION"), cfg->cpu_probation);
    cfg->cpu_interval_ms = safe_stoi(getenv("CPU_INTERVAL_MS"), cfg->cpu_interval_ms);
    cfg->max_disk_queue = safe_stod(getenv("MAX_DISK_QUEUE"), cfg->max_disk_queue);
    cfg->disk_probation = safe_stoi(getenv("DISK_PROBATION"), cfg->disk_probation);
    cfg->disk_interval_ms = safe_stoi(getenv("DISK_INTERVAL_MS"), cfg->disk_interval_ms);
    cfg->min_available_memory_mb = static_cast<long>(
        safe_stoull(getenv("MIN_AVAILABLE_MEMORY_MB"), cfg->min_available_memory_mb));
    cfg->grace_period_days = safe_stoi(getenv("GRACE_PERIOD_DAYS"), cfg->grace_period_days);
    cfg->storage_update_sec = safe_stoi(getenv("STORAGE_UPDATE_SEC"), cfg->storage_update_sec);
    cfg->cooldown_cycles = safe_stoi(getenv("COOLDOWN_CYCLES"), cfg->cooldown_cycles);
    cfg->storage_notification_min = safe_stoi(getenv("STORAGE_NOTIFICATION_MIN"), cfg->storage_notification_min);
    cfg->admin_notification_min = safe_stoi(getenv("ADMIN_NOTIFICATION_MIN"), cfg->admin_notification_min);
    cfg->grace_notification_min = safe_stoi(getenv("GRACE_NOTIFICATION_MIN"), cfg->grace_notification_min);
    cfg->max_copy_retries = safe_stoi(getenv("MAX_COPY_RETRIES"), cfg->max_copy_retries);
    cfg->bandwidth_limit_kbps = safe_stoull(getenv("BANDWIDTH_LIMIT_KBPS"), cfg->bandwidth_limit_kbps);

    cfg->monitor_start_high = parse_bool(getenv("MONITOR_START_HIGH"), cfg->monitor_start_high);
    cfg->ignore_limits_without_session =
        parse_bool(getenv("IGNORE_LIMITS_WITHOUT_SESSION"), cfg->ignore_limits_without_session);
    cfg->use_syslog = parse_bool(getenv("USE_SYSLOG"), cfg->use_syslog);
    cfg->daemonize = parse_bool(getenv("DAEMONIZE"), cfg->daemonize);

    if (const char* v = getenv("BLACKLISTED_PROCESSES")) {
        cfg->blacklisted_processes = khepri_split(v, ',');
    }

    if (const char* v = getenv("SPACE_MONITORING")) {
        if (!khepri_parse_drive_list(v, cfg->space_monitoring)) {
            KHEPRI_LOG_ERROR("config", "Configuration error: invalid SPACE_MONITORING");
            return nullptr;
        }
    }

    // Validation
    if (cfg->incoming_path.empty() || cfg->managed_path.empty() || cfg->destination_path.empty()) {
        KHEPRI_LOG_ERROR("config", "Configuration error: paths cannot be empty");
        return nullptr;
    }

    if (cfg->incoming_path[0] != '/' || cfg->managed_path[0] != '/' ||
        cfg->destination_path[0] != '/' || cfg->status_file.empty() || cfg->status_file[0] != '/') {
        KHEPRI_LOG_ERROR("config", "Configuration error: paths must be absolute");
        return nullptr;
    }

    if (cfg->tmp_transfer_dir.empty() || cfg->tmp_transfer_dir.find('/') != std::string::npos) {
        KHEPRI_LOG_ERROR("config", "Configuration error: TMP_TRANSFER_DIR must be a plain directory name");
        return nullptr;
    }

    if (cfg->marker_file.find('/') != std::string::npos) {
        KHEPRI_LOG_ERROR("config", "Configuration error: MARKER_FILE must be a plain file name");
        return nullptr;
    }

    if (cfg->service_timer_ms < constants::MIN_SERVICE_TIMER_MS) {
        KHEPRI_LOG_ERROR("config", "Configuration error: SERVICE_TIMER_MS must be at least %d",
                         constants::MIN_SERVICE_TIMER_MS);
        return nullptr;
    }

    if (!khepri_set_log_level(cfg->log_level)) {
        KHEPRI_LOG_WARN("config", "Unknown LOG_LEVEL '%s', using info", cfg->log_level.c_str());
        cfg->log_level = "info";
        khepri_set_log_level(cfg->log_level);
    }

    // Clamping
    cfg->cpu_probation = std::max(1, cfg->cpu_probation);
    cfg->disk_probation = std::max(1, cfg->disk_probation);
    cfg->cpu_interval_ms = std::clamp(cfg->cpu_interval_ms, 50, 60000);
    cfg->disk_interval_ms = std::clamp(cfg->disk_interval_ms, 50, 60000);
    cfg->max_cpu_usage = std::clamp(cfg->max_cpu_usage, 0.0, 100.0);
    if (cfg->max_disk_queue < 0) cfg->max_disk_queue = 0;
    if (cfg->min_available_memory_mb < 0) cfg->min_available_memory_mb = 0;
    if (cfg->grace_period_days < 1) cfg->grace_period_days = 1;
    if (cfg->storage_update_sec < 1) cfg->storage_update_sec = 1;
    if (cfg->cooldown_cycles < 0) cfg->cooldown_cycles = 0;
    if (cfg->storage_notification_min < 1) cfg->storage_notification_min = 1;
    if (cfg->admin_notification_min < 1) cfg->admin_notification_min = 1;
    if (cfg->grace_notification_min < 1) cfg->grace_notification_min = 1;
    cfg->max_copy_retries = std::clamp(cfg->max_copy_retries, 1, 1000);

    return cfg;
}

bool khepri_check_config_paths(const Config& cfg) noexcept {
    if (!khepri_is_directory(cfg.destination_path)) {
        KHEPRI_LOG_ERROR("config", "Destination %s is not reachable", cfg.destination_path.c_str());
        return false;
    }

    std::string tmp = cfg.tmp_transfer_path();
    if (!khepri_is_directory(tmp)) {
        KHEPRI_LOG_ERROR("config", "Temporary transfer directory %s does not exist", tmp.c_str());
        return false;
    }

    for (const auto& d : cfg.space_monitoring) {
        if (!khepri_is_directory(d.path)) {
            KHEPRI_LOG_ERROR("config", "Monitored drive %s does not exist", d.path.c_str());
            return false;
        }
    }

    if (!cfg.home_root.empty() && !khepri_is_directory(cfg.home_root)) {
        KHEPRI_LOG_WARN("config", "Home root %s missing, no incoming directories will be provisioned",
                        cfg.home_root.c_str());
    }

    // Spool moves are plain renames and cannot cross filesystems.
    struct stat in_st{}, managed_st{};
    if (stat(cfg.incoming_path.c_str(), &in_st) == 0 &&
        stat(cfg.managed_path.c_str(), &managed_st) == 0 &&
        in_st.st_dev != managed_st.st_dev) {
        KHEPRI_LOG_ERROR("config", "Incoming %s and managed %s are on different filesystems",
                         cfg.incoming_path.c_str(), cfg.managed_path.c_str());
        return false;
    }

    return true;
}
