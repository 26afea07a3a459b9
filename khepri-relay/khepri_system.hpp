#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: host probes used by admission control and storage checks
// -----------------------------------------------------------------------------

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class HostProbe {
public:
    virtual ~HostProbe() = default;

    // Percentage of non-idle CPU time since the previous call.
    virtual std::optional<double> cpu_usage_percent() = 0;

    // Average number of queued requests on physical disks since the previous call.
    virtual std::optional<double> disk_queue_length() = 0;

    // MemAvailable in MB, -1 when unknown.
    virtual long available_memory_mb() = 0;

    // Name of the first running process found in names, empty when none.
    virtual std::string running_blacklisted(const std::vector<std::string>& names) = 0;

    virtual bool user_session_active() = 0;

    virtual bool free_bytes(const std::string& path, uint64_t& out) = 0;

    virtual std::vector<std::string> local_users(const std::string& home_root) = 0;
};

class LinuxHostProbe : public HostProbe {
public:
    std::optional<double> cpu_usage_percent() override;
    std::optional<double> disk_queue_length() override;
    long available_memory_mb() override;
    std::string running_blacklisted(const std::vector<std::string>& names) override;
    bool user_session_active() override;
    bool free_bytes(const std::string& path, uint64_t& out) override;
    std::vector<std::string> local_users(const std::string& home_root) override;

    // Parsers over the procfs text formats.
    static bool parse_cpu_line(const std::string& line, uint64_t& busy, uint64_t& total);
    static bool parse_diskstats_line(const std::string& line, std::string& device, uint64_t& weighted_ms);
    static long parse_meminfo_available(const std::string& text);

private:
    std::mutex cpu_mtx_;
    bool cpu_primed_ = false;
    uint64_t prev_busy_ = 0;
    uint64_t prev_total_ = 0;

    std::mutex disk_mtx_;
    bool disk_primed_ = false;
    uint64_t prev_weighted_ms_ = 0;
    uint64_t prev_disk_wall_ms_ = 0;
};
