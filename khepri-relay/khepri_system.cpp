#include "khepri_system.hpp"
#include "khepri_common.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/statvfs.h>
#include <utmpx.h>

namespace {

std::string khepri_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

uint64_t khepri_monotonic_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

}

// -----------------------------------------------------------------------------
// Khepri Relay: CPU utilization from /proc/stat
// -----------------------------------------------------------------------------
bool LinuxHostProbe::parse_cpu_line(const std::string& line, uint64_t& busy, uint64_t& total) {
    std::istringstream in(line);
    std::string label;
    in >> label;
    if (label != "cpu") return false;

    uint64_t values[8] = {0};
    int count = 0;
    while (count < 8 && in >> values[count]) ++count;
    if (count < 4) return false;

    total = 0;
    for (int i = 0; i < count; ++i) total += values[i];
    uint64_t idle = values[3] + (count > 4 ? values[4] : 0);
    busy = total - idle;
    return true;
}

std::optional<double> LinuxHostProbe::cpu_usage_percent() {
    std::ifstream in("/proc/stat");
    std::string line;
    if (!in || !std::getline(in, line)) {
        KHEPRI_LOG_WARN("probe", "Cannot read /proc/stat");
        return std::nullopt;
    }

    uint64_t busy = 0, total = 0;
    if (!parse_cpu_line(line, busy, total)) {
        KHEPRI_LOG_WARN("probe", "Unexpected /proc/stat format");
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lk(cpu_mtx_);
    std::optional<double> result;
    if (cpu_primed_ && total > prev_total_) {
        uint64_t d_total = total - prev_total_;
        uint64_t d_busy = busy >= prev_busy_ ? busy - prev_busy_ : 0;
        result = 100.0 * static_cast<double>(d_busy) / static_cast<double>(d_total);
    }
    prev_busy_ = busy;
    prev_total_ = total;
    cpu_primed_ = true;
    return result;
}

// -----------------------------------------------------------------------------
// Khepri Relay: disk queue depth from /proc/diskstats
// -----------------------------------------------------------------------------
bool LinuxHostProbe::parse_diskstats_line(const std::string& line, std::string& device,
                                          uint64_t& weighted_ms) {
    std::istringstream in(line);
    std::string major, minor;
    if (!(in >> major >> minor >> device)) return false;

    uint64_t field = 0;
    // Ten counters follow the name; the eleventh is the weighted I/O time.
    for (int i = 0; i < 11; ++i) {
        if (!(in >> field)) return false;
    }
    weighted_ms = field;
    return true;
}

std::optional<double> LinuxHostProbe::disk_queue_length() {
    std::ifstream in("/proc/diskstats");
    if (!in) {
        KHEPRI_LOG_WARN("probe", "Cannot read /proc/diskstats");
        return std::nullopt;
    }

    uint64_t weighted_sum = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string device;
        uint64_t weighted_ms = 0;
        if (!parse_diskstats_line(line, device, weighted_ms)) continue;
        if (device.compare(0, 4, "loop") == 0 || device.compare(0, 3, "ram") == 0 ||
            device.compare(0, 4, "zram") == 0) {
            continue;
        }
        // Whole disks only; partitions would be counted twice.
        if (!khepri_path_exists("/sys/block/" + device)) continue;
        weighted_sum += weighted_ms;
    }

    uint64_t now_ms = khepri_monotonic_ms();

    std::lock_guard<std::mutex> lk(disk_mtx_);
    std::optional<double> result;
    if (disk_primed_ && now_ms > prev_disk_wall_ms_) {
        uint64_t d_weighted = weighted_sum >= prev_weighted_ms_ ? weighted_sum - prev_weighted_ms_ : 0;
        result = static_cast<double>(d_weighted) / static_cast<double>(now_ms - prev_disk_wall_ms_);
    }
    prev_weighted_ms_ = weighted_sum;
    prev_disk_wall_ms_ = now_ms;
    disk_primed_ = true;
    return result;
}

// -----------------------------------------------------------------------------
// Khepri Relay: memory, processes and sessions
// -----------------------------------------------------------------------------
long LinuxHostProbe::parse_meminfo_available(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, 13, "MemAvailable:") != 0) continue;
        std::istringstream fields(line.substr(13));
        long kb = -1;
        if (!(fields >> kb)) return -1;
        return kb / 1024;
    }
    return -1;
}

long LinuxHostProbe::available_memory_mb() {
    std::ifstream in("/proc/meminfo");
    if (!in) {
        KHEPRI_LOG_WARN("probe", "Cannot read /proc/meminfo");
        return -1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_meminfo_available(buffer.str());
}

std::string LinuxHostProbe::running_blacklisted(const std::vector<std::string>& names) {
    if (names.empty()) return std::string();

    std::vector<std::string> wanted;
    wanted.reserve(names.size());
    for (const auto& n : names) wanted.push_back(khepri_lower(n));

    for (const auto& entry : khepri_list_dir("/proc", EntryKind::Directory)) {
        if (entry.empty() || !std::all_of(entry.begin(), entry.end(),
                                             [](unsigned char c) { return std::isdigit(c) != 0; })) continue;

        std::ifstream comm("/proc/" + entry + "/comm");
        std::string name;
        if (!comm || !std::getline(comm, name)) continue;
        name = khepri_lower(khepri_trim(name));

        auto it = std::find(wanted.begin(), wanted.end(), name);
        if (it != wanted.end()) {
            return names[static_cast<size_t>(it - wanted.begin())];
        }
    }
    return std::string();
}

bool LinuxHostProbe::user_session_active() {
    bool active = false;
    setutxent();
    struct utmpx* ut;
    while ((ut = getutxent()) != nullptr) {
        if (ut->ut_type != USER_PROCESS || ut->ut_user[0] == '\0') continue;
        // utmp can hold stale records of sessions that died without logout.
        if (ut->ut_pid > 0 && kill(ut->ut_pid, 0) != 0 && errno == ESRCH) continue;
        active = true;
        break;
    }
    endutxent();
    return active;
}

bool LinuxHostProbe::free_bytes(const std::string& path, uint64_t& out) {
    struct statvfs sv{};
    if (statvfs(path.c_str(), &sv) != 0) {
        KHEPRI_LOG_WARN("probe", "statvfs failed for %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    out = static_cast<uint64_t>(sv.f_bavail) * sv.f_frsize;
    return true;
}

std::vector<std::string> LinuxHostProbe::local_users(const std::string& home_root) {
    if (home_root.empty() || !khepri_is_directory(home_root)) return {};
    return khepri_list_dir(home_root, EntryKind::Directory);
}
