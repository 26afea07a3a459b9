#include "khepri_common.hpp"

#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <stack>
#include <utility>
#include <dirent.h>
#include <fcntl.h>
#include <pthread.h>
#include <syslog.h>
#include <sys/stat.h>
#include <sys/syscall.h>

#if defined(__linux__)
#include <linux/fs.h>
#define HAS_RENAMEAT2 1
#else
#define HAS_RENAMEAT2 0
#endif

#ifndef RENAME_NOREPLACE
#define RENAME_NOREPLACE (1 << 0)
#endif

Metrics khepri_metrics;

// -----------------------------------------------------------------------------
// Khepri Relay: unified logging with daemon support
// -----------------------------------------------------------------------------
static std::mutex g_log_mutex;
static std::atomic<bool> g_is_daemon{false};
static std::atomic<bool> g_use_syslog{false};
static std::atomic<int> g_log_threshold{LOG_INFO};

static int khepri_level_to_syslog(const char* level) noexcept {
    if (strcmp(level, "ERROR") == 0) return LOG_ERR;
    if (strcmp(level, "WARN") == 0) return LOG_WARNING;
    if (strcmp(level, "INFO") == 0) return LOG_INFO;
    return LOG_DEBUG;
}

void khepri_log_init(const char* ident, bool use_syslog) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (use_syslog) {
        openlog(ident, LOG_PID | LOG_NDELAY, LOG_DAEMON);
    }
    g_use_syslog.store(use_syslog, std::memory_order_relaxed);
}

void khepri_log_close() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_use_syslog.exchange(false)) {
        closelog();
    }
}

void khepri_set_daemon_mode(bool daemon) noexcept {
    g_is_daemon.store(daemon, std::memory_order_relaxed);
}

bool khepri_set_log_level(const std::string& level) noexcept {
    int threshold;
    if (level == "error") threshold = LOG_ERR;
    else if (level == "warn" || level == "warning") threshold = LOG_WARNING;
    else if (level == "info") threshold = LOG_INFO;
    else if (level == "debug") threshold = LOG_DEBUG;
    else return false;
    g_log_threshold.store(threshold, std::memory_order_relaxed);
    return true;
}

void khepri_log_output(const char* module, const char* level, const char* fmt, ...) {
    int syslog_level = khepri_level_to_syslog(level);
    if (syslog_level > g_log_threshold.load(std::memory_order_relaxed)) return;

    std::lock_guard<std::mutex> lock(g_log_mutex);

    char buffer[2048];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (len <= 0) return;

    if (g_use_syslog.load(std::memory_order_relaxed)) {
        syslog(syslog_level, "[%s] [%s] %s", level, module, buffer);
    }

    if (!g_is_daemon.load(std::memory_order_relaxed)) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        struct tm tm_time{};
        localtime_r(&t, &tm_time);

        char timestamp[32];
        strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_time);

        fprintf(stderr, "[%s][%s][%s] %s\n", level, timestamp, module, buffer);
        fflush(stderr);
    }
}

// -----------------------------------------------------------------------------
// Khepri Relay: metrics export
// -----------------------------------------------------------------------------
void khepri_block_signals_in_worker_threads() noexcept {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGUSR1);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

int khepri_get_metrics(char* buf, size_t sz) noexcept {
    int n = snprintf(buf, sz,
        "ticks %" PRIu64 "\n"
        "tick_failures %" PRIu64 "\n"
        "batches_promoted %" PRIu64 "\n"
        "batches_unmatched %" PRIu64 "\n"
        "batches_failed %" PRIu64 "\n"
        "transfers_started %" PRIu64 "\n"
        "transfers_resumed %" PRIu64 "\n"
        "transfers_completed %" PRIu64 "\n"
        "transfers_failed %" PRIu64 "\n"
        "pauses %" PRIu64 "\n"
        "resumes %" PRIu64 "\n"
        "files_transferred %" PRIu64 "\n"
        "bytes_transferred %" PRIu64 "\n"
        "notifications_sent %" PRIu64 "\n"
        "notifications_suppressed %" PRIu64 "\n",
        khepri_metrics.ticks.load(),
        khepri_metrics.tick_failures.load(),
        khepri_metrics.batches_promoted.load(),
        khepri_metrics.batches_unmatched.load(),
        khepri_metrics.batches_failed.load(),
        khepri_metrics.transfers_started.load(),
        khepri_metrics.transfers_resumed.load(),
        khepri_metrics.transfers_completed.load(),
        khepri_metrics.transfers_failed.load(),
        khepri_metrics.pauses.load(),
        khepri_metrics.resumes.load(),
        khepri_metrics.files_transferred.load(),
        khepri_metrics.bytes_transferred.load(),
        khepri_metrics.notifications_sent.load(),
        khepri_metrics.notifications_suppressed.load());

    return (n < 0 || static_cast<size_t>(n) >= sz) ? -1 : n;
}

// -----------------------------------------------------------------------------
// Khepri Relay: directory creation and inspection
// -----------------------------------------------------------------------------
int khepri_mkdir_p_safe(const std::string& path, mode_t mode) noexcept {
    if (path.empty() || path == "/" || path == ".") {
        errno = EINVAL;
        return -1;
    }

    if (path.length() >= PATH_MAX - 100 || path.find("/../") != std::string::npos) {
        errno = EINVAL;
        return -1;
    }

    std::string current;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '/' && i > 0) {
            current = path.substr(0, i);
            struct stat st;
            if (stat(current.c_str(), &st) == 0) {
                if (!S_ISDIR(st.st_mode)) {
                    errno = ENOTDIR;
                    return -1;
                }
            } else if (errno == ENOENT) {
                if (mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
                    return -1;
                }
            } else {
                return -1;
            }
        }
    }

    if (mkdir(path.c_str(), mode) != 0) {
        if (errno != EEXIST || !khepri_is_directory(path)) {
            return -1;
        }
    }

    return 0;
}

bool khepri_is_directory(const std::string& path) noexcept {
    struct stat st{};
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool khepri_path_exists(const std::string& path) noexcept {
    struct stat st{};
    return lstat(path.c_str(), &st) == 0;
}

std::string khepri_join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string khepri_basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string khepri_dirname(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

std::vector<std::string> khepri_list_dir(const std::string& path, EntryKind kind) {
    std::vector<std::string> names;

    unique_fd dir_fd(open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dir_fd) {
        KHEPRI_LOG_WARN("fs", "Failed to open directory %s: %s", path.c_str(), strerror(errno));
        return names;
    }

    DIR* dir = fdopendir(dir_fd.get());
    if (!dir) {
        KHEPRI_LOG_WARN("fs", "fdopendir failed for %s: %s", path.c_str(), strerror(errno));
        return names;
    }
    dir_fd.release();

    struct dirent* de;
    while ((de = readdir(dir)) != nullptr) {
        if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0) continue;

        if (kind != EntryKind::Any) {
            struct stat st{};
            if (fstatat(dirfd(dir), de->d_name, &st, AT_SYMLINK_NOFOLLOW) != 0) {
                KHEPRI_LOG_WARN("fs", "fstatat failed for %s/%s: %s",
                                path.c_str(), de->d_name, strerror(errno));
                continue;
            }
            bool is_dir = S_ISDIR(st.st_mode);
            if (kind == EntryKind::Directory && !is_dir) continue;
            if (kind == EntryKind::File && is_dir) continue;
        }

        names.emplace_back(de->d_name);
    }

    closedir(dir);
    std::sort(names.begin(), names.end());
    return names;
}

uint64_t khepri_dir_size(const std::string& path) noexcept {
    uint64_t total = 0;
    try {
        std::stack<std::pair<std::string, size_t>> pending;
        pending.emplace(path, 0);

        while (!pending.empty()) {
            auto [dir, depth] = pending.top();
            pending.pop();

            if (depth > constants::MAX_DIRECTORY_DEPTH) {
                KHEPRI_LOG_WARN("fs", "Directory nesting too deep, not descending: %s", dir.c_str());
                continue;
            }

            for (const auto& name : khepri_list_dir(dir, EntryKind::Any)) {
                std::string full = khepri_join(dir, name);
                struct stat st{};
                if (lstat(full.c_str(), &st) != 0) continue;
                if (S_ISDIR(st.st_mode)) {
                    pending.emplace(full, depth + 1);
                } else if (S_ISREG(st.st_mode)) {
                    total += static_cast<uint64_t>(st.st_size);
                }
            }
        }
    } catch (const std::exception& e) {
        KHEPRI_LOG_ERROR("fs", "Size calculation of %s aborted: %s", path.c_str(), e.what());
    }
    return total;
}

std::vector<std::string> khepri_files_in_tree(const std::string& path) {
    std::vector<std::string> files;
    std::stack<std::pair<std::string, size_t>> pending;
    pending.emplace(std::string(), 0);

    while (!pending.empty()) {
        auto [rel, depth] = pending.top();
        pending.pop();
        if (depth > constants::MAX_DIRECTORY_DEPTH) continue;

        std::string dir = rel.empty() ? path : khepri_join(path, rel);
        for (const auto& name : khepri_list_dir(dir, EntryKind::Any)) {
            std::string child = rel.empty() ? name : khepri_join(rel, name);
            struct stat st{};
            if (lstat(khepri_join(dir, name).c_str(), &st) != 0) continue;
            if (S_ISDIR(st.st_mode)) {
                pending.emplace(child, depth + 1);
            } else {
                files.push_back(child);
            }
        }
    }
    return files;
}

// -----------------------------------------------------------------------------
// Khepri Relay: non-overwriting renames
// -----------------------------------------------------------------------------
bool khepri_rename_noreplace(const std::string& src, const std::string& dst) noexcept {
#if HAS_RENAMEAT2 && defined(SYS_renameat2)
    if (syscall(SYS_renameat2, AT_FDCWD, src.c_str(),
                AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) == 0) {
        return true;
    }

    if (errno != ENOSYS && errno != EINVAL) {
        return false;
    }
#endif
    // Filesystem without RENAME_NOREPLACE: check then rename.
    if (khepri_path_exists(dst)) {
        errno = EEXIST;
        return false;
    }
    return rename(src.c_str(), dst.c_str()) == 0;
}

std::string khepri_move_collision_safe(const std::string& src, const std::string& dst) {
    std::string target = dst;
    if (khepri_path_exists(target)) {
        target = dst + "_" + khepri_timestamp();
    }

    for (int attempt = 0; attempt < 100; ++attempt) {
        if (attempt > 0) {
            target = dst + "_" + khepri_timestamp() + "-" + std::to_string(attempt);
        }
        if (khepri_rename_noreplace(src, target)) {
            if (target != dst) {
                KHEPRI_LOG_INFO("fs", "Target %s exists, moved to %s instead", dst.c_str(), target.c_str());
            }
            KHEPRI_LOG_DEBUG("fs", "Moved %s -> %s", src.c_str(), target.c_str());
            return target;
        }
        if (errno != EEXIST && errno != ENOTEMPTY) {
            KHEPRI_LOG_ERROR("fs", "Move %s -> %s failed: %s", src.c_str(), target.c_str(), strerror(errno));
            return std::string();
        }
    }

    KHEPRI_LOG_ERROR("fs", "No free target name for %s below %s", src.c_str(), dst.c_str());
    return std::string();
}

bool khepri_move_entries(const std::string& src_dir, const std::string& dst_dir,
                         const std::string& skip_name) {
    KHEPRI_LOG_DEBUG("fs", "Moving contents of %s to %s", src_dir.c_str(), dst_dir.c_str());

    if (khepri_mkdir_p_safe(dst_dir) != 0) {
        KHEPRI_LOG_ERROR("fs", "Cannot create %s: %s", dst_dir.c_str(), strerror(errno));
        return false;
    }

    bool ok = true;
    for (const auto& name : khepri_list_dir(src_dir, EntryKind::Any)) {
        if (!skip_name.empty() && name == skip_name) continue;
        if (khepri_move_collision_safe(khepri_join(src_dir, name), khepri_join(dst_dir, name)).empty()) {
            ok = false;
        }
    }

    khepri_fsync_dir(dst_dir.c_str());
    return ok;
}

bool khepri_remove_empty_dir(const std::string& path) noexcept {
    if (rmdir(path.c_str()) == 0) {
        KHEPRI_LOG_DEBUG("fs", "Removed empty directory: %s", path.c_str());
        return true;
    }
    if (errno != ENOTEMPTY && errno != EEXIST && errno != ENOENT) {
        KHEPRI_LOG_WARN("fs", "rmdir failed %s: %s", path.c_str(), strerror(errno));
    }
    return false;
}

int khepri_fsync_dir(const char* path) noexcept {
    unique_fd fd(open(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd) {
        if (errno != ENOENT && errno != EACCES) {
            KHEPRI_LOG_WARN("fs", "open directory failed for fsync %s: %s", path, strerror(errno));
        }
        return -1;
    }

    if (fsync(fd.get()) != 0) {
        KHEPRI_LOG_WARN("fs", "fsync directory failed %s: %s", path, strerror(errno));
        return -1;
    }
    return 0;
}

// -----------------------------------------------------------------------------
// Khepri Relay: timestamp format "yyyy-MM-dd__HH-mm-ss"
// -----------------------------------------------------------------------------
namespace date_utils {
    bool is_leap_year(int year) noexcept {
        return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    int days_in_month(int year, int month) noexcept {
        static const int month_days[] = {31, 28, 31, 30, 31, 30,
                                         31, 31, 30, 31, 30, 31};

        if (month < 1 || month > 12) return 0;

        int days = month_days[month - 1];
        if (month == 2 && is_leap_year(year)) {
            days = 29;
        }
        return days;
    }
}

std::string khepri_timestamp(time_t t) {
    struct tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d__%H-%M-%S", &tm);
    return buf;
}

bool khepri_parse_timestamp(const std::string& name, std::tm& out) noexcept {
    if (name.size() < constants::TIMESTAMP_LENGTH) return false;
    if (name.size() > constants::TIMESTAMP_LENGTH && name[constants::TIMESTAMP_LENGTH] != '_') {
        return false;
    }

    // Fixed layout: digits everywhere except the separator positions.
    static const char layout[] = "dddd-dd-dd__dd-dd-dd";
    for (size_t i = 0; i < constants::TIMESTAMP_LENGTH; ++i) {
        char c = name[i];
        if (layout[i] == 'd') {
            if (c < '0' || c > '9') return false;
        } else if (c != layout[i]) {
            return false;
        }
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (sscanf(name.c_str(), "%4d-%2d-%2d__%2d-%2d-%2d",
               &year, &month, &day, &hour, &minute, &second) != 6) {
        return false;
    }

    if (year < 1970 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > date_utils::days_in_month(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 59) return false;

    out = std::tm{};
    out.tm_year = year - 1900;
    out.tm_mon = month - 1;
    out.tm_mday = day;
    out.tm_hour = hour;
    out.tm_min = minute;
    out.tm_sec = second;
    out.tm_isdst = -1;
    return true;
}

int khepri_dir_name_to_age(const std::string& name, const std::tm& reference) noexcept {
    std::tm parsed{};
    if (!khepri_parse_timestamp(name, parsed)) {
        KHEPRI_LOG_DEBUG("fs", "Unable to derive age from directory name '%s'", name.c_str());
        return -1;
    }

    // Both sides are naive wall-clock times; timegm keeps DST out of the diff.
    std::tm ref = reference;
    time_t then = timegm(&parsed);
    time_t now = timegm(&ref);
    if (now <= then) return 0;
    return static_cast<int>((now - then) / 86400);
}

int khepri_dir_name_to_age(const std::string& name, time_t reference) noexcept {
    std::tm ref{};
    localtime_r(&reference, &ref);
    return khepri_dir_name_to_age(name, ref);
}

std::string khepri_bytes_to_human(uint64_t bytes) {
    static const char* units[] = {"Bytes", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    char buf[64];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%" PRIu64 " Bytes", bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    }
    return buf;
}

std::string khepri_seconds_to_human(long seconds) {
    if (seconds < 0) seconds = 0;
    long days = seconds / 86400;
    long hours = (seconds % 86400) / 3600;
    long minutes = (seconds % 3600) / 60;
    long secs = seconds % 60;

    char buf[64];
    if (days > 0) {
        snprintf(buf, sizeof(buf), "%ld days %ld hours", days, hours);
    } else if (hours > 0) {
        snprintf(buf, sizeof(buf), "%ld hours %ld minutes", hours, minutes);
    } else if (minutes > 0) {
        snprintf(buf, sizeof(buf), "%ld minutes %ld seconds", minutes, secs);
    } else {
        snprintf(buf, sizeof(buf), "%ld seconds", secs);
    }
    return buf;
}

std::string khepri_trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return std::string();
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> khepri_split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) pos = s.size();
        std::string item = khepri_trim(s.substr(start, pos - start));
        if (!item.empty()) parts.push_back(item);
        start = pos + 1;
    }
    return parts;
}
