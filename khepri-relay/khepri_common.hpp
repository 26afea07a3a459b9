#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: shared primitives (logging, fd ownership, filesystem, time)
// -----------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <unistd.h>
#include <sys/types.h>

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

namespace constants {
    constexpr int WINDOW_SLOTS = 4;
    constexpr int DEFAULT_COOLDOWN_CYCLES = 2;
    constexpr int MIN_SERVICE_TIMER_MS = 1000;
    constexpr std::chrono::hours MAX_BACKOFF_INTERVAL(12);
    constexpr int BACKOFF_FACTOR = 10;
    constexpr std::chrono::seconds INCOMING_REFRESH_INTERVAL(120);
    constexpr std::chrono::seconds DEFAULT_STORAGE_UPDATE(20);
    constexpr std::chrono::seconds COPY_STOP_GRACE(5);
    constexpr size_t TIMESTAMP_LENGTH = 20;
    constexpr size_t MAX_DIRECTORY_DEPTH = 100;
    constexpr const char* ORPHANED_DIR = "orphaned";
    constexpr const char* STAGE_PROCESSING = "PROCESSING";
    constexpr const char* STAGE_DONE = "DONE";
    constexpr const char* STAGE_UNMATCHED = "UNMATCHED";
    constexpr const char* STAGE_ERROR = "ERROR";
}

// -----------------------------------------------------------------------------
// Khepri Relay: unified logging with daemon support
// -----------------------------------------------------------------------------
void khepri_log_init(const char* ident, bool use_syslog) noexcept;
void khepri_log_close() noexcept;
void khepri_set_daemon_mode(bool daemon) noexcept;
bool khepri_set_log_level(const std::string& level) noexcept;
void khepri_log_output(const char* module, const char* level, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#define KHEPRI_LOG_INFO(module, ...)   khepri_log_output(module, "INFO",  __VA_ARGS__)
#define KHEPRI_LOG_ERROR(module, ...)  khepri_log_output(module, "ERROR", __VA_ARGS__)
#define KHEPRI_LOG_WARN(module, ...)   khepri_log_output(module, "WARN",  __VA_ARGS__)
#define KHEPRI_LOG_DEBUG(module, ...)  khepri_log_output(module, "DEBUG", __VA_ARGS__)

// Worker threads leave SIGINT/SIGTERM/SIGHUP/SIGUSR1 to the main thread.
void khepri_block_signals_in_worker_threads() noexcept;

// -----------------------------------------------------------------------------
// Khepri Relay: RAII wrapper for file descriptors
// -----------------------------------------------------------------------------
class unique_fd {
    int fd_ = -1;
public:
    explicit unique_fd(int fd = -1) noexcept : fd_(fd) {}
    ~unique_fd() { if (fd_ >= 0) ::close(fd_); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    unique_fd& operator=(unique_fd&& o) noexcept {
        if (this != &o) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    int get() const noexcept { return fd_; }
    int release() noexcept { int t = fd_; fd_ = -1; return t; }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

// -----------------------------------------------------------------------------
// Khepri Relay: process-wide counters
// -----------------------------------------------------------------------------
struct Metrics {
    std::atomic<uint64_t> ticks{0};
    std::atomic<uint64_t> tick_failures{0};
    std::atomic<uint64_t> batches_promoted{0};
    std::atomic<uint64_t> batches_unmatched{0};
    std::atomic<uint64_t> batches_failed{0};
    std::atomic<uint64_t> transfers_started{0};
    std::atomic<uint64_t> transfers_resumed{0};
    std::atomic<uint64_t> transfers_completed{0};
    std::atomic<uint64_t> transfers_failed{0};
    std::atomic<uint64_t> pauses{0};
    std::atomic<uint64_t> resumes{0};
    std::atomic<uint64_t> files_transferred{0};
    std::atomic<uint64_t> bytes_transferred{0};
    std::atomic<uint64_t> notifications_sent{0};
    std::atomic<uint64_t> notifications_suppressed{0};
};

extern Metrics khepri_metrics;

int khepri_get_metrics(char* buf, size_t sz) noexcept;

// -----------------------------------------------------------------------------
// Khepri Relay: filesystem helpers
// -----------------------------------------------------------------------------
enum class EntryKind { Any, Directory, File };

int khepri_mkdir_p_safe(const std::string& path, mode_t mode = 0755) noexcept;
bool khepri_is_directory(const std::string& path) noexcept;
bool khepri_path_exists(const std::string& path) noexcept;
std::string khepri_join(const std::string& dir, const std::string& name);
std::string khepri_basename(const std::string& path);
std::string khepri_dirname(const std::string& path);

// Sorted entry names, "." and ".." excluded. Symlinks count as files.
std::vector<std::string> khepri_list_dir(const std::string& path, EntryKind kind);

// Recursive byte size, symlinks not followed.
uint64_t khepri_dir_size(const std::string& path) noexcept;

// Regular files anywhere below path, relative names.
std::vector<std::string> khepri_files_in_tree(const std::string& path);

bool khepri_rename_noreplace(const std::string& src, const std::string& dst) noexcept;

// Moves src to dst, appending "_<timestamp>" (and a counter) when dst is
// taken. Returns the final path, or an empty string on failure.
std::string khepri_move_collision_safe(const std::string& src, const std::string& dst);

// Moves every entry of src_dir except skip_name into dst_dir (created when
// missing), collision rule applied per entry.
bool khepri_move_entries(const std::string& src_dir, const std::string& dst_dir,
                         const std::string& skip_name = std::string());

bool khepri_remove_empty_dir(const std::string& path) noexcept;

int khepri_fsync_dir(const char* path) noexcept;

// -----------------------------------------------------------------------------
// Khepri Relay: timestamps in directory names
// -----------------------------------------------------------------------------
namespace date_utils {
    bool is_leap_year(int year) noexcept;
    int days_in_month(int year, int month) noexcept;
}

// "yyyy-MM-dd__HH-mm-ss" in local time.
std::string khepri_timestamp(time_t t = time(nullptr));

// Strict parser. A collision suffix starting with '_' after the timestamp is
// accepted, anything else makes the name invalid.
bool khepri_parse_timestamp(const std::string& name, std::tm& out) noexcept;

// Whole days between the name and the reference (both naive local time).
// Returns -1 for names that do not parse; future names give 0.
int khepri_dir_name_to_age(const std::string& name, const std::tm& reference) noexcept;
int khepri_dir_name_to_age(const std::string& name, time_t reference) noexcept;

std::string khepri_bytes_to_human(uint64_t bytes);
std::string khepri_seconds_to_human(long seconds);

std::string khepri_trim(const std::string& s);
std::vector<std::string> khepri_split(const std::string& s, char sep);
