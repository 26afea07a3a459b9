#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: transfer orchestrator (state machine, admission, recovery)
// -----------------------------------------------------------------------------

#include "khepri_config.hpp"
#include "khepri_copy.hpp"
#include "khepri_monitor.hpp"
#include "khepri_notify.hpp"
#include "khepri_spool.hpp"
#include "khepri_status.hpp"
#include "khepri_storage.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

class HostProbe;

enum class TransferState { Stopped, Active, Paused, DoNothing };

const char* khepri_state_name(TransferState state) noexcept;

// Thrown out of a tick for conditions the next tick may recover from.
class KhepriTransientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// min(initial * 10^failures, 12h)
std::chrono::milliseconds khepri_backoff_interval(std::chrono::milliseconds initial, int failures) noexcept;

class KhepriOrchestrator {
public:
    KhepriOrchestrator(std::shared_ptr<const Config> cfg, StatusStore& status,
                       HostProbe& probe, CopyEngine& engine);
    ~KhepriOrchestrator();

    KhepriOrchestrator(const KhepriOrchestrator&) = delete;
    KhepriOrchestrator& operator=(const KhepriOrchestrator&) = delete;

    // Spool layout, destination checks, status load and the first storage
    // scan. False means the service must not start.
    bool initialize();

    // Starts the load monitors and the loop thread.
    void start();

    // Enters DoNothing, stops the copy and records a clean shutdown.
    void stop();

    // Queues new tunables; applied by the loop between ticks.
    void reload(std::shared_ptr<const Config> cfg);

    // Drains queued events. Returns how many were handled.
    size_t process_events();

    // One guarded tick: failures are logged and stretch the interval.
    bool tick();

    // The tick body. Throws KhepriTransientError.
    void run_tick();

    TransferState state() const noexcept { return state_.load(std::memory_order_acquire); }
    std::chrono::milliseconds current_interval() const noexcept { return interval_; }
    int consecutive_failures() const noexcept { return tick_failures_; }
    int cooldown() const noexcept { return cooldown_; }
    bool limits_exceeded() const noexcept { return cpu_high_ || disk_high_; }

    std::shared_ptr<const Config> config() const { return cfg_; }
    SpoolQueue& spool() noexcept { return spool_; }
    StorageStatus& storage() noexcept { return storage_; }
    Notifier& notifier() noexcept { return notifier_; }
    LoadMonitor& cpu_monitor() noexcept { return cpu_monitor_; }
    LoadMonitor& disk_monitor() noexcept { return disk_monitor_; }

private:
    enum class EventType { LoadHigh, LoadLow, FileStarted, Progress, Completed, Reload };

    struct Event {
        EventType type;
        std::string name;
        uint64_t size = 0;
        double value = 0;
        CopyResult result;
        std::shared_ptr<const Config> cfg;
    };

    void post(Event ev);
    void handle(const Event& ev);
    void loop();

    void on_load_change(const std::string& name, bool high, double load);
    void on_file_started(const std::string& name, uint64_t size);
    void on_progress(double percent);
    void on_completed(const CopyResult& result);
    void apply_reload(std::shared_ptr<const Config> cfg);

    void handle_copy_failure(const Config& cfg);
    void give_up_transfer(const Config& cfg);
    void check_storage(bool force);
    bool apply_admission(const Config& cfg, bool& resumed);
    void scan_incoming(const Config& cfg);
    void refresh_incoming_dirs(const Config& cfg);
    void finalize_transfer(const Config& cfg);
    bool resume_interrupted(const Config& cfg);
    void dispatch_next(const Config& cfg);
    void start_transfer(const Config& cfg, const std::string& source, bool resumed);

    std::shared_ptr<const Config> cfg_;
    StatusStore& status_;
    HostProbe& probe_;
    CopyEngine& engine_;

    SpoolQueue spool_;
    StorageStatus storage_;
    Notifier notifier_;
    LoadMonitor cpu_monitor_;
    LoadMonitor disk_monitor_;

    std::atomic<TransferState> state_{TransferState::Stopped};
    bool cpu_high_ = false;
    bool disk_high_ = false;
    int cooldown_ = 0;

    std::chrono::milliseconds interval_;
    int tick_failures_ = 0;

    bool copy_failed_ = false;
    int copy_failures_ = 0;

    uint64_t current_file_size_ = 0;
    bool have_current_file_ = false;
    int last_file_percent_ = -1;
    int last_logged_step_ = -1;

    bool users_checked_ = false;
    std::chrono::steady_clock::time_point last_user_check_{};

    std::mutex events_mtx_;
    std::condition_variable events_cv_;
    std::deque<Event> events_;

    std::thread loop_thread_;
    std::atomic<bool> running_{false};
    bool initialized_ = false;
    std::atomic<bool> stopped_{false};
};
