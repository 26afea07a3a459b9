#include "khepri_orchestrator.hpp"
#include "khepri_common.hpp"
#include "khepri_system.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <pthread.h>

const char* khepri_state_name(TransferState state) noexcept {
    switch (state) {
    case TransferState::Stopped:   return "stopped";
    case TransferState::Active:    return "active";
    case TransferState::Paused:    return "paused";
    case TransferState::DoNothing: return "do-nothing";
    }
    return "unknown";
}

std::chrono::milliseconds khepri_backoff_interval(std::chrono::milliseconds initial, int failures) noexcept {
    const std::chrono::milliseconds cap = constants::MAX_BACKOFF_INTERVAL;
    std::chrono::milliseconds interval = initial;
    for (int i = 0; i < failures && interval < cap; ++i) {
        interval *= constants::BACKOFF_FACTOR;
    }
    return std::min(interval, cap);
}

static NotifyIntervals khepri_notify_intervals(const Config& cfg) {
    NotifyIntervals n;
    n.storage_min = cfg.storage_notification_min;
    n.admin_min = cfg.admin_notification_min;
    n.grace_min = cfg.grace_notification_min;
    return n;
}

static MonitorConfig khepri_cpu_monitor_config(const Config& cfg) {
    MonitorConfig m;
    m.name = "cpu";
    m.interval_ms = cfg.cpu_interval_ms;
    m.limit = cfg.max_cpu_usage;
    m.probation = cfg.cpu_probation;
    m.start_high = cfg.monitor_start_high;
    return m;
}

static MonitorConfig khepri_disk_monitor_config(const Config& cfg) {
    MonitorConfig m;
    m.name = "disk";
    m.interval_ms = cfg.disk_interval_ms;
    m.limit = cfg.max_disk_queue;
    m.probation = cfg.disk_probation;
    m.start_high = cfg.monitor_start_high;
    return m;
}

KhepriOrchestrator::KhepriOrchestrator(std::shared_ptr<const Config> cfg, StatusStore& status,
                                       HostProbe& probe, CopyEngine& engine)
    : cfg_(std::move(cfg)),
      status_(status),
      probe_(probe),
      engine_(engine),
      spool_(cfg_->incoming_path, cfg_->managed_path, cfg_->marker_file),
      storage_(cfg_->done_path(), cfg_->space_monitoring, cfg_->grace_period_days,
               std::chrono::seconds(cfg_->storage_update_sec), probe),
      notifier_(status, khepri_notify_intervals(*cfg_)),
      cpu_monitor_(khepri_cpu_monitor_config(*cfg_), [this] { return probe_.cpu_usage_percent(); }),
      disk_monitor_(khepri_disk_monitor_config(*cfg_), [this] { return probe_.disk_queue_length(); }),
      interval_(cfg_->service_timer_ms) {
    // Monitor threads only enqueue; the flags flip on the loop thread.
    auto high = [this](const std::string& name, double load) {
        Event ev{};
        ev.type = EventType::LoadHigh;
        ev.name = name;
        ev.value = load;
        post(std::move(ev));
    };
    auto low = [this](const std::string& name, double load) {
        Event ev{};
        ev.type = EventType::LoadLow;
        ev.name = name;
        ev.value = load;
        post(std::move(ev));
    };
    cpu_monitor_.on_high(high);
    cpu_monitor_.on_low(low);
    disk_monitor_.on_high(high);
    disk_monitor_.on_low(low);

    engine_.set_callbacks(
        [this](const std::string& name, uint64_t size) {
            Event ev{};
            ev.type = EventType::FileStarted;
            ev.name = name;
            ev.size = size;
            post(std::move(ev));
        },
        [this](double percent) {
            Event ev{};
            ev.type = EventType::Progress;
            ev.value = percent;
            post(std::move(ev));
        },
        [this](const CopyResult& result) {
            Event ev{};
            ev.type = EventType::Completed;
            ev.result = result;
            post(std::move(ev));
        });
}

KhepriOrchestrator::~KhepriOrchestrator() {
    stop();
    engine_.set_callbacks(nullptr, nullptr, nullptr);
}

// -----------------------------------------------------------------------------
// Khepri Relay: startup and shutdown
// -----------------------------------------------------------------------------
bool KhepriOrchestrator::initialize() {
    const Config& cfg = *cfg_;

    if (!spool_.check_layout()) {
        KHEPRI_LOG_ERROR("orchestrator", "Spool layout under %s / %s is unusable",
                         cfg.incoming_path.c_str(), cfg.managed_path.c_str());
        return false;
    }
    if (!khepri_check_config_paths(cfg)) {
        return false;
    }

    if (!status_.load()) {
        KHEPRI_LOG_INFO("orchestrator", "Starting with a fresh status record");
    }
    status_.validate(cfg.tmp_transfer_path());
    status_.mark_started();
    if (!status_.persisted()) {
        KHEPRI_LOG_ERROR("orchestrator", "Cannot write status file %s", status_.path().c_str());
        return false;
    }
    if (!status_.previous_shutdown_clean()) {
        KHEPRI_LOG_WARN("orchestrator", "Previous run did not shut down cleanly");
    }

    check_storage(true);

    KHEPRI_LOG_INFO("orchestrator", "Status at startup:\n%s", status_.summary().c_str());
    KHEPRI_LOG_INFO("orchestrator", "Free space:\n%s", storage_.free_space_summary().c_str());
    KHEPRI_LOG_DEBUG("orchestrator", "%s", storage_.grace_summary().c_str());

    initialized_ = true;
    return true;
}

void KhepriOrchestrator::start() {
    if (running_.exchange(true)) {
        KHEPRI_LOG_WARN("orchestrator", "Orchestrator already running");
        return;
    }

    cpu_monitor_.start();
    disk_monitor_.start();

    loop_thread_ = std::thread([this] { loop(); });
#if defined(__linux__)
    pthread_setname_np(loop_thread_.native_handle(), "khepri-main");
#endif
    KHEPRI_LOG_INFO("orchestrator", "Orchestrator started (timer %d ms)", cfg_->service_timer_ms);
}

void KhepriOrchestrator::stop() {
    if (stopped_.exchange(true)) return;

    running_.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lk(events_mtx_);
        events_cv_.notify_all();
    }
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    TransferState previous = state_.exchange(TransferState::DoNothing, std::memory_order_acq_rel);
    KHEPRI_LOG_INFO("orchestrator", "Shutting down, transfer state was %s", khepri_state_name(previous));

    engine_.stop();
    cpu_monitor_.stop();
    disk_monitor_.stop();

    if (!initialized_) return;

    if (previous == TransferState::Active || previous == TransferState::Paused) {
        status_.set_transfer_in_progress(true);
        KHEPRI_LOG_INFO("orchestrator", "Interrupted transfer of %s will resume on next start",
                        status_.snapshot().current_transfer_source.c_str());
    }

    status_.set_clean_shutdown(true);
    if (!status_.persisted()) {
        KHEPRI_LOG_ERROR("orchestrator", "Final status save to %s failed", status_.path().c_str());
    }
}

void KhepriOrchestrator::reload(std::shared_ptr<const Config> cfg) {
    Event ev{};
    ev.type = EventType::Reload;
    ev.cfg = std::move(cfg);
    post(std::move(ev));
}

// -----------------------------------------------------------------------------
// Khepri Relay: event queue
// -----------------------------------------------------------------------------
void KhepriOrchestrator::post(Event ev) {
    {
        std::lock_guard<std::mutex> lk(events_mtx_);
        events_.push_back(std::move(ev));
    }
    events_cv_.notify_one();
}

size_t KhepriOrchestrator::process_events() {
    std::deque<Event> pending;
    {
        std::lock_guard<std::mutex> lk(events_mtx_);
        pending.swap(events_);
    }

    for (const auto& ev : pending) {
        handle(ev);
    }
    return pending.size();
}

void KhepriOrchestrator::handle(const Event& ev) {
    switch (ev.type) {
    case EventType::LoadHigh:
        on_load_change(ev.name, true, ev.value);
        break;
    case EventType::LoadLow:
        on_load_change(ev.name, false, ev.value);
        break;
    case EventType::FileStarted:
        on_file_started(ev.name, ev.size);
        break;
    case EventType::Progress:
        on_progress(ev.value);
        break;
    case EventType::Completed:
        on_completed(ev.result);
        break;
    case EventType::Reload:
        apply_reload(ev.cfg);
        break;
    }
}

void KhepriOrchestrator::loop() {
    KHEPRI_LOG_INFO("orchestrator", "Main loop started");
    khepri_block_signals_in_worker_threads();

    auto next_tick = std::chrono::steady_clock::now();

    while (running_.load(std::memory_order_acquire)) {
        process_events();
        if (state() == TransferState::DoNothing) break;

        if (std::chrono::steady_clock::now() >= next_tick) {
            tick();
            next_tick = std::chrono::steady_clock::now() + interval_;
            continue;
        }

        std::unique_lock<std::mutex> lk(events_mtx_);
        events_cv_.wait_until(lk, next_tick, [this] {
            return !running_.load(std::memory_order_acquire) || !events_.empty();
        });
    }

    KHEPRI_LOG_INFO("orchestrator", "Main loop stopped");
}

// -----------------------------------------------------------------------------
// Khepri Relay: asynchronous notifications, handled on the loop thread
// -----------------------------------------------------------------------------
void KhepriOrchestrator::on_load_change(const std::string& name, bool high, double load) {
    if (name == "cpu") cpu_high_ = high;
    else if (name == "disk") disk_high_ = high;

    KHEPRI_LOG_DEBUG("orchestrator", "%s load %s (%.2f)", name.c_str(), high ? "high" : "low", load);

    if (state() == TransferState::DoNothing) return;

    bool resumed = false;
    if (apply_admission(*cfg_, resumed)) {
        KHEPRI_LOG_DEBUG("orchestrator", "Service stays suspended after %s load change", name.c_str());
    }
}

void KhepriOrchestrator::on_file_started(const std::string& name, uint64_t size) {
    if (state() == TransferState::DoNothing) return;

    uint64_t finished = have_current_file_ ? current_file_size_ : 0;
    if (have_current_file_) {
        ++khepri_metrics.files_transferred;
        khepri_metrics.bytes_transferred += finished;
    }

    status_.update([&](PersistedStatus& st) {
        st.bytes_completed += finished;
        st.bytes_current_file = 0;
    });

    current_file_size_ = size;
    have_current_file_ = true;
    last_file_percent_ = -1;

    KHEPRI_LOG_DEBUG("orchestrator", "Transferring %s (%s)", name.c_str(), khepri_bytes_to_human(size).c_str());
}

void KhepriOrchestrator::on_progress(double percent) {
    if (state() == TransferState::DoNothing) return;

    int file_percent = static_cast<int>(percent);
    if (file_percent == last_file_percent_) return;
    last_file_percent_ = file_percent;

    int overall = 0;
    status_.update([&](PersistedStatus& st) {
        st.bytes_current_file = static_cast<uint64_t>(current_file_size_ * (percent / 100.0));
        if (st.current_transfer_size > 0) {
            uint64_t done = std::min(st.bytes_completed + st.bytes_current_file, st.current_transfer_size);
            st.percent_complete = static_cast<int>(done * 100 / st.current_transfer_size);
        }
        overall = st.percent_complete;
    });

    int step = overall / 20;
    if (step != last_logged_step_) {
        last_logged_step_ = step;
        KHEPRI_LOG_INFO("orchestrator", "Transfer progress: %d%%", overall);
    }
}

void KhepriOrchestrator::on_completed(const CopyResult& result) {
    if (state() == TransferState::DoNothing) {
        KHEPRI_LOG_DEBUG("orchestrator", "Ignoring copy completion during shutdown");
        return;
    }

    state_.store(TransferState::Stopped, std::memory_order_release);
    std::string source = status_.snapshot().current_transfer_source;

    if (!result.success) {
        copy_failed_ = true;
        ++copy_failures_;
        ++khepri_metrics.transfers_failed;
        KHEPRI_LOG_WARN("orchestrator", "Copy of %s failed (%s), attempt %d of %d",
                        source.c_str(), result.message.c_str(), copy_failures_, cfg_->max_copy_retries);
        return;
    }

    if (have_current_file_) {
        ++khepri_metrics.files_transferred;
        khepri_metrics.bytes_transferred += current_file_size_;
    }
    current_file_size_ = 0;
    have_current_file_ = false;
    last_logged_step_ = -1;

    status_.update([](PersistedStatus& st) {
        st.transfer_in_progress = false;
        st.current_transfer_size = 0;
        st.bytes_completed = 0;
        st.bytes_current_file = 0;
        st.percent_complete = 0;
    });

    copy_failures_ = 0;
    cooldown_ = cfg_->cooldown_cycles;
    ++khepri_metrics.transfers_completed;
    KHEPRI_LOG_INFO("orchestrator", "Copy of %s completed", source.c_str());
}

void KhepriOrchestrator::apply_reload(std::shared_ptr<const Config> cfg) {
    if (!cfg) return;

    // Paths stay as they were at startup.
    auto merged = std::make_shared<Config>(*cfg);
    const Config& old = *cfg_;
    if (merged->incoming_path != old.incoming_path || merged->managed_path != old.managed_path ||
        merged->destination_path != old.destination_path || merged->tmp_transfer_dir != old.tmp_transfer_dir ||
        merged->marker_file != old.marker_file || merged->status_file != old.status_file) {
        KHEPRI_LOG_WARN("orchestrator", "Path settings cannot be changed at runtime, keeping the current ones");
    }
    merged->incoming_path = old.incoming_path;
    merged->managed_path = old.managed_path;
    merged->destination_path = old.destination_path;
    merged->tmp_transfer_dir = old.tmp_transfer_dir;
    merged->home_root = old.home_root;
    merged->marker_file = old.marker_file;
    merged->status_file = old.status_file;

    cpu_monitor_.reconfigure(merged->max_cpu_usage, merged->cpu_probation, merged->cpu_interval_ms);
    disk_monitor_.reconfigure(merged->max_disk_queue, merged->disk_probation, merged->disk_interval_ms);
    storage_.reconfigure(merged->space_monitoring, merged->grace_period_days,
                         std::chrono::seconds(merged->storage_update_sec));
    notifier_.set_intervals(khepri_notify_intervals(*merged));

    if (tick_failures_ == 0) {
        interval_ = std::chrono::milliseconds(merged->service_timer_ms);
    }
    cfg_ = std::move(merged);
    KHEPRI_LOG_INFO("orchestrator", "New settings applied");
}

// -----------------------------------------------------------------------------
// Khepri Relay: the tick
// -----------------------------------------------------------------------------
bool KhepriOrchestrator::tick() {
    if (state() == TransferState::DoNothing) return false;

    const std::chrono::milliseconds nominal(cfg_->service_timer_ms);
    try {
        run_tick();
    } catch (const std::exception& e) {
        ++tick_failures_;
        ++khepri_metrics.tick_failures;
        interval_ = khepri_backoff_interval(nominal, tick_failures_);
        KHEPRI_LOG_ERROR("orchestrator", "Tick failed: %s. Timer interval now %lld ms (%s)",
                         e.what(), static_cast<long long>(interval_.count()),
                         khepri_seconds_to_human(static_cast<long>(interval_.count() / 1000)).c_str());
        return false;
    }

    if (tick_failures_ > 0) {
        KHEPRI_LOG_INFO("orchestrator", "Tick succeeded after %d failures, timer back to %lld ms",
                        tick_failures_, static_cast<long long>(nominal.count()));
    }
    tick_failures_ = 0;
    interval_ = nominal;
    return true;
}

void KhepriOrchestrator::run_tick() {
    std::shared_ptr<const Config> cfg_ptr = cfg_;
    const Config& cfg = *cfg_ptr;

    ++khepri_metrics.ticks;
    status_.set_heartbeat(time(nullptr));

    if (copy_failed_) {
        handle_copy_failure(cfg);
    }

    check_storage(false);

    bool resumed = false;
    if (apply_admission(cfg, resumed)) {
        return;
    }

    scan_incoming(cfg);
    refresh_incoming_dirs(cfg);

    if (resumed || state() != TransferState::Stopped) {
        return;
    }

    finalize_transfer(cfg);
    if (!resume_interrupted(cfg)) {
        dispatch_next(cfg);
    }

    if (cooldown_ > 0) --cooldown_;
}

void KhepriOrchestrator::handle_copy_failure(const Config& cfg) {
    copy_failed_ = false;
    std::string source = status_.snapshot().current_transfer_source;

    if (copy_failures_ < cfg.max_copy_retries) {
        throw KhepriTransientError("copy of " + source + " failed, attempt " +
                                   std::to_string(copy_failures_) + " of " +
                                   std::to_string(cfg.max_copy_retries));
    }

    give_up_transfer(cfg);
    throw KhepriTransientError("copy of " + source + " failed " + std::to_string(cfg.max_copy_retries) +
                               " times, giving up");
}

void KhepriOrchestrator::give_up_transfer(const Config& cfg) {
    PersistedStatus st = status_.snapshot();
    const std::string ts = khepri_timestamp();
    std::string body = "The transfer of " + st.current_transfer_source + " failed " +
                       std::to_string(copy_failures_) + " times.";

    if (!st.current_transfer_source.empty() && khepri_is_directory(st.current_transfer_source)) {
        std::string kept = spool_.quarantine(st.current_transfer_source, ts);
        if (kept.empty()) {
            body += "\nMoving the source to the error location failed, it stays in " +
                    st.current_transfer_source + ".";
        } else {
            body += "\nSource data preserved in " + kept + ".";
        }
    }

    if (!st.transfer_target_user.empty()) {
        std::string partial = khepri_join(cfg.tmp_transfer_path(), st.transfer_target_user);
        if (khepri_is_directory(partial)) {
            std::string kept = khepri_move_collision_safe(partial, partial + "_failed_" + ts);
            if (kept.empty()) {
                body += "\nPartially transferred data left in " + partial + ".";
            } else {
                body += "\nPartially transferred data moved to " + kept + ".";
            }
        }
    }

    status_.update([](PersistedStatus& s) {
        s.current_transfer_source.clear();
        s.transfer_target_user.clear();
        s.transfer_in_progress = false;
        s.current_transfer_size = 0;
        s.bytes_completed = 0;
        s.bytes_current_file = 0;
        s.percent_complete = 0;
    });

    copy_failures_ = 0;
    current_file_size_ = 0;
    have_current_file_ = false;
    ++khepri_metrics.batches_failed;

    if (!notifier_.notify(NotifyCategory::Admin, "Transfer failed permanently", body)) {
        KHEPRI_LOG_ERROR("orchestrator", "%s", body.c_str());
    }
}

void KhepriOrchestrator::check_storage(bool force) {
    if (storage_.update_free_space(force) && storage_.any_drive_low()) {
        notifier_.notify(NotifyCategory::Storage, "Low free space", storage_.free_space_summary());
    }
    if (storage_.update_grace(force) && storage_.expired_count() > 0) {
        notifier_.notify(NotifyCategory::Grace, "Expired data in grace location", storage_.grace_summary());
    }
}

bool KhepriOrchestrator::apply_admission(const Config& cfg, bool& resumed) {
    std::string reasons;
    auto add = [&reasons](const std::string& r) {
        if (!reasons.empty()) reasons += ", ";
        reasons += r;
    };

    if (cpu_high_) add("CPU");
    if (disk_high_) add("disk I/O");

    long mem = probe_.available_memory_mb();
    if (mem >= 0 && mem < cfg.min_available_memory_mb) add("RAM");

    std::string process = probe_.running_blacklisted(cfg.blacklisted_processes);
    if (!process.empty()) add("process '" + process + "'");

    bool suspend = !reasons.empty();
    std::string note = suspend ? reasons : "all parameters in valid ranges";
    if (suspend && cfg.ignore_limits_without_session && !probe_.user_session_active()) {
        suspend = false;
        note = "no user is currently logged on";
    }

    PersistedStatus st = status_.snapshot();
    if (st.service_suspended != suspend || st.suspend_reason != note) {
        if (suspend) {
            KHEPRI_LOG_INFO("orchestrator", "Service suspended: %s", note.c_str());
        } else if (st.service_suspended) {
            KHEPRI_LOG_INFO("orchestrator", "Service no longer suspended: %s", note.c_str());
        }
        status_.set_suspended(suspend, note);
    }

    TransferState current = state();
    if (suspend && current == TransferState::Active) {
        if (engine_.pause()) {
            state_.store(TransferState::Paused, std::memory_order_release);
            ++khepri_metrics.pauses;
            KHEPRI_LOG_INFO("orchestrator", "Transfer paused (%s)", note.c_str());
        } else {
            KHEPRI_LOG_WARN("orchestrator", "Pausing the copy failed");
        }
    } else if (!suspend && current == TransferState::Paused) {
        if (engine_.resume()) {
            state_.store(TransferState::Active, std::memory_order_release);
            ++khepri_metrics.resumes;
            resumed = true;
            KHEPRI_LOG_INFO("orchestrator", "Transfer resumed");
        } else {
            KHEPRI_LOG_WARN("orchestrator", "Resuming the copy failed");
        }
    }
    return suspend;
}

void KhepriOrchestrator::scan_incoming(const Config& cfg) {
    std::vector<std::string> ready = spool_.ready_users();
    if (ready.empty()) return;

    // One batch timestamp per scan.
    const std::string ts = khepri_timestamp();

    for (const auto& user : ready) {
        bool matched = user != cfg.tmp_transfer_dir &&
                       khepri_is_directory(khepri_join(cfg.destination_path, user));

        switch (spool_.promote(user, matched, ts)) {
        case PromoteResult::Promoted:
            ++khepri_metrics.batches_promoted;
            break;
        case PromoteResult::Unmatched:
            ++khepri_metrics.batches_unmatched;
            notifier_.notify(NotifyCategory::Admin, "Unmatched incoming directory",
                             "No destination directory for user '" + user + "', data moved to " +
                             khepri_join(khepri_join(spool_.unmatched_path(), ts), user));
            break;
        case PromoteResult::Failed:
            ++khepri_metrics.batches_failed;
            notifier_.notify(NotifyCategory::Admin, "Moving incoming data failed",
                             "Incoming data of user '" + user + "' could not be queued and is "
                             "ignored until the service restarts.");
            break;
        }
    }
}

void KhepriOrchestrator::refresh_incoming_dirs(const Config& cfg) {
    auto now = std::chrono::steady_clock::now();
    if (users_checked_ && now - last_user_check_ < constants::INCOMING_REFRESH_INTERVAL) return;
    users_checked_ = true;
    last_user_check_ = now;

    std::vector<std::string> local = probe_.local_users(cfg.home_root);
    std::vector<std::string> remote = khepri_list_dir(cfg.destination_path, EntryKind::Directory);
    int created = spool_.create_incoming_dirs(local, remote, cfg.tmp_transfer_dir);
    KHEPRI_LOG_DEBUG("orchestrator", "Incoming directories refreshed, %d created", created);
}

void KhepriOrchestrator::finalize_transfer(const Config& cfg) {
    PersistedStatus st = status_.snapshot();
    if (st.transfer_in_progress) return;

    if (!st.transfer_target_user.empty()) {
        std::string partial = khepri_join(cfg.tmp_transfer_path(), st.transfer_target_user);
        std::string final_dst = khepri_join(cfg.destination_path, st.transfer_target_user);

        if (khepri_is_directory(partial)) {
            if (!khepri_is_directory(final_dst)) {
                throw KhepriTransientError("destination directory " + final_dst + " does not exist");
            }
            if (!khepri_move_entries(partial, final_dst)) {
                throw KhepriTransientError("moving " + partial + " into " + final_dst + " failed");
            }
            if (!khepri_remove_empty_dir(partial)) {
                KHEPRI_LOG_DEBUG("orchestrator", "Could not remove %s: %s", partial.c_str(), strerror(errno));
            }
        }
        status_.set_transfer_target_user("");
        KHEPRI_LOG_DEBUG("orchestrator", "Transferred data placed in %s", final_dst.c_str());
    }

    if (st.current_transfer_source.empty()) return;

    if (!khepri_is_directory(st.current_transfer_source)) {
        KHEPRI_LOG_WARN("orchestrator", "Transfer source %s vanished before it was finalized",
                        st.current_transfer_source.c_str());
        status_.update([](PersistedStatus& s) {
            s.current_transfer_source.clear();
            s.current_transfer_size = 0;
        });
        return;
    }

    std::string grace = spool_.retire_to_grace(st.current_transfer_source, khepri_timestamp());
    if (grace.empty()) {
        throw KhepriTransientError("moving " + st.current_transfer_source + " to the grace location failed");
    }

    status_.update([](PersistedStatus& s) {
        s.current_transfer_source.clear();
        s.current_transfer_size = 0;
    });
    KHEPRI_LOG_INFO("orchestrator", "Transfer finalized, local data kept in %s", grace.c_str());

    check_storage(true);
}

bool KhepriOrchestrator::resume_interrupted(const Config& cfg) {
    PersistedStatus st = status_.snapshot();
    if (!st.transfer_in_progress || engine_.active()) return false;

    if (st.current_transfer_source.empty() || !khepri_is_directory(st.current_transfer_source)) {
        KHEPRI_LOG_WARN("orchestrator", "Interrupted transfer source '%s' is gone, dropping it",
                        st.current_transfer_source.c_str());
        status_.update([](PersistedStatus& s) {
            s.current_transfer_source.clear();
            s.transfer_in_progress = false;
            s.current_transfer_size = 0;
            s.bytes_completed = 0;
            s.bytes_current_file = 0;
            s.percent_complete = 0;
        });
        return false;
    }

    KHEPRI_LOG_INFO("orchestrator", "Resuming interrupted transfer of %s", st.current_transfer_source.c_str());
    start_transfer(cfg, st.current_transfer_source, true);
    return true;
}

void KhepriOrchestrator::dispatch_next(const Config& cfg) {
    PersistedStatus st = status_.snapshot();
    if (st.transfer_in_progress || !st.current_transfer_source.empty()) return;

    std::string source = spool_.next_transfer_source();
    if (source.empty()) return;

    if (cooldown_ > 0) {
        KHEPRI_LOG_DEBUG("orchestrator", "Waiting %d more cycles before the next transfer", cooldown_);
        return;
    }

    start_transfer(cfg, source, false);
}

void KhepriOrchestrator::start_transfer(const Config& cfg, const std::string& source, bool resumed) {
    const std::string user = khepri_basename(source);
    const uint64_t size = khepri_dir_size(source);

    current_file_size_ = 0;
    have_current_file_ = false;
    last_file_percent_ = -1;
    last_logged_step_ = -1;

    // Empty files, links and directories still have to reach the destination.
    if (size == 0) {
        KHEPRI_LOG_INFO("orchestrator", "Source %s holds no file data, copying its entries anyway", source.c_str());
    }

    std::string target = khepri_join(cfg.tmp_transfer_path(), user);
    if (khepri_mkdir_p_safe(target) != 0) {
        throw KhepriTransientError("cannot create " + target + ": " + strerror(errno));
    }

    status_.update([&](PersistedStatus& st) {
        st.current_transfer_source = source;
        st.transfer_target_user = user;
        st.transfer_in_progress = true;
        st.current_transfer_size = size;
        st.bytes_completed = 0;
        st.bytes_current_file = 0;
        st.percent_complete = 0;
    });

    CopyOptions options;
    options.bandwidth_limit_kbps = cfg.bandwidth_limit_kbps;
    if (!engine_.start(source, target, options)) {
        throw KhepriTransientError("starting the copy of " + source + " failed");
    }

    state_.store(TransferState::Active, std::memory_order_release);
    if (resumed) {
        ++khepri_metrics.transfers_resumed;
    } else {
        ++khepri_metrics.transfers_started;
    }
    KHEPRI_LOG_INFO("orchestrator", "Transfer %s: %s -> %s (%s)", resumed ? "resumed" : "started",
                    source.c_str(), target.c_str(), khepri_bytes_to_human(size).c_str());
}
