#include "khepri_monitor.hpp"

#include <algorithm>
#include <climits>
#include <pthread.h>

LoadMonitor::LoadMonitor(MonitorConfig cfg, Sampler sampler)
    : cfg_(std::move(cfg)), sampler_(std::move(sampler)) {
    if (cfg_.probation < 1) cfg_.probation = 1;
    if (cfg_.start_high) {
        // Legacy policy: assume the resource is busy until proven otherwise.
        reading_.initialized = true;
        reading_.high = true;
        reading_.behaving = 0;
    }
}

LoadMonitor::~LoadMonitor() {
    stop();
}

void LoadMonitor::start() {
    if (running_.exchange(true)) {
        KHEPRI_LOG_WARN("monitor", "%s monitor already running", cfg_.name.c_str());
        return;
    }

    if (cfg_.start_high && on_high_) {
        on_high_(cfg_.name, 0.0);
    }

    thread_ = std::thread([this] { loop(); });
#if defined(__linux__)
    std::string thread_name = "khepri-" + cfg_.name.substr(0, 8);
    pthread_setname_np(thread_.native_handle(), thread_name.c_str());
#endif
    KHEPRI_LOG_INFO("monitor", "%s monitor started (limit=%.2f probation=%d interval=%dms)",
                    cfg_.name.c_str(), cfg_.limit, cfg_.probation, cfg_.interval_ms);
}

void LoadMonitor::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        wait_cv_.notify_all();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    KHEPRI_LOG_INFO("monitor", "%s monitor stopped", cfg_.name.c_str());
}

void LoadMonitor::reconfigure(double limit, int probation, int interval_ms) {
    std::lock_guard<std::mutex> lk(mtx_);
    cfg_.limit = limit;
    cfg_.probation = std::max(1, probation);
    cfg_.interval_ms = std::max(1, interval_ms);
}

void LoadMonitor::loop() {
    khepri_block_signals_in_worker_threads();
    while (running_.load(std::memory_order_acquire)) {
        sample_once();

        int interval_ms;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            interval_ms = cfg_.interval_ms;
        }

        std::unique_lock<std::mutex> lk(wait_mtx_);
        wait_cv_.wait_for(lk, std::chrono::milliseconds(interval_ms), [this] {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

void LoadMonitor::sample_once() {
    std::optional<double> value;
    try {
        value = sampler_();
    } catch (const std::exception& e) {
        KHEPRI_LOG_WARN("monitor", "%s sampler failed: %s", cfg_.name.c_str(), e.what());
        return;
    }

    if (!value) {
        KHEPRI_LOG_DEBUG("monitor", "%s sampler returned no value, skipping tick", cfg_.name.c_str());
        return;
    }
    add_sample(*value);
}

void LoadMonitor::add_sample(double value) {
    enum class Transition { None, High, Low } transition = Transition::None;
    double load;
    double limit;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        MonitorReading& r = reading_;
        limit = cfg_.limit;

        for (int i = constants::WINDOW_SLOTS - 1; i > 0; --i) {
            r.window[i] = r.window[i - 1];
        }
        r.window[0] = value;
        r.samples = std::min(r.samples + 1, constants::WINDOW_SLOTS);

        double sum = 0;
        for (int i = 0; i < r.samples; ++i) sum += r.window[i];
        r.load = sum / r.samples;
        load = r.load;

        if (!r.initialized) {
            // The first live sample decides the initial state.
            r.initialized = true;
            if (value > cfg_.limit) {
                r.high = true;
                r.behaving = 0;
                transition = Transition::High;
            } else {
                r.high = false;
                r.behaving = cfg_.probation + 1;
            }
        } else if (value > cfg_.limit) {
            if (r.behaving > cfg_.probation) {
                r.high = true;
                transition = Transition::High;
            }
            r.behaving = 0;
        } else {
            if (r.behaving < INT_MAX) {
                ++r.behaving;
            } else {
                r.behaving = cfg_.probation + 1;
            }
            // A spike too short to count as high also resets the counter;
            // only a monitor that is actually high reports the way back.
            if (r.behaving == cfg_.probation && r.high) {
                r.high = false;
                transition = Transition::Low;
            }
        }
    }

    if (transition == Transition::High) {
        KHEPRI_LOG_INFO("monitor", "%s load above limit (sample=%.2f, average=%.2f, limit=%.2f)",
                        cfg_.name.c_str(), value, load, limit);
        if (on_high_) on_high_(cfg_.name, load);
    } else if (transition == Transition::Low) {
        KHEPRI_LOG_INFO("monitor", "%s load back below limit (average=%.2f)", cfg_.name.c_str(), load);
        if (on_low_) on_low_(cfg_.name, load);
    }
}

MonitorReading LoadMonitor::reading() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reading_;
}

bool LoadMonitor::is_high() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reading_.high;
}

double LoadMonitor::load() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reading_.load;
}
