#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: sampled load monitor with hysteresis
// -----------------------------------------------------------------------------

#include "khepri_common.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct MonitorConfig {
    std::string name;
    int interval_ms = 250;
    double limit = 0;
    int probation = 1;
    bool start_high = false;
};

struct MonitorReading {
    std::array<double, constants::WINDOW_SLOTS> window{};
    int samples = 0;
    double load = 0;
    int behaving = 0;
    bool high = false;
    bool initialized = false;
};

// One instance per monitored resource. The sampler returns nullopt when no
// value is available yet; such ticks are skipped.
class LoadMonitor {
public:
    using Sampler = std::function<std::optional<double>()>;
    using Listener = std::function<void(const std::string& name, double load)>;

    LoadMonitor(MonitorConfig cfg, Sampler sampler);
    ~LoadMonitor();

    LoadMonitor(const LoadMonitor&) = delete;
    LoadMonitor& operator=(const LoadMonitor&) = delete;

    void on_high(Listener fn) { on_high_ = std::move(fn); }
    void on_low(Listener fn) { on_low_ = std::move(fn); }

    void start();
    void stop();

    // Limit, probation and interval changes take effect on the next sample.
    void reconfigure(double limit, int probation, int interval_ms);

    // Takes one sample from the sampler.
    void sample_once();

    // Feeds a value directly into the hysteresis logic.
    void add_sample(double value);

    MonitorReading reading() const;
    bool is_high() const;
    double load() const;
    const std::string& name() const noexcept { return cfg_.name; }

private:
    void loop();

    MonitorConfig cfg_;
    Sampler sampler_;
    Listener on_high_;
    Listener on_low_;

    mutable std::mutex mtx_;
    MonitorReading reading_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wait_mtx_;
    std::condition_variable wait_cv_;
};
