#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: throttled operator notifications
// -----------------------------------------------------------------------------

#include <ctime>
#include <functional>
#include <string>

class StatusStore;

enum class NotifyCategory { Storage, Admin, Grace };

const char* khepri_notify_category_name(NotifyCategory category) noexcept;

struct NotifyIntervals {
    int storage_min = 720;
    int admin_min = 60;
    int grace_min = 720;
};

class Notifier {
public:
    using StatusSink = std::function<void(const std::string& line)>;

    Notifier(StatusStore& status, NotifyIntervals intervals);

    void set_intervals(NotifyIntervals intervals) { intervals_ = intervals; }

    // Published in addition to the log, e.g. as the systemd status line.
    void set_status_sink(StatusSink sink) { sink_ = std::move(sink); }

    // Returns true when the notification went out, false when throttled.
    bool notify(NotifyCategory category, const std::string& subject, const std::string& body,
                time_t now = time(nullptr));

    // Seconds until the category may send again, 0 when it may send now.
    long remaining(NotifyCategory category, time_t now = time(nullptr)) const;

private:
    time_t last_sent(NotifyCategory category) const;
    int interval_min(NotifyCategory category) const noexcept;

    StatusStore& status_;
    NotifyIntervals intervals_;
    StatusSink sink_;
};
