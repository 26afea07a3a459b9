#include "khepri_notify.hpp"
#include "khepri_common.hpp"
#include "khepri_status.hpp"

const char* khepri_notify_category_name(NotifyCategory category) noexcept {
    switch (category) {
    case NotifyCategory::Storage: return "storage";
    case NotifyCategory::Admin:   return "admin";
    case NotifyCategory::Grace:   return "grace";
    }
    return "unknown";
}

Notifier::Notifier(StatusStore& status, NotifyIntervals intervals)
    : status_(status), intervals_(intervals) {}

int Notifier::interval_min(NotifyCategory category) const noexcept {
    switch (category) {
    case NotifyCategory::Storage: return intervals_.storage_min;
    case NotifyCategory::Admin:   return intervals_.admin_min;
    case NotifyCategory::Grace:   return intervals_.grace_min;
    }
    return 0;
}

time_t Notifier::last_sent(NotifyCategory category) const {
    PersistedStatus st = status_.snapshot();
    switch (category) {
    case NotifyCategory::Storage: return st.last_storage_notification;
    case NotifyCategory::Admin:   return st.last_admin_notification;
    case NotifyCategory::Grace:   return st.last_grace_notification;
    }
    return 0;
}

long Notifier::remaining(NotifyCategory category, time_t now) const {
    time_t last = last_sent(category);
    if (last == 0) return 0;

    long interval = static_cast<long>(interval_min(category)) * 60;
    long elapsed = static_cast<long>(now - last);
    // A clock that jumped backwards must not silence the category for good.
    if (elapsed < 0) return 0;
    return elapsed >= interval ? 0 : interval - elapsed;
}

bool Notifier::notify(NotifyCategory category, const std::string& subject, const std::string& body,
                      time_t now) {
    const char* name = khepri_notify_category_name(category);

    long wait = remaining(category, now);
    if (wait > 0) {
        ++khepri_metrics.notifications_suppressed;
        KHEPRI_LOG_DEBUG("notify", "Suppressed %s notification '%s', next allowed in %s",
                         name, subject.c_str(), khepri_seconds_to_human(wait).c_str());
        return false;
    }

    if (category == NotifyCategory::Admin) {
        KHEPRI_LOG_ERROR("notify", "[%s] %s\n%s", name, subject.c_str(), body.c_str());
    } else {
        KHEPRI_LOG_WARN("notify", "[%s] %s\n%s", name, subject.c_str(), body.c_str());
    }

    switch (category) {
    case NotifyCategory::Storage: status_.set_last_storage_notification(now); break;
    case NotifyCategory::Admin:   status_.set_last_admin_notification(now); break;
    case NotifyCategory::Grace:   status_.set_last_grace_notification(now); break;
    }

    if (sink_) {
        sink_(std::string(name) + ": " + subject);
    }

    ++khepri_metrics.notifications_sent;
    return true;
}
