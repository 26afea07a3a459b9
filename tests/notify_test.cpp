// -----------------------------------------------------------------------------
// Khepri Relay: notification throttling tests
// -----------------------------------------------------------------------------

#include "khepri_notify.hpp"
#include "khepri_status.hpp"
#include "khepri_test_util.hpp"

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class NotifyTest : public CppUnit::TestCase {
public:
    CPPUNIT_TEST_SUITE(NotifyTest);
    CPPUNIT_TEST(ThrottleTest);
    CPPUNIT_TEST(IndependentCategoriesTest);
    CPPUNIT_TEST(PersistedThrottleTest);
    CPPUNIT_TEST(ClockJumpTest);
    CPPUNIT_TEST_SUITE_END();

    void ThrottleTest();
    void IndependentCategoriesTest();
    void PersistedThrottleTest();
    void ClockJumpTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION(NotifyTest);

static const time_t T0 = 1700000000;

//------------------------------------------------------------------------------
// At most one notification per category and interval
//------------------------------------------------------------------------------
void NotifyTest::ThrottleTest() {
    ScratchDir dir;
    StatusStore status(dir / "status");
    NotifyIntervals intervals;
    intervals.admin_min = 60;
    Notifier notifier(status, intervals);

    std::vector<std::string> published;
    notifier.set_status_sink([&published](const std::string& line) { published.push_back(line); });

    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Admin, "Transfer failed", "details", T0));
    CPPUNIT_ASSERT(!notifier.notify(NotifyCategory::Admin, "Transfer failed", "details", T0 + 60));
    CPPUNIT_ASSERT(!notifier.notify(NotifyCategory::Admin, "Transfer failed", "details", T0 + 3599));
    CPPUNIT_ASSERT_EQUAL(1L, notifier.remaining(NotifyCategory::Admin, T0 + 3599));
    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Admin, "Transfer failed", "details", T0 + 3600));

    CPPUNIT_ASSERT_EQUAL(size_t(2), published.size());
    CPPUNIT_ASSERT_EQUAL(std::string("admin: Transfer failed"), published[0]);
    CPPUNIT_ASSERT_EQUAL(T0 + 3600, status.snapshot().last_admin_notification);
}

void NotifyTest::IndependentCategoriesTest() {
    ScratchDir dir;
    StatusStore status(dir / "status");
    Notifier notifier(status, NotifyIntervals());

    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Storage, "Low free space", "", T0));
    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Grace, "Expired data", "", T0));
    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Admin, "Unmatched", "", T0));
    CPPUNIT_ASSERT(!notifier.notify(NotifyCategory::Storage, "Low free space", "", T0 + 3600));

    // Storage and grace default to twelve hours.
    CPPUNIT_ASSERT_EQUAL(12L * 3600, notifier.remaining(NotifyCategory::Grace, T0));
    CPPUNIT_ASSERT_EQUAL(0L, notifier.remaining(NotifyCategory::Admin, T0 + 3600));

    NotifyIntervals shorter;
    shorter.storage_min = 30;
    notifier.set_intervals(shorter);
    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Storage, "Low free space", "", T0 + 1800));
}

//------------------------------------------------------------------------------
// The throttle survives a restart through the status file
//------------------------------------------------------------------------------
void NotifyTest::PersistedThrottleTest() {
    ScratchDir dir;
    {
        StatusStore status(dir / "status");
        Notifier notifier(status, NotifyIntervals());
        CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Grace, "Expired data", "", T0));
    }

    StatusStore status(dir / "status");
    CPPUNIT_ASSERT(status.load());
    Notifier notifier(status, NotifyIntervals());
    CPPUNIT_ASSERT(!notifier.notify(NotifyCategory::Grace, "Expired data", "", T0 + 60));
}

void NotifyTest::ClockJumpTest() {
    ScratchDir dir;
    StatusStore status(dir / "status");
    Notifier notifier(status, NotifyIntervals());

    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Admin, "first", "", T0));
    CPPUNIT_ASSERT_EQUAL(0L, notifier.remaining(NotifyCategory::Admin, T0 - 86400));
    CPPUNIT_ASSERT(notifier.notify(NotifyCategory::Admin, "after clock reset", "", T0 - 86400));
}
