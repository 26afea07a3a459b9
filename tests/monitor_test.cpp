// -----------------------------------------------------------------------------
// Khepri Relay: load monitor hysteresis tests
// -----------------------------------------------------------------------------

#include "khepri_monitor.hpp"
#include "khepri_test_util.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class MonitorTest : public CppUnit::TestCase {
public:
    CPPUNIT_TEST_SUITE(MonitorTest);
    CPPUNIT_TEST(HysteresisTest);
    CPPUNIT_TEST(ShortSpikeTest);
    CPPUNIT_TEST(FirstSampleHighTest);
    CPPUNIT_TEST(StartHighTest);
    CPPUNIT_TEST(WindowAverageTest);
    CPPUNIT_TEST(SamplerFailureTest);
    CPPUNIT_TEST(ReconfigureTest);
    CPPUNIT_TEST(ThreadedSamplingTest);
    CPPUNIT_TEST_SUITE_END();

    void HysteresisTest();
    void ShortSpikeTest();
    void FirstSampleHighTest();
    void StartHighTest();
    void WindowAverageTest();
    void SamplerFailureTest();
    void ReconfigureTest();
    void ThreadedSamplingTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION(MonitorTest);

namespace {

struct EventLog {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::string> events;

    void attach(LoadMonitor& m) {
        m.on_high([this](const std::string&, double) { push("high"); });
        m.on_low([this](const std::string&, double) { push("low"); });
    }

    void push(const std::string& e) {
        std::lock_guard<std::mutex> lk(mtx);
        events.push_back(e);
        cv.notify_all();
    }

    std::string joined() {
        std::lock_guard<std::mutex> lk(mtx);
        std::string out;
        for (const auto& e : events) {
            if (!out.empty()) out += ",";
            out += e;
        }
        return out;
    }
};

MonitorConfig make_config(double limit, int probation, bool start_high = false) {
    MonitorConfig cfg;
    cfg.name = "cpu";
    cfg.interval_ms = 10;
    cfg.limit = limit;
    cfg.probation = probation;
    cfg.start_high = start_high;
    return cfg;
}

}

//------------------------------------------------------------------------------
// [10,10,30,10,10] with limit 25 and probation 2
//------------------------------------------------------------------------------
void MonitorTest::HysteresisTest() {
    LoadMonitor monitor(make_config(25, 2), [] { return std::optional<double>(); });
    EventLog log;
    log.attach(monitor);

    monitor.add_sample(10);
    monitor.add_sample(10);
    CPPUNIT_ASSERT_EQUAL(std::string(), log.joined());
    CPPUNIT_ASSERT(!monitor.is_high());

    monitor.add_sample(30);
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());
    CPPUNIT_ASSERT(monitor.is_high());
    CPPUNIT_ASSERT_EQUAL(0, monitor.reading().behaving);

    // One good sample is not enough.
    monitor.add_sample(10);
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());
    CPPUNIT_ASSERT(monitor.is_high());

    monitor.add_sample(10);
    CPPUNIT_ASSERT_EQUAL(std::string("high,low"), log.joined());
    CPPUNIT_ASSERT(!monitor.is_high());

    // Staying low does not repeat the event.
    for (int i = 0; i < 10; ++i) monitor.add_sample(5);
    CPPUNIT_ASSERT_EQUAL(std::string("high,low"), log.joined());
}

//------------------------------------------------------------------------------
// A spike during probation restarts the count without a second high event
//------------------------------------------------------------------------------
void MonitorTest::ShortSpikeTest() {
    LoadMonitor monitor(make_config(25, 3), [] { return std::optional<double>(); });
    EventLog log;
    log.attach(monitor);

    monitor.add_sample(10);
    monitor.add_sample(50);
    monitor.add_sample(10);
    monitor.add_sample(10);
    monitor.add_sample(60);
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());

    monitor.add_sample(10);
    monitor.add_sample(10);
    CPPUNIT_ASSERT(monitor.is_high());
    monitor.add_sample(25);
    CPPUNIT_ASSERT_EQUAL(std::string("high,low"), log.joined());
    CPPUNIT_ASSERT(!monitor.is_high());
}

void MonitorTest::FirstSampleHighTest() {
    LoadMonitor monitor(make_config(25, 2), [] { return std::optional<double>(); });
    EventLog log;
    log.attach(monitor);

    monitor.add_sample(80);
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());
    CPPUNIT_ASSERT(monitor.is_high());

    monitor.add_sample(90);
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());

    monitor.add_sample(1);
    monitor.add_sample(1);
    CPPUNIT_ASSERT_EQUAL(std::string("high,low"), log.joined());
}

void MonitorTest::StartHighTest() {
    LoadMonitor monitor(make_config(25, 2, true), [] { return std::optional<double>(); });
    EventLog log;
    log.attach(monitor);

    CPPUNIT_ASSERT(monitor.is_high());
    monitor.start();
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());
    monitor.stop();

    monitor.add_sample(10);
    CPPUNIT_ASSERT(monitor.is_high());
    monitor.add_sample(10);
    CPPUNIT_ASSERT(!monitor.is_high());
    CPPUNIT_ASSERT_EQUAL(std::string("high,low"), log.joined());
}

void MonitorTest::WindowAverageTest() {
    LoadMonitor monitor(make_config(1000, 1), [] { return std::optional<double>(); });

    monitor.add_sample(10);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(10.0, monitor.load(), 1e-9);
    monitor.add_sample(20);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(15.0, monitor.load(), 1e-9);

    monitor.add_sample(30);
    monitor.add_sample(40);
    monitor.add_sample(50);
    MonitorReading r = monitor.reading();
    CPPUNIT_ASSERT_EQUAL(constants::WINDOW_SLOTS, r.samples);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(35.0, r.load, 1e-9);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(50.0, r.window[0], 1e-9);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(20.0, r.window[3], 1e-9);
}

//------------------------------------------------------------------------------
// Missing or failing samples leave the reading untouched
//------------------------------------------------------------------------------
void MonitorTest::SamplerFailureTest() {
    int calls = 0;
    LoadMonitor monitor(make_config(25, 2), [&calls]() -> std::optional<double> {
        ++calls;
        if (calls == 1) return std::nullopt;
        if (calls == 2) throw std::runtime_error("probe unavailable");
        return 99.0;
    });
    EventLog log;
    log.attach(monitor);

    monitor.sample_once();
    monitor.sample_once();
    CPPUNIT_ASSERT_EQUAL(0, monitor.reading().samples);
    CPPUNIT_ASSERT(!monitor.reading().initialized);

    monitor.sample_once();
    CPPUNIT_ASSERT_EQUAL(1, monitor.reading().samples);
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());
}

void MonitorTest::ReconfigureTest() {
    LoadMonitor monitor(make_config(25, 2), [] { return std::optional<double>(); });
    EventLog log;
    log.attach(monitor);

    monitor.add_sample(10);
    monitor.add_sample(10);
    monitor.add_sample(10);
    monitor.reconfigure(5, 1, 100);
    monitor.add_sample(10);
    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());
    monitor.add_sample(4);
    CPPUNIT_ASSERT_EQUAL(std::string("high,low"), log.joined());
}

void MonitorTest::ThreadedSamplingTest() {
    LoadMonitor monitor(make_config(25, 2), [] { return std::optional<double>(75.0); });
    EventLog log;
    log.attach(monitor);

    monitor.start();
    {
        std::unique_lock<std::mutex> lk(log.mtx);
        log.cv.wait_for(lk, std::chrono::seconds(5), [&log] { return !log.events.empty(); });
    }
    monitor.stop();

    CPPUNIT_ASSERT_EQUAL(std::string("high"), log.joined());
    CPPUNIT_ASSERT(monitor.reading().samples >= 1);
}
