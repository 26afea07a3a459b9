// -----------------------------------------------------------------------------
// Khepri Relay: environment configuration tests
// -----------------------------------------------------------------------------

#include "khepri_config.hpp"
#include "khepri_test_util.hpp"

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class ConfigTest : public CppUnit::TestCase {
public:
    CPPUNIT_TEST_SUITE(ConfigTest);
    CPPUNIT_TEST(DriveListTest);
    CPPUNIT_TEST(DefaultsTest);
    CPPUNIT_TEST(OverridesTest);
    CPPUNIT_TEST(ClampingTest);
    CPPUNIT_TEST(RejectedTest);
    CPPUNIT_TEST(PathCheckTest);
    CPPUNIT_TEST_SUITE_END();

    void setUp() override;
    void tearDown() override;

    void DriveListTest();
    void DefaultsTest();
    void OverridesTest();
    void ClampingTest();
    void RejectedTest();
    void PathCheckTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION(ConfigTest);

static const char* const CONFIG_VARS[] = {
    "INCOMING_PATH", "MANAGED_PATH", "DESTINATION_PATH", "TMP_TRANSFER_DIR", "HOME_ROOT",
    "MARKER_FILE", "STATUS_FILE", "RSYNC_PATH", "LOG_LEVEL", "RUN_AS_USER", "SERVICE_TIMER_MS",
    "MAX_CPU_USAGE", "CPU_PROBATION", "CPU_INTERVAL_MS", "MAX_DISK_QUEUE", "DISK_PROBATION",
    "DISK_INTERVAL_MS", "MIN_AVAILABLE_MEMORY_MB", "GRACE_PERIOD_DAYS", "STORAGE_UPDATE_SEC",
    "COOLDOWN_CYCLES", "STORAGE_NOTIFICATION_MIN", "ADMIN_NOTIFICATION_MIN", "GRACE_NOTIFICATION_MIN",
    "MAX_COPY_RETRIES", "BANDWIDTH_LIMIT_KBPS", "MONITOR_START_HIGH", "IGNORE_LIMITS_WITHOUT_SESSION",
    "USE_SYSLOG", "DAEMONIZE", "BLACKLISTED_PROCESSES", "SPACE_MONITORING",
};

void ConfigTest::setUp() {
    for (const char* var : CONFIG_VARS) unsetenv(var);
    // Loading applies LOG_LEVEL globally; keep test output quiet.
    setenv("LOG_LEVEL", "error", 1);
}

void ConfigTest::tearDown() {
    for (const char* var : CONFIG_VARS) unsetenv(var);
    khepri_set_log_level("error");
}

void ConfigTest::DriveListTest() {
    std::vector<DriveSpec> drives;
    CPPUNIT_ASSERT(khepri_parse_drive_list("/:10, /data:250 ,/mnt/a:b:5", drives));
    CPPUNIT_ASSERT_EQUAL(size_t(3), drives.size());
    CPPUNIT_ASSERT_EQUAL(std::string("/"), drives[0].path);
    CPPUNIT_ASSERT_EQUAL(uint64_t(10), drives[0].threshold_gb);
    CPPUNIT_ASSERT_EQUAL(std::string("/data"), drives[1].path);
    CPPUNIT_ASSERT_EQUAL(uint64_t(250), drives[1].threshold_gb);
    CPPUNIT_ASSERT_EQUAL(std::string("/mnt/a:b"), drives[2].path);

    CPPUNIT_ASSERT(khepri_parse_drive_list("", drives));
    CPPUNIT_ASSERT(drives.empty());

    std::vector<DriveSpec> untouched = {{"/keep", 1}};
    CPPUNIT_ASSERT(!khepri_parse_drive_list("/data", untouched));
    CPPUNIT_ASSERT(!khepri_parse_drive_list("/data:", untouched));
    CPPUNIT_ASSERT(!khepri_parse_drive_list(":10", untouched));
    CPPUNIT_ASSERT(!khepri_parse_drive_list("relative:10", untouched));
    CPPUNIT_ASSERT(!khepri_parse_drive_list("/data:-3", untouched));
    CPPUNIT_ASSERT(!khepri_parse_drive_list("/data:1e3", untouched));
    CPPUNIT_ASSERT_EQUAL(size_t(1), untouched.size());
    CPPUNIT_ASSERT_EQUAL(std::string("/keep"), untouched[0].path);
}

void ConfigTest::DefaultsTest() {
    auto cfg = khepri_load_config_from_env();
    CPPUNIT_ASSERT(cfg);

    CPPUNIT_ASSERT_EQUAL(1000, cfg->service_timer_ms);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(25.0, cfg->max_cpu_usage, 1e-9);
    CPPUNIT_ASSERT_EQUAL(2, cfg->cooldown_cycles);
    CPPUNIT_ASSERT_EQUAL(30, cfg->grace_period_days);
    CPPUNIT_ASSERT_EQUAL(5, cfg->max_copy_retries);
    CPPUNIT_ASSERT_EQUAL(720, cfg->storage_notification_min);
    CPPUNIT_ASSERT_EQUAL(60, cfg->admin_notification_min);
    CPPUNIT_ASSERT(!cfg->monitor_start_high);
    CPPUNIT_ASSERT(cfg->ignore_limits_without_session);
    CPPUNIT_ASSERT(cfg->blacklisted_processes.empty());
    CPPUNIT_ASSERT_EQUAL(size_t(1), cfg->space_monitoring.size());

    CPPUNIT_ASSERT_EQUAL(cfg->managed_path + "/PROCESSING", cfg->processing_path());
    CPPUNIT_ASSERT_EQUAL(cfg->managed_path + "/DONE", cfg->done_path());
    CPPUNIT_ASSERT_EQUAL(cfg->destination_path + "/" + cfg->tmp_transfer_dir, cfg->tmp_transfer_path());
}

void ConfigTest::OverridesTest() {
    setenv("INCOMING_PATH", "/srv/in", 1);
    setenv("MANAGED_PATH", "/srv/managed", 1);
    setenv("DESTINATION_PATH", "/mnt/dest/", 1);
    setenv("SERVICE_TIMER_MS", "5000", 1);
    setenv("MAX_CPU_USAGE", "40.5", 1);
    setenv("BLACKLISTED_PROCESSES", "matlab, Acquire ,", 1);
    setenv("SPACE_MONITORING", "/srv:100,/mnt/dest:20", 1);
    setenv("MONITOR_START_HIGH", "yes", 1);
    setenv("IGNORE_LIMITS_WITHOUT_SESSION", "0", 1);
    setenv("DAEMONIZE", "false", 1);
    setenv("BANDWIDTH_LIMIT_KBPS", "8000", 1);

    auto cfg = khepri_load_config_from_env();
    CPPUNIT_ASSERT(cfg);
    CPPUNIT_ASSERT_EQUAL(std::string("/srv/in"), cfg->incoming_path);
    CPPUNIT_ASSERT_EQUAL(5000, cfg->service_timer_ms);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(40.5, cfg->max_cpu_usage, 1e-9);
    CPPUNIT_ASSERT_EQUAL(size_t(2), cfg->blacklisted_processes.size());
    CPPUNIT_ASSERT_EQUAL(std::string("Acquire"), cfg->blacklisted_processes[1]);
    CPPUNIT_ASSERT_EQUAL(size_t(2), cfg->space_monitoring.size());
    CPPUNIT_ASSERT_EQUAL(uint64_t(20), cfg->space_monitoring[1].threshold_gb);
    CPPUNIT_ASSERT(cfg->monitor_start_high);
    CPPUNIT_ASSERT(!cfg->ignore_limits_without_session);
    CPPUNIT_ASSERT(!cfg->daemonize);
    CPPUNIT_ASSERT_EQUAL(uint64_t(8000), cfg->bandwidth_limit_kbps);
    CPPUNIT_ASSERT_EQUAL(std::string("/mnt/dest/.khepri-tmp"), cfg->tmp_transfer_path());
}

//------------------------------------------------------------------------------
// Out-of-range tunables are pulled into range, unparsable ones keep defaults
//------------------------------------------------------------------------------
void ConfigTest::ClampingTest() {
    setenv("CPU_PROBATION", "0", 1);
    setenv("DISK_INTERVAL_MS", "5", 1);
    setenv("MAX_CPU_USAGE", "250", 1);
    setenv("GRACE_PERIOD_DAYS", "-4", 1);
    setenv("COOLDOWN_CYCLES", "-1", 1);
    setenv("MAX_COPY_RETRIES", "0", 1);
    setenv("DISK_PROBATION", "lots", 1);
    setenv("LOG_LEVEL", "chatty", 1);

    auto cfg = khepri_load_config_from_env();
    CPPUNIT_ASSERT(cfg);
    CPPUNIT_ASSERT_EQUAL(1, cfg->cpu_probation);
    CPPUNIT_ASSERT_EQUAL(50, cfg->disk_interval_ms);
    CPPUNIT_ASSERT_DOUBLES_EQUAL(100.0, cfg->max_cpu_usage, 1e-9);
    CPPUNIT_ASSERT_EQUAL(1, cfg->grace_period_days);
    CPPUNIT_ASSERT_EQUAL(0, cfg->cooldown_cycles);
    CPPUNIT_ASSERT_EQUAL(1, cfg->max_copy_retries);
    CPPUNIT_ASSERT_EQUAL(40, cfg->disk_probation);
    CPPUNIT_ASSERT_EQUAL(std::string("info"), cfg->log_level);
}

void ConfigTest::RejectedTest() {
    setenv("SERVICE_TIMER_MS", "999", 1);
    CPPUNIT_ASSERT(!khepri_load_config_from_env());
    unsetenv("SERVICE_TIMER_MS");

    setenv("INCOMING_PATH", "relative/in", 1);
    CPPUNIT_ASSERT(!khepri_load_config_from_env());
    unsetenv("INCOMING_PATH");

    setenv("TMP_TRANSFER_DIR", "a/b", 1);
    CPPUNIT_ASSERT(!khepri_load_config_from_env());
    unsetenv("TMP_TRANSFER_DIR");

    setenv("MARKER_FILE", "../marker", 1);
    CPPUNIT_ASSERT(!khepri_load_config_from_env());
    unsetenv("MARKER_FILE");

    setenv("SPACE_MONITORING", "/data", 1);
    CPPUNIT_ASSERT(!khepri_load_config_from_env());
    unsetenv("SPACE_MONITORING");

    CPPUNIT_ASSERT(khepri_load_config_from_env());
}

//------------------------------------------------------------------------------
// Startup checks against the filesystem
//------------------------------------------------------------------------------
void ConfigTest::PathCheckTest() {
    ScratchDir dir;
    khepri_test_mkdir(dir / "incoming");
    khepri_test_mkdir(dir / "managed");
    khepri_test_mkdir(dir / "dest");

    Config cfg;
    cfg.incoming_path = dir / "incoming";
    cfg.managed_path = dir / "managed";
    cfg.destination_path = dir / "dest";
    cfg.home_root = dir / "home";
    cfg.space_monitoring = {{dir.path(), 1}};

    // Temporary directory missing.
    CPPUNIT_ASSERT(!khepri_check_config_paths(cfg));

    khepri_test_mkdir(cfg.tmp_transfer_path());
    CPPUNIT_ASSERT(khepri_check_config_paths(cfg));

    cfg.space_monitoring.push_back({dir / "no-such-drive", 1});
    CPPUNIT_ASSERT(!khepri_check_config_paths(cfg));
    cfg.space_monitoring.pop_back();

    cfg.destination_path = dir / "unreachable";
    CPPUNIT_ASSERT(!khepri_check_config_paths(cfg));
}
