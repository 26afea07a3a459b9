// -----------------------------------------------------------------------------
// Khepri Relay: timestamps, string and filesystem helper tests
// -----------------------------------------------------------------------------

#include "khepri_test_util.hpp"

#include <algorithm>

//------------------------------------------------------------------------------
// Declaration
//------------------------------------------------------------------------------
class CommonTest : public CppUnit::TestCase {
public:
    CPPUNIT_TEST_SUITE(CommonTest);
    CPPUNIT_TEST(TimestampFormatTest);
    CPPUNIT_TEST(DirNameAgeTest);
    CPPUNIT_TEST(InvalidDirNameTest);
    CPPUNIT_TEST(CollisionSuffixTest);
    CPPUNIT_TEST(SplitTrimTest);
    CPPUNIT_TEST(HumanReadableTest);
    CPPUNIT_TEST(MoveCollisionTest);
    CPPUNIT_TEST(MoveEntriesTest);
    CPPUNIT_TEST(DirSizeTest);
    CPPUNIT_TEST_SUITE_END();

    void TimestampFormatTest();
    void DirNameAgeTest();
    void InvalidDirNameTest();
    void CollisionSuffixTest();
    void SplitTrimTest();
    void HumanReadableTest();
    void MoveCollisionTest();
    void MoveEntriesTest();
    void DirSizeTest();
};

CPPUNIT_TEST_SUITE_REGISTRATION(CommonTest);

static std::tm make_tm(int year, int month, int day, int hour = 12, int minute = 0, int second = 0) {
    std::tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    t.tm_isdst = -1;
    return t;
}

//------------------------------------------------------------------------------
// Generated names have the fixed layout and parse back
//------------------------------------------------------------------------------
void CommonTest::TimestampFormatTest() {
    std::string ts = khepri_timestamp();
    CPPUNIT_ASSERT_EQUAL(constants::TIMESTAMP_LENGTH, ts.size());
    CPPUNIT_ASSERT(ts[4] == '-' && ts[7] == '-');
    CPPUNIT_ASSERT(ts.compare(10, 2, "__") == 0);

    std::tm parsed{};
    CPPUNIT_ASSERT(khepri_parse_timestamp("2024-02-29__23-59-58", parsed));
    CPPUNIT_ASSERT_EQUAL(124, parsed.tm_year);
    CPPUNIT_ASSERT_EQUAL(1, parsed.tm_mon);
    CPPUNIT_ASSERT_EQUAL(29, parsed.tm_mday);
    CPPUNIT_ASSERT_EQUAL(23, parsed.tm_hour);
    CPPUNIT_ASSERT_EQUAL(59, parsed.tm_min);
    CPPUNIT_ASSERT_EQUAL(58, parsed.tm_sec);
}

//------------------------------------------------------------------------------
// Whole days between the name and the reference, floored
//------------------------------------------------------------------------------
void CommonTest::DirNameAgeTest() {
    std::tm ref = make_tm(2024, 2, 10, 12, 0, 0);

    CPPUNIT_ASSERT_EQUAL(40, khepri_dir_name_to_age("2024-01-01__12-00-00", ref));
    CPPUNIT_ASSERT_EQUAL(39, khepri_dir_name_to_age("2024-01-01__12-00-01", ref));
    CPPUNIT_ASSERT_EQUAL(0, khepri_dir_name_to_age("2024-02-10__11-00-00", ref));

    // Names in the future count as age zero.
    CPPUNIT_ASSERT_EQUAL(0, khepri_dir_name_to_age("2024-03-01__00-00-00", ref));

    // Across a leap day.
    CPPUNIT_ASSERT_EQUAL(30, khepri_dir_name_to_age("2024-02-10__12-00-00", make_tm(2024, 3, 11)));

    // time_t overload against the wall clock.
    time_t now = time(nullptr);
    CPPUNIT_ASSERT_EQUAL(40, khepri_dir_name_to_age(khepri_test_days_ago(40, now), now));
}

void CommonTest::InvalidDirNameTest() {
    std::tm ref = make_tm(2024, 2, 10);
    const char* bad[] = {
        "", "orphaned", "2024-01-01", "2024-01-01 12-00-00", "2024-01-01__12:00:00",
        "2024-13-01__00-00-00", "2023-02-29__00-00-00", "2024-01-01__24-00-00",
        "2024-01-01__12-00-0x", "2024-01-01__12-00-00x", "1969-12-31__23-59-59",
    };
    for (const char* name : bad) {
        CPPUNIT_ASSERT_EQUAL_MESSAGE(name, -1, khepri_dir_name_to_age(name, ref));
    }
}

//------------------------------------------------------------------------------
// Names produced by the collision-safe move still carry their age
//------------------------------------------------------------------------------
void CommonTest::CollisionSuffixTest() {
    std::tm ref = make_tm(2024, 2, 10);
    CPPUNIT_ASSERT_EQUAL(40, khepri_dir_name_to_age("2024-01-01__12-00-00_2024-02-09__08-00-00", ref));
    CPPUNIT_ASSERT_EQUAL(40, khepri_dir_name_to_age("2024-01-01__12-00-00_2024-02-09__08-00-00-3", ref));
}

void CommonTest::SplitTrimTest() {
    CPPUNIT_ASSERT_EQUAL(std::string("abc"), khepri_trim("  abc\t\r\n"));
    CPPUNIT_ASSERT_EQUAL(std::string(), khepri_trim(" \t "));

    std::vector<std::string> parts = khepri_split(" a, b ,,c ,", ',');
    CPPUNIT_ASSERT_EQUAL(size_t(3), parts.size());
    CPPUNIT_ASSERT_EQUAL(std::string("a"), parts[0]);
    CPPUNIT_ASSERT_EQUAL(std::string("b"), parts[1]);
    CPPUNIT_ASSERT_EQUAL(std::string("c"), parts[2]);
    CPPUNIT_ASSERT(khepri_split("", ',').empty());
}

void CommonTest::HumanReadableTest() {
    CPPUNIT_ASSERT_EQUAL(std::string("512 Bytes"), khepri_bytes_to_human(512));
    CPPUNIT_ASSERT_EQUAL(std::string("1.50 KB"), khepri_bytes_to_human(1536));
    CPPUNIT_ASSERT_EQUAL(std::string("2.00 GB"), khepri_bytes_to_human(2ULL * 1024 * 1024 * 1024));

    CPPUNIT_ASSERT_EQUAL(std::string("42 seconds"), khepri_seconds_to_human(42));
    CPPUNIT_ASSERT_EQUAL(std::string("2 minutes 5 seconds"), khepri_seconds_to_human(125));
    CPPUNIT_ASSERT_EQUAL(std::string("12 hours 0 minutes"), khepri_seconds_to_human(12 * 3600));
    CPPUNIT_ASSERT_EQUAL(std::string("1 days 1 hours"), khepri_seconds_to_human(90000));
    CPPUNIT_ASSERT_EQUAL(std::string("0 seconds"), khepri_seconds_to_human(-5));
}

//------------------------------------------------------------------------------
// An occupied target gets a timestamp suffix; nothing is overwritten
//------------------------------------------------------------------------------
void CommonTest::MoveCollisionTest() {
    ScratchDir dir;
    khepri_test_write(dir / "a/data.txt", "first");
    khepri_test_write(dir / "b/data.txt", "second");
    khepri_test_write(dir / "target/data.txt", "existing");

    std::string first = khepri_move_collision_safe(dir / "a", dir / "moved");
    CPPUNIT_ASSERT_EQUAL(dir / "moved", first);

    std::string second = khepri_move_collision_safe(dir / "b", dir / "moved");
    CPPUNIT_ASSERT(!second.empty());
    CPPUNIT_ASSERT(second != first);
    CPPUNIT_ASSERT(second.compare(0, first.size() + 1, first + "_") == 0);

    CPPUNIT_ASSERT_EQUAL(std::string("first"), khepri_test_read(first + "/data.txt"));
    CPPUNIT_ASSERT_EQUAL(std::string("second"), khepri_test_read(second + "/data.txt"));
    CPPUNIT_ASSERT(!khepri_path_exists(dir / "a"));
    CPPUNIT_ASSERT(!khepri_path_exists(dir / "b"));

    // Missing source fails without touching the target.
    CPPUNIT_ASSERT(khepri_move_collision_safe(dir / "nope", dir / "target").empty());
    CPPUNIT_ASSERT_EQUAL(std::string("existing"), khepri_test_read(dir / "target/data.txt"));
}

void CommonTest::MoveEntriesTest() {
    ScratchDir dir;
    khepri_test_write(dir / "src/marker", "");
    khepri_test_write(dir / "src/one.txt", "1");
    khepri_test_write(dir / "src/sub/two.txt", "2");

    CPPUNIT_ASSERT(khepri_move_entries(dir / "src", dir / "dst/deep", "marker"));
    CPPUNIT_ASSERT_EQUAL(std::string("1"), khepri_test_read(dir / "dst/deep/one.txt"));
    CPPUNIT_ASSERT_EQUAL(std::string("2"), khepri_test_read(dir / "dst/deep/sub/two.txt"));
    CPPUNIT_ASSERT(khepri_path_exists(dir / "src/marker"));
    CPPUNIT_ASSERT(!khepri_path_exists(dir / "dst/deep/marker"));

    std::vector<std::string> left = khepri_list_dir(dir / "src", EntryKind::Any);
    CPPUNIT_ASSERT_EQUAL(size_t(1), left.size());
}

void CommonTest::DirSizeTest() {
    ScratchDir dir;
    khepri_test_write(dir / "t/a", std::string(100, 'x'));
    khepri_test_write(dir / "t/b/c", std::string(23, 'y'));
    khepri_test_mkdir(dir / "t/empty");

    CPPUNIT_ASSERT_EQUAL(uint64_t(123), khepri_dir_size(dir / "t"));
    CPPUNIT_ASSERT_EQUAL(uint64_t(0), khepri_dir_size(dir / "t/empty"));
    CPPUNIT_ASSERT_EQUAL(uint64_t(0), khepri_dir_size(dir / "missing"));

    std::vector<std::string> files = khepri_files_in_tree(dir / "t");
    std::sort(files.begin(), files.end());
    CPPUNIT_ASSERT_EQUAL(size_t(2), files.size());
    CPPUNIT_ASSERT_EQUAL(std::string("a"), files[0]);
    CPPUNIT_ASSERT_EQUAL(std::string("b/c"), files[1]);
}
