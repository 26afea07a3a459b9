// -----------------------------------------------------------------------------
// Khepri Relay: unit test runner
// -----------------------------------------------------------------------------

#include "khepri_common.hpp"

#include <cppunit/extensions/TestFactoryRegistry.h>
#include <cppunit/ui/text/TestRunner.h>

#include <cstdlib>
#include <string>

int main(int argc, char** argv) {
    const char* level = getenv("KHEPRI_TEST_LOG_LEVEL");
    khepri_set_log_level(level ? level : "error");

    CppUnit::TextUi::TestRunner runner;
    runner.addTest(CppUnit::TestFactoryRegistry::getRegistry().makeTest());

    // Optional argument selects a single suite or test by name.
    std::string selected = argc > 1 ? argv[1] : "";
    return runner.run(selected) ? 0 : 1;
}
