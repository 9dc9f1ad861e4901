#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>

int main(int argc, char** argv) {
#ifdef RFS_LOG_DEBUG
    // REACTIVEFS_LOG=<anything but 0> turns the debug log on for the run
    char const* envLog = std::getenv("REACTIVEFS_LOG");
    RFS::set_logging_enabled(envLog && std::strcmp(envLog, "0") != 0);
    RFS::set_thread_name("TestMain");
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
