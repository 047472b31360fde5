// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license
// Test runner: quiet logging unless ISDS_TEST_LOGLEVEL says otherwise

#include "test_logging.hpp"
#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

int main(int argc, char* argv[]) {
    const char* level = std::getenv("ISDS_TEST_LOGLEVEL");
    InitializeTestLogging(level ? std::string(level) : std::string("off"));

    const int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
