// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license
// Unit tests for util/logging - component and level lookup

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"

using isds::util::LogManager;

TEST_CASE("LogManager - level names", "[logging][unit]") {
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        REQUIRE(LogManager::IsValidLevel(level));
    }
    REQUIRE_FALSE(LogManager::IsValidLevel("loud"));
    REQUIRE_FALSE(LogManager::IsValidLevel(""));
}

TEST_CASE("LogManager - components", "[logging][unit]") {
    REQUIRE(LogManager::Components().size() == 6);
    REQUIRE(LogManager::IsComponent("consensus"));
    REQUIRE(LogManager::IsComponent("default"));
    REQUIRE_FALSE(LogManager::IsComponent("network"));
    REQUIRE_FALSE(LogManager::IsComponent("all"));

    // Every component has its own logger
    for (const auto& component : LogManager::Components()) {
        REQUIRE(LogManager::GetLogger(component)->name() == component);
    }
    REQUIRE(LogManager::GetLogger("unknown")->name() == "default");
    REQUIRE_FALSE(LogManager::SetComponentLevel("unknown", "debug"));
}
