#pragma once
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>

#include "utils/Clock.hpp"

// Manually advanced time source.
struct FakeClock {
    TimePoint now = TimePoint(std::chrono::seconds(1700000000));

    Clock clock() {
        return [this] { return now; };
    }

    void advance(std::chrono::seconds s) { now += s; }
};

// Fresh directory per test, removed afterwards.
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
            ("bastion_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};
