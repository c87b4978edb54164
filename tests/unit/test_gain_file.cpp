// SPDX-License-Identifier: BSD-3-Clause
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "recede/io/config_loader.hpp"
#include "recede/io/gain_file.hpp"

using namespace recede;
using namespace recede::io;

namespace fs = std::filesystem;

namespace {

class TempDir : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("recede_io_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path write(const std::string& name, const std::string& text) {
        fs::path p = dir_ / name;
        std::ofstream(p) << text;
        return p;
    }

    fs::path dir_;
};

constexpr const char* kFullGain =
    R"({"theta": 1, "position": 2, "obstacle": 3, "u_accel": 4,
        "u_yaw_rate": 5, "terminal": 6, "impatience": 7, "speed": 8})";

}  // namespace

// ── Gain file ────────────────────────────────────────────────────────────────

TEST(GainFile, ParsesAllEightGains) {
    Gain g = parseGain(parseJson(kFullGain));
    EXPECT_EQ(g.toArray(), (std::array<Scalar, 8>{1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST(GainFile, MissingKeyIsRejected) {
    EXPECT_THROW((void)parseGain(parseJson(R"({"theta": 1})")), std::runtime_error);
}

TEST(GainFile, NegativeOrNonNumericRejected) {
    std::string negative = kFullGain;
    negative.replace(negative.find("\"speed\": 8"), 10, "\"speed\": -1");
    EXPECT_THROW((void)parseGain(parseJson(negative)), std::runtime_error);

    std::string text = kFullGain;
    text.replace(text.find("\"theta\": 1"), 10, "\"theta\": \"1\"");
    EXPECT_THROW((void)parseGain(parseJson(text)), std::runtime_error);
}

TEST_F(TempDir, LoadGainFromFile) {
    auto path = write("gain.json", kFullGain);
    EXPECT_EQ(loadGainJSON(path).terminal, 6);
    ASSERT_TRUE(loadGainIfPresent(path).has_value());
    EXPECT_FALSE(loadGainIfPresent(dir_ / "absent.json").has_value());
}

TEST_F(TempDir, CorruptGainFileNamesThePath) {
    auto path = write("gain.json", "{\"theta\": ");
    try {
        (void)loadGainJSON(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("gain.json"), std::string::npos);
    }
}

// ── Planner config ───────────────────────────────────────────────────────────

TEST(ConfigLoader, EmptyObjectKeepsDefaults) {
    auto o = parsePlannerOptions(parseJson("{}"));
    EXPECT_EQ(o.formulation, FormulationConfig{});
    EXPECT_EQ(o.gain, Gain{});
    EXPECT_EQ(o.session.startRetries, 5);
    EXPECT_EQ(o.session.backend, session::SolverBackend::kProcess);
}

TEST(ConfigLoader, ReadsEveryGroup) {
    auto o = parsePlannerOptions(parseJson(R"({
        "N": 8, "SV_N": 2, "WP_N": 10, "ts": 0.05,
        "Q_obstacle": 50, "Q_n": 2, "Q_speed": 0.5,
        "retries": 3, "stop_poll_interval_ms": 10, "stop_max_polls": 4,
        "backend": "in_process", "build_mode": "debug",
        "build_dir": "/tmp/recede", "solver_name": "mpc",
        "solver": {"max_iterations": 20, "time_limit_ms": 50},
        "gain_file": "", "stationary_epsilon": 0.2
    })"));

    EXPECT_EQ(o.formulation.horizon, 8);
    EXPECT_EQ(o.formulation.socialVehicles, 2);
    EXPECT_EQ(o.formulation.referencePoints, 10);
    EXPECT_NEAR(o.formulation.ts, 0.05, 1e-12);
    EXPECT_EQ(o.gain.obstacle, 50);
    EXPECT_EQ(o.gain.terminal, 2);
    EXPECT_EQ(o.gain.speed, 0.5);
    EXPECT_EQ(o.gain.theta, Gain{}.theta);

    EXPECT_EQ(o.session.startRetries, 3);
    EXPECT_EQ(o.session.stopPollInterval, std::chrono::milliseconds(10));
    EXPECT_EQ(o.session.stopMaxPolls, 4);
    EXPECT_EQ(o.session.backend, session::SolverBackend::kInProcess);
    EXPECT_EQ(o.session.buildMode, session::BuildMode::kDebug);
    EXPECT_EQ(o.session.buildDirectory, fs::path("/tmp/recede"));
    EXPECT_EQ(o.session.solverName, "mpc");
    EXPECT_EQ(o.session.solverSettings.maxIterations, 20);
    EXPECT_EQ(o.session.solverSettings.timeLimitMs, 50);

    EXPECT_TRUE(o.gainFile.empty());
    EXPECT_NEAR(o.stationaryEpsilon, 0.2, 1e-12);
}

TEST(ConfigLoader, UnknownEnumRejected) {
    EXPECT_THROW((void)parsePlannerOptions(parseJson(R"({"backend": "cloud"})")),
                 std::runtime_error);
    EXPECT_THROW((void)parsePlannerOptions(parseJson(R"({"build_mode": "fast"})")),
                 std::runtime_error);
    EXPECT_THROW((void)parsePlannerOptions(parseJson(R"({"N": "eleven"})")),
                 std::runtime_error);
}

TEST_F(TempDir, LoadPlannerOptionsFromFile) {
    auto path = write("planner.json", R"({"N": 6})");
    EXPECT_EQ(loadPlannerOptionsJSON(path).formulation.horizon, 6);
    EXPECT_THROW((void)loadPlannerOptionsJSON(dir_ / "absent.json"), std::runtime_error);
}
