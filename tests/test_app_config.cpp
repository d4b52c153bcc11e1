/*
RangeScope — AppConfig Tests
Role: Verify INI loading, validation fallbacks and environment overrides
Testing Strategy: Write INI files into a temporary directory → load → assert fields
Coverage: Defaults, overrides, invalid values, timeframe clamping, env precedence
*/
#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

#include "AppConfig.hpp"

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        qunsetenv("RANGESCOPE_API_BASE_URL");
        qunsetenv("RANGESCOPE_API_TIMEOUT_MS");
    }

    void TearDown() override {
        qunsetenv("RANGESCOPE_API_BASE_URL");
        qunsetenv("RANGESCOPE_API_TIMEOUT_MS");
    }

    QString writeIni(const QString& contents) {
        const QString path = dir.filePath("config.ini");
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
        QTextStream(&file) << contents;
        return path;
    }

    QTemporaryDir dir;
};

TEST_F(AppConfigTest, MissingFileYieldsDefaults) {
    const AppConfig cfg = AppConfig::load(dir.filePath("absent.ini"));
    EXPECT_EQ(cfg.apiBaseUrl, "http://localhost:8000");
    EXPECT_EQ(cfg.apiTimeoutMs, 15000);
    EXPECT_EQ(cfg.orchestrator.distributionDebounceMs, 350);
    EXPECT_EQ(cfg.orchestrator.allocationDebounceMs, 400);
    EXPECT_EQ(cfg.orchestrator.aprDebounceMs, 400);
    EXPECT_EQ(cfg.orchestrator.tickWindow, 6000);
    EXPECT_EQ(cfg.orchestrator.defaultRangePreset, "most_ticks");
    EXPECT_EQ(cfg.orchestrator.timeframeDays, 14);
    EXPECT_EQ(cfg.orchestrator.calculationMethod, CalculationMethod::AverageLiquidity);
    EXPECT_EQ(cfg.defaultDeposit, "1000");
    EXPECT_DOUBLE_EQ(cfg.minZoomTicks, 50.0);
    EXPECT_DOUBLE_EQ(cfg.minZoomSeconds, 3600.0);
}

TEST_F(AppConfigTest, IniValuesOverrideDefaults) {
    const QString path = writeIni(
        "[api]\n"
        "baseUrl=https://pools.example.org\n"
        "timeoutMs=5000\n"
        "[debounce]\n"
        "distributionMs=200\n"
        "[range]\n"
        "defaultPreset=fifty_percent\n"
        "tickWindow=1200\n"
        "[simulation]\n"
        "timeframeDays=30\n"
        "calculationMethod=current_liquidity\n"
        "defaultDeposit=2500\n"
        "[charts]\n"
        "minZoomTicks=120\n");

    const AppConfig cfg = AppConfig::load(path);
    EXPECT_EQ(cfg.apiBaseUrl, "https://pools.example.org");
    EXPECT_EQ(cfg.apiTimeoutMs, 5000);
    EXPECT_EQ(cfg.orchestrator.distributionDebounceMs, 200);
    EXPECT_EQ(cfg.orchestrator.allocationDebounceMs, 400);
    EXPECT_EQ(cfg.orchestrator.defaultRangePreset, "fifty_percent");
    EXPECT_EQ(cfg.orchestrator.tickWindow, 1200);
    EXPECT_EQ(cfg.orchestrator.timeframeDays, 30);
    EXPECT_EQ(cfg.orchestrator.calculationMethod, CalculationMethod::CurrentLiquidity);
    EXPECT_EQ(cfg.defaultDeposit, "2500");
    EXPECT_DOUBLE_EQ(cfg.minZoomTicks, 120.0);
}

TEST_F(AppConfigTest, InvalidValuesFallBack) {
    const QString path = writeIni(
        "[api]\n"
        "timeoutMs=soon\n"
        "[debounce]\n"
        "aprMs=-5\n"
        "[charts]\n"
        "minZoomSeconds=0\n");

    const AppConfig cfg = AppConfig::load(path);
    EXPECT_EQ(cfg.apiTimeoutMs, 15000);
    EXPECT_EQ(cfg.orchestrator.aprDebounceMs, 400);
    EXPECT_DOUBLE_EQ(cfg.minZoomSeconds, 3600.0);
}

TEST_F(AppConfigTest, TimeframeIsClamped) {
    const AppConfig cfg = AppConfig::load(writeIni("[simulation]\ntimeframeDays=9999\n"));
    EXPECT_EQ(cfg.orchestrator.timeframeDays, RequestOrchestrator::MAX_TIMEFRAME_DAYS);
}

TEST_F(AppConfigTest, EnvironmentWinsOverIni) {
    const QString path = writeIni("[api]\nbaseUrl=https://from-ini.example\ntimeoutMs=5000\n");
    qputenv("RANGESCOPE_API_BASE_URL", "https://from-env.example");
    qputenv("RANGESCOPE_API_TIMEOUT_MS", "750");

    const AppConfig cfg = AppConfig::load(path);
    EXPECT_EQ(cfg.apiBaseUrl, "https://from-env.example");
    EXPECT_EQ(cfg.apiTimeoutMs, 750);
}

TEST_F(AppConfigTest, InvalidEnvironmentTimeoutIsIgnored) {
    qputenv("RANGESCOPE_API_TIMEOUT_MS", "fast");
    const AppConfig cfg = AppConfig::load(dir.filePath("absent.ini"));
    EXPECT_EQ(cfg.apiTimeoutMs, 15000);
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
