#include "AppConfig.hpp"

#include <QFile>
#include <QSettings>
#include <algorithm>

#include "RangeScopeLogging.hpp"

namespace {

int positiveInt(const QSettings& config, const char* key, int fallback) {
    bool ok = false;
    const int value = config.value(key, fallback).toInt(&ok);
    if (!ok || value < 0) {
        rsLog_Warning("Ignoring invalid config value for" << key);
        return fallback;
    }
    return value;
}

double positiveDouble(const QSettings& config, const char* key, double fallback) {
    bool ok = false;
    const double value = config.value(key, fallback).toDouble(&ok);
    if (!ok || value <= 0.0) {
        rsLog_Warning("Ignoring invalid config value for" << key);
        return fallback;
    }
    return value;
}

} // namespace

AppConfig AppConfig::load(const QString& path) {
    AppConfig cfg;

    if (!QFile::exists(path)) {
        rsLog_App("No config file at" << path << "- using defaults");
    }
    QSettings config(path, QSettings::IniFormat);

    cfg.apiBaseUrl = config.value("api/baseUrl", cfg.apiBaseUrl).toString();
    cfg.apiTimeoutMs = positiveInt(config, "api/timeoutMs", cfg.apiTimeoutMs);

    OrchestratorSettings& o = cfg.orchestrator;
    o.distributionDebounceMs = positiveInt(config, "debounce/distributionMs", o.distributionDebounceMs);
    o.allocationDebounceMs = positiveInt(config, "debounce/allocationMs", o.allocationDebounceMs);
    o.aprDebounceMs = positiveInt(config, "debounce/aprMs", o.aprDebounceMs);
    o.tickWindow = positiveInt(config, "range/tickWindow", o.tickWindow);
    o.defaultRangePreset = config.value("range/defaultPreset", QString::fromStdString(o.defaultRangePreset))
                               .toString().toStdString();
    o.timeframeDays = std::clamp(positiveInt(config, "simulation/timeframeDays", o.timeframeDays),
                                 RequestOrchestrator::MIN_TIMEFRAME_DAYS, RequestOrchestrator::MAX_TIMEFRAME_DAYS);
    const QString method = config.value("simulation/calculationMethod", "average_liquidity").toString();
    o.calculationMethod = (method == "current_liquidity") ? CalculationMethod::CurrentLiquidity
                                                          : CalculationMethod::AverageLiquidity;

    cfg.defaultDeposit = config.value("simulation/defaultDeposit", cfg.defaultDeposit).toString();
    cfg.minZoomTicks = positiveDouble(config, "charts/minZoomTicks", cfg.minZoomTicks);
    cfg.minZoomSeconds = positiveDouble(config, "charts/minZoomSeconds", cfg.minZoomSeconds);

    // Environment overrides
    const QString baseUrlEnv = qEnvironmentVariable("RANGESCOPE_API_BASE_URL");
    if (!baseUrlEnv.isEmpty()) cfg.apiBaseUrl = baseUrlEnv;

    const QString timeoutEnv = qEnvironmentVariable("RANGESCOPE_API_TIMEOUT_MS");
    if (!timeoutEnv.isEmpty()) {
        bool ok = false;
        const int timeout = timeoutEnv.toInt(&ok);
        if (ok && timeout >= 0) {
            cfg.apiTimeoutMs = timeout;
        } else {
            rsLog_Warning("Ignoring RANGESCOPE_API_TIMEOUT_MS=" << timeoutEnv);
        }
    }

    rsLog_App("Config loaded: API" << cfg.apiBaseUrl << "timeframe" << o.timeframeDays << "days");
    return cfg;
}
