#pragma once

#include <QString>

#include "orchestrator/RequestOrchestrator.hpp"

/**
 * Application configuration loaded from an INI file (default "config.ini")
 * with RANGESCOPE_* environment overrides for deployment-specific values.
 */
struct AppConfig {
    QString apiBaseUrl = QStringLiteral("http://localhost:8000");
    int apiTimeoutMs = 15000;

    OrchestratorSettings orchestrator;
    QString defaultDeposit = QStringLiteral("1000");

    double minZoomTicks = 50.0;
    double minZoomSeconds = 3600.0;

    static AppConfig load(const QString& path = QStringLiteral("config.ini"));
};
