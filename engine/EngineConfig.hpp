// Engine tunables persisted in QSettings.
#pragma once
#include <QString>

class QSettings;

namespace skiff {

struct EngineConfig {
    int maxConcurrent = 3;        // Transfers/maxConcurrent, clamped to [1,16]
    int shutdownTimeoutMs = 5000; // Transfers/shutdownTimeoutMs
    int followUpDelayMs = 500;    // Refresh/followUpDelayMs
    QString defaultDownloadDir;   // Downloads/defaultDir
};

QString fallbackDownloadDir();

EngineConfig loadEngineConfig(const QSettings &s);
void saveEngineConfig(QSettings &s, const EngineConfig &cfg);

} // namespace skiff
