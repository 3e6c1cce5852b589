#include "EngineConfig.hpp"
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>

namespace skiff {

QString fallbackDownloadDir() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + "/Downloads";
    return dir;
}

EngineConfig loadEngineConfig(const QSettings &s) {
    EngineConfig cfg;
    cfg.maxConcurrent = std::clamp(s.value("Transfers/maxConcurrent", 3).toInt(), 1, 16);
    cfg.shutdownTimeoutMs = std::max(0, s.value("Transfers/shutdownTimeoutMs", 5000).toInt());
    cfg.followUpDelayMs = std::max(0, s.value("Refresh/followUpDelayMs", 500).toInt());

    const QString fallback = fallbackDownloadDir();
    QString dir = QDir::cleanPath(s.value("Downloads/defaultDir", fallback).toString().trimmed());
    if (dir.isEmpty() || dir == QLatin1String("."))
        dir = fallback;
    cfg.defaultDownloadDir = dir;
    return cfg;
}

void saveEngineConfig(QSettings &s, const EngineConfig &cfg) {
    s.setValue("Transfers/maxConcurrent", std::clamp(cfg.maxConcurrent, 1, 16));
    s.setValue("Transfers/shutdownTimeoutMs", cfg.shutdownTimeoutMs);
    s.setValue("Refresh/followUpDelayMs", cfg.followUpDelayMs);
    s.setValue("Downloads/defaultDir", cfg.defaultDownloadDir);
    s.sync();
}

} // namespace skiff
