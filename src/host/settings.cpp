#include "host/settings.hpp"

#include <QSettings>

#include <algorithm>

namespace uuidstamp::host {
namespace {

constexpr auto kSettingsTimeAgoEnabled = "display/time_ago_enabled";
constexpr auto kSettingsUseLocalTime = "display/use_local_time";
constexpr auto kSettingsUtcOffsetMinutes = "display/utc_offset_minutes";
constexpr auto kSettingsTransientMs = "display/transient_ms";

} // namespace

int normalize_utc_offset_minutes(int minutes) {
    return std::clamp(minutes, -kMaxUtcOffsetMinutes, kMaxUtcOffsetMinutes);
}

int normalize_transient_ms(int ms) {
    return std::clamp(ms, kMinTransientMs, kMaxTransientMs);
}

DisplaySettings load_display_settings() {
    QSettings settings;
    DisplaySettings out;
    out.time_ago_enabled =
        settings.value(QString::fromLatin1(kSettingsTimeAgoEnabled), true).toBool();
    out.use_local_time =
        settings.value(QString::fromLatin1(kSettingsUseLocalTime), false).toBool();
    out.utc_offset_minutes = normalize_utc_offset_minutes(
        settings.value(QString::fromLatin1(kSettingsUtcOffsetMinutes), 0).toInt());
    out.transient_ms = normalize_transient_ms(
        settings.value(QString::fromLatin1(kSettingsTransientMs), kDefaultTransientMs).toInt());
    return out;
}

void save_display_settings(const DisplaySettings& s) {
    QSettings settings;
    settings.setValue(QString::fromLatin1(kSettingsTimeAgoEnabled), s.time_ago_enabled);
    settings.setValue(QString::fromLatin1(kSettingsUseLocalTime), s.use_local_time);
    settings.setValue(QString::fromLatin1(kSettingsUtcOffsetMinutes),
                      normalize_utc_offset_minutes(s.utc_offset_minutes));
    settings.setValue(QString::fromLatin1(kSettingsTransientMs),
                      normalize_transient_ms(s.transient_ms));
}

ScanOptions to_scan_options(const DisplaySettings& settings, const QDateTime& reference) {
    ScanOptions options;
    options.time_ago_enabled = settings.time_ago_enabled;
    options.utc_offset_seconds = settings.use_local_time
        ? static_cast<int64_t>(reference.offsetFromUtc())
        : static_cast<int64_t>(normalize_utc_offset_minutes(settings.utc_offset_minutes)) * 60;
    return options;
}

} // namespace uuidstamp::host
