#pragma once

#include "core/scan.hpp"

#include <QDateTime>

namespace uuidstamp::host {

inline constexpr int kMaxUtcOffsetMinutes = 14 * 60;
inline constexpr int kDefaultTransientMs = 5000;
inline constexpr int kMinTransientMs = 100;
inline constexpr int kMaxTransientMs = 60000;

/**
 * DisplaySettings - User-facing knobs persisted through QSettings.
 */
struct DisplaySettings {
    bool time_ago_enabled = true;
    bool use_local_time = false;
    int utc_offset_minutes = 0;
    int transient_ms = kDefaultTransientMs;

    bool operator==(const DisplaySettings&) const = default;
};

[[nodiscard]] int normalize_utc_offset_minutes(int minutes);
[[nodiscard]] int normalize_transient_ms(int ms);

// Reads display/* keys from the default QSettings, normalizing out-of-range values.
[[nodiscard]] DisplaySettings load_display_settings();

// Writes normalized values back to the default QSettings.
void save_display_settings(const DisplaySettings& settings);

// Maps settings onto core scan options. With use_local_time the offset of
// the host zone at `reference` wins over utc_offset_minutes.
[[nodiscard]] ScanOptions to_scan_options(const DisplaySettings& settings,
                                          const QDateTime& reference = QDateTime::currentDateTime());

} // namespace uuidstamp::host
