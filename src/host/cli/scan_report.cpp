#include "host/cli/scan_report.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "core/iso8601.hpp"

#include <utility>

namespace uuidstamp::host {

namespace {

enum class Position { Offset, Index };

// Leading columns shared by match and error lines.
[[nodiscard]] QStringList leading_fields(const ScanEntry& entry, const QString& file, Position position) {
    QStringList fields;
    if (!file.isEmpty()) {
        fields.append(file);
    }
    if (position == Position::Offset) {
        fields.append(QString::number(static_cast<qulonglong>(entry.candidate.offset)));
    }
    fields.append(QString::fromStdString(entry.candidate.text));
    return fields;
}

[[nodiscard]] QString render_match_line(const ScanEntry& entry, const QString& file, Position position) {
    const auto& decoded = entry.decoded.unwrap();
    auto fields = leading_fields(entry, file, position);
    fields.append(QString::fromStdString(decoded.display_instant));
    if (decoded.relative) {
        fields.append(QString::fromStdString(*decoded.relative));
    }
    return fields.join(QLatin1Char('\t'));
}

[[nodiscard]] QString render_error_line(const ScanEntry& entry, const QString& file, Position position) {
    return leading_fields(entry, file, position).join(QLatin1Char('\t')) + QStringLiteral("\terror: ") +
           QString::fromStdString(entry.decoded.unwrap_err().message);
}

[[nodiscard]] QJsonObject entry_to_json(const ScanEntry& entry, const QString& file, Position position) {
    QJsonObject obj;
    if (!file.isEmpty()) {
        obj.insert(QStringLiteral("file"), file);
    }
    obj.insert(position == Position::Offset ? QStringLiteral("offset") : QStringLiteral("index"),
               static_cast<qint64>(entry.candidate.offset));
    obj.insert(QStringLiteral("uuid"), QString::fromStdString(entry.candidate.text));
    if (entry.decoded.is_err()) {
        const auto& error = entry.decoded.unwrap_err();
        obj.insert(QStringLiteral("error"), QString::fromStdString(error.message));
        const auto code = error_code_name(error.code);
        obj.insert(QStringLiteral("code"), QString::fromLatin1(code.data(), static_cast<qsizetype>(code.size())));
        return obj;
    }
    const auto& decoded = entry.decoded.unwrap();
    obj.insert(QStringLiteral("instant"), QString::fromStdString(decoded.display_instant));
    obj.insert(QStringLiteral("unixSeconds"), static_cast<qint64>(decoded.unix_seconds));
    if (decoded.relative) {
        obj.insert(QStringLiteral("relative"), QString::fromStdString(*decoded.relative));
    }
    return obj;
}

[[nodiscard]] ScanReport text_report(const std::vector<ScanSource>& sources, Position position) {
    ScanReport report;
    QStringList out;
    QStringList err;
    for (const auto& source : sources) {
        for (const auto& entry : source.entries) {
            if (entry.decoded.is_ok()) {
                out.append(render_match_line(entry, source.file, position));
            } else {
                err.append(render_error_line(entry, source.file, position));
                ++report.failures;
            }
        }
    }
    if (!out.isEmpty()) report.out = out.join(QLatin1Char('\n')) + QLatin1Char('\n');
    if (!err.isEmpty()) report.err = err.join(QLatin1Char('\n')) + QLatin1Char('\n');
    return report;
}

[[nodiscard]] ScanReport json_report(const std::vector<ScanSource>& sources, Position position) {
    ScanReport report;
    QJsonArray matches;
    for (const auto& source : sources) {
        for (const auto& entry : source.entries) {
            if (entry.decoded.is_err()) ++report.failures;
            matches.append(entry_to_json(entry, source.file, position));
        }
    }
    QJsonObject root;
    root.insert(QStringLiteral("matches"), matches);
    report.out = QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return report;
}

[[nodiscard]] std::vector<ScanSource> unnamed(const std::vector<ScanEntry>& entries) {
    return {ScanSource{QString{}, entries}};
}

[[nodiscard]] Result<ResolvedCliOptions> invalid(const QString& message) {
    return Result<ResolvedCliOptions>::err(Error{message.toStdString(), ErrorCode::InvalidArgument});
}

} // namespace

ScanSource scan_source(QString file, std::string_view text,
                       const ScanOptions& options, Instant now) {
    return ScanSource{std::move(file), scan_text(text, options, now)};
}

ScanReport format_scan_report(const std::vector<ScanSource>& sources) {
    return text_report(sources, Position::Offset);
}

ScanReport format_scan_report(const std::vector<ScanEntry>& entries) {
    return text_report(unnamed(entries), Position::Offset);
}

ScanReport format_scan_report_json(const std::vector<ScanSource>& sources) {
    return json_report(sources, Position::Offset);
}

ScanReport format_scan_report_json(const std::vector<ScanEntry>& entries) {
    return json_report(unnamed(entries), Position::Offset);
}

ScanReport format_decode_report(const std::vector<ScanEntry>& entries) {
    return text_report(unnamed(entries), Position::Index);
}

ScanReport format_decode_report_json(const std::vector<ScanEntry>& entries) {
    return json_report(unnamed(entries), Position::Index);
}

Result<ResolvedCliOptions> resolve_cli_options(const DisplaySettings& stored,
                                               const CliOverrides& overrides) {
    auto settings = stored;
    if (overrides.noTimeAgo) {
        settings.time_ago_enabled = false;
    }
    if (overrides.local) {
        settings.use_local_time = true;
    }
    if (!overrides.utcOffsetMinutes.isEmpty()) {
        bool ok = false;
        const int minutes = overrides.utcOffsetMinutes.toInt(&ok);
        if (!ok || minutes != normalize_utc_offset_minutes(minutes)) {
            return invalid(QStringLiteral("--utc-offset must be an integer number of minutes within +/-%1")
                               .arg(kMaxUtcOffsetMinutes));
        }
        settings.utc_offset_minutes = minutes;
        settings.use_local_time = overrides.local;
    }

    ResolvedCliOptions resolved;
    resolved.scan = to_scan_options(settings);
    resolved.now = Instant::now();
    if (!overrides.now.isEmpty()) {
        const auto parsed = parse_iso8601(overrides.now.toStdString());
        if (parsed.is_err()) {
            return invalid(QStringLiteral("--now: ") + QString::fromStdString(parsed.unwrap_err().message));
        }
        resolved.now = Instant(parsed.unwrap());
    }
    return Result<ResolvedCliOptions>::ok(std::move(resolved));
}

std::vector<ScanEntry> decode_arguments(const QStringList& uuids,
                                        const ScanOptions& options,
                                        Instant now) {
    std::vector<ScanEntry> entries;
    entries.reserve(static_cast<size_t>(uuids.size()));
    for (qsizetype i = 0; i < uuids.size(); ++i) {
        CandidateUuid candidate{uuids.at(i).toStdString(), static_cast<size_t>(i)};
        auto decoded = decode_timestamp(candidate.text, options, now);
        entries.push_back(ScanEntry{std::move(candidate), std::move(decoded)});
    }
    return entries;
}

} // namespace uuidstamp::host
