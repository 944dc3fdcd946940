#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QTextStream>

#include "host/logging.hpp"
#include "host/settings.hpp"
#include "host/cli/scan_report.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitIo = 2;

// Reads one named file, or stdin when `path` is empty.
bool read_input(const QString& path, QByteArray& out) {
    QFile file;
    if (path.isEmpty()) {
        if (!file.open(stdin, QIODevice::ReadOnly)) {
            qCCritical(uuidstampCliLog) << "cannot read stdin:" << file.errorString();
            return false;
        }
    } else {
        file.setFileName(path);
        if (!file.open(QIODevice::ReadOnly)) {
            qCCritical(uuidstampCliLog) << "cannot open" << path << ":" << file.errorString();
            return false;
        }
    }
    out = file.readAll();
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("uuidstamp");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("uuidstamp");
    app.setOrganizationDomain("uuidstamp.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Find version-1 UUIDs in text and show when they were generated."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption noTimeAgoOption(
        QStringList{QStringLiteral("no-time-ago")},
        QStringLiteral("Do not print relative times (overrides display/time_ago_enabled)."));
    parser.addOption(noTimeAgoOption);

    const QCommandLineOption utcOffsetOption(
        QStringList{QStringLiteral("utc-offset")},
        QStringLiteral("Shift printed instants by a fixed offset in minutes."),
        QStringLiteral("minutes"));
    parser.addOption(utcOffsetOption);

    const QCommandLineOption localOption(
        QStringList{QStringLiteral("local")},
        QStringLiteral("Print instants in the host's local time."));
    parser.addOption(localOption);

    const QCommandLineOption nowOption(
        QStringList{QStringLiteral("now")},
        QStringLiteral("Reference instant for relative times (YYYY-MM-DDTHH:MM:SS, UTC)."),
        QStringLiteral("instant"));
    parser.addOption(nowOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append diagnostics to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging for uuidstamp.* categories."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("'scan [files...]' or 'decode <uuid>...'."));
    parser.process(app);

    uuidstamp::host::install_file_logging(parser.value(logFileOption));
    if (parser.isSet(debugOption)) {
        uuidstamp::host::enable_debug_logging();
    }

    uuidstamp::host::CliOverrides overrides;
    overrides.noTimeAgo = parser.isSet(noTimeAgoOption);
    overrides.local = parser.isSet(localOption);
    overrides.utcOffsetMinutes = parser.value(utcOffsetOption);
    overrides.now = parser.value(nowOption);

    const auto resolved = uuidstamp::host::resolve_cli_options(
        uuidstamp::host::load_display_settings(), overrides);
    if (resolved.is_err()) {
        QTextStream(stderr) << QString::fromStdString(resolved.unwrap_err().message) << QLatin1Char('\n');
        return kExitInvalid;
    }
    const auto& options = resolved.unwrap();

    auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("scan") : positional.takeFirst();

    const bool json = parser.isSet(jsonOption);
    uuidstamp::host::ScanReport report;
    if (command == QStringLiteral("scan")) {
        // Each input is scanned on its own so matches never span two files.
        const auto paths = positional.isEmpty() ? QStringList{QString{}} : positional;
        std::vector<uuidstamp::host::ScanSource> sources;
        for (const auto& path : paths) {
            QByteArray text;
            if (!read_input(path, text)) {
                return kExitIo;
            }
            sources.push_back(uuidstamp::host::scan_source(
                path, std::string_view(text.constData(), static_cast<size_t>(text.size())),
                options.scan, options.now));
            qCDebug(uuidstampCliLog) << "scanned" << text.size() << "bytes," << sources.back().entries.size()
                                     << "matches";
        }
        report = json ? uuidstamp::host::format_scan_report_json(sources)
                      : uuidstamp::host::format_scan_report(sources);
    } else if (command == QStringLiteral("decode")) {
        if (positional.isEmpty()) {
            QTextStream(stderr) << "decode: expected at least one UUID\n";
            return kExitInvalid;
        }
        const auto entries = uuidstamp::host::decode_arguments(positional, options.scan, options.now);
        report = json ? uuidstamp::host::format_decode_report_json(entries)
                      : uuidstamp::host::format_decode_report(entries);
    } else {
        QTextStream(stderr) << "unknown command: " << command << QLatin1Char('\n');
        parser.showHelp(kExitInvalid);
    }

    QTextStream(stdout) << report.out;
    QTextStream(stderr) << report.err;

    // A bad candidate in `scan` is skipped; a bad argument to `decode` is a usage error.
    if (command == QStringLiteral("decode") && report.failures > 0) {
        return kExitInvalid;
    }
    return kExitOk;
}
