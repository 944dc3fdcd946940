#include "host/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(uuidstampScanLog, "uuidstamp.scan", QtInfoMsg)
Q_LOGGING_CATEGORY(uuidstampCliLog, "uuidstamp.cli", QtInfoMsg)

namespace uuidstamp::host {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/uuidstamp.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    if (!dir.mkpath(QStringLiteral("."))) {
        std::fprintf(stderr, "uuidstamp: cannot create log directory %s\n",
                     qPrintable(dir.absolutePath()));
        return;
    }

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "uuidstamp: cannot open log file %s\n", qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }

    // stdout carries command output, so diagnostics only ever go to stderr.
    if (type != QtDebugMsg && type != QtInfoMsg) {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}

} // namespace

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? compute_log_file_path() : path;
        s.initialized = false;
        s.file.close();
    }
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("uuidstamp.*.debug=true\n"));
}

} // namespace uuidstamp::host
