#include "cli/logging.hpp"

#include <QDateTime>
#include <QLoggingCategory>
#include <QMutex>
#include <QString>
#include <QtGlobal>

#include <cstdio>

namespace ssrp::cli {
namespace {

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

QMutex& output_mutex() {
    static QMutex mu;
    return mu;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg)
                          .toLocal8Bit();

    QMutexLocker lock(&output_mutex());
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);
}

} // namespace

void install_stderr_logging(bool verbose) {
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("ssrp.*.debug=true\n"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("ssrp.*.debug=false\n"));
    }
    qInstallMessageHandler(message_handler);
}

} // namespace ssrp::cli
