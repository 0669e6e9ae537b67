#include <QCommandLineParser>
#include <QCoreApplication>
#include <QHostAddress>
#include <QTextStream>

#include "cli/format.hpp"
#include "cli/logging.hpp"
#include "network/client.hpp"

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 1,
    kExitRequestFailed = 2,
    kExitNoDacPort = 3,
};

int usage_error(const QCommandLineParser& parser, const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n') << parser.helpText();
    return kExitUsage;
}

int request_error(const ssrp::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return kExitRequestFailed;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ssrp");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Lists database server instances via the SQL Server Resolution Protocol.\n\n"
        "Commands:\n"
        "  list-all <address>          broadcast (IPv4) or multicast (IPv6) sweep\n"
        "  list <server> [instance]    instances on one server\n"
        "  dac <server> <instance>     dedicated administrator connection port"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("t"), QStringLiteral("timeout")},
        QStringLiteral("Seconds to wait for replies (default 1, or SSRP_TIMEOUT_SECONDS)."),
        QStringLiteral("seconds"));
    parser.addOption(timeoutOption);

    const QCommandLineOption hopsOption(
        QStringList{QStringLiteral("hops")},
        QStringLiteral("Multicast hop limit for IPv6 sweeps (default 1)."),
        QStringLiteral("n"));
    parser.addOption(hopsOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Destination UDP port (default 1434)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption codepageOption(
        QStringList{QStringLiteral("codepage")},
        QStringLiteral("Wire codepage: cp1252 (default) or latin1."),
        QStringLiteral("name"));
    parser.addOption(codepageOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Log socket activity and rejected datagrams to stderr."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list-all, list or dac."));
    parser.process(app);

    ssrp::cli::install_stderr_logging(parser.isSet(verboseOption));

    auto options = ssrp::network::ClientOptions::from_environment();
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const int seconds = parser.value(timeoutOption).toInt(&ok);
        if (!ok || seconds <= 0) {
            return usage_error(parser, QStringLiteral("Invalid --timeout value."));
        }
        options.timeout = std::chrono::seconds(seconds);
    }
    if (parser.isSet(hopsOption)) {
        bool ok = false;
        const int hops = parser.value(hopsOption).toInt(&ok);
        if (!ok || hops < 0 || hops > 255) {
            return usage_error(parser, QStringLiteral("Invalid --hops value."));
        }
        options.multicast_hops = hops;
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const auto port = parser.value(portOption).toUShort(&ok);
        if (!ok || port == 0) {
            return usage_error(parser, QStringLiteral("Invalid --port value."));
        }
        options.port = port;
    }
    if (parser.isSet(codepageOption)) {
        const auto codepage = ssrp::protocol::codepage_from_name(parser.value(codepageOption));
        if (!codepage) {
            return usage_error(parser, QStringLiteral("Unknown --codepage value."));
        }
        options.codepage = *codepage;
    }

    const auto positional = parser.positionalArguments();
    if (positional.size() < 2) {
        return usage_error(parser, QStringLiteral("Missing command or address."));
    }

    const auto& command = positional.at(0);
    const QHostAddress address(positional.at(1));
    if (address.isNull()) {
        return usage_error(parser, QStringLiteral("Invalid address: ") + positional.at(1));
    }

    const bool json = parser.isSet(jsonOption);
    const ssrp::network::Client client(options);
    QTextStream out(stdout);

    if (command == QStringLiteral("list-all") && positional.size() == 2) {
        const auto result = client.list_all_instances(address);
        if (result.is_err()) {
            return request_error(result.unwrap_err());
        }
        out << (json ? ssrp::cli::format_instances_json(result.unwrap())
                     : ssrp::cli::format_instances(result.unwrap()));
        return kExitOk;
    }

    if (command == QStringLiteral("list") && positional.size() <= 3) {
        std::optional<QString> instance;
        if (positional.size() == 3) {
            instance = positional.at(2);
        }
        const auto result = client.list_instances(address, instance);
        if (result.is_err()) {
            return request_error(result.unwrap_err());
        }
        out << (json ? ssrp::cli::format_instances_json(result.unwrap())
                     : ssrp::cli::format_instances(result.unwrap()));
        return kExitOk;
    }

    if (command == QStringLiteral("dac") && positional.size() == 3) {
        const auto result = client.get_dac_port(address, positional.at(2));
        if (result.is_err()) {
            return request_error(result.unwrap_err());
        }
        out << ssrp::cli::format_dac_port(result.unwrap(), json);
        return result.unwrap() ? kExitOk : kExitNoDacPort;
    }

    return usage_error(parser, QStringLiteral("Unknown command or wrong number of arguments."));
}
