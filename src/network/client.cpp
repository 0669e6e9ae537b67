#include "network/client.hpp"

#include "core/log_categories.hpp"

#include <QDebug>
#include <QEventLoop>

namespace ssrp::network {

ClientOptions ClientOptions::from_environment() {
    ClientOptions options;

    if (qEnvironmentVariableIsSet("SSRP_TIMEOUT_SECONDS")) {
        bool ok = false;
        const int seconds = qEnvironmentVariableIntValue("SSRP_TIMEOUT_SECONDS", &ok);
        if (ok && seconds > 0) {
            options.timeout = std::chrono::seconds(seconds);
        } else {
            qCWarning(ssrpExchangeLog) << "ignoring invalid SSRP_TIMEOUT_SECONDS";
        }
    }

    if (qEnvironmentVariableIsSet("SSRP_MULTICAST_HOPS")) {
        bool ok = false;
        const int hops = qEnvironmentVariableIntValue("SSRP_MULTICAST_HOPS", &ok);
        if (ok && hops >= 0 && hops <= 255) {
            options.multicast_hops = hops;
        } else {
            qCWarning(ssrpExchangeLog) << "ignoring invalid SSRP_MULTICAST_HOPS";
        }
    }

    if (qEnvironmentVariableIsSet("SSRP_PORT")) {
        bool ok = false;
        const int port = qEnvironmentVariableIntValue("SSRP_PORT", &ok);
        if (ok && port > 0 && port <= 65535) {
            options.port = static_cast<quint16>(port);
        } else {
            qCWarning(ssrpExchangeLog) << "ignoring invalid SSRP_PORT";
        }
    }

    const auto codepage = qEnvironmentVariable("SSRP_CODEPAGE");
    if (!codepage.isEmpty()) {
        if (auto parsed = protocol::codepage_from_name(codepage)) {
            options.codepage = *parsed;
        } else {
            qCWarning(ssrpExchangeLog) << "ignoring unknown SSRP_CODEPAGE" << codepage;
        }
    }

    return options;
}

ExchangeOptions ClientOptions::exchange_options() const {
    ExchangeOptions out;
    out.timeout = timeout;
    out.multicast_hops = multicast_hops;
    out.port = port;
    out.codepage = codepage;
    return out;
}

Client::Client(ClientOptions options)
    : options_(options) {}

Result<void> Client::run(Exchange& exchange) const {
    QEventLoop loop;
    QObject::connect(&exchange, &Exchange::finished, &loop, &QEventLoop::quit);

    auto started = exchange.start();
    if (started.is_err()) {
        return started;
    }

    if (exchange.state() != Exchange::State::Completed) {
        loop.exec();
    }
    return Result<void>::ok();
}

Result<std::vector<Instance>> Client::list_all_instances(const QHostAddress& address) const {
    Exchange exchange(protocol::Request{protocol::RequestKind::BroadcastAll, address, std::nullopt},
                      options_.exchange_options());
    auto ran = run(exchange);
    if (ran.is_err()) {
        return Result<std::vector<Instance>>::err(ran.unwrap_err());
    }
    return Result<std::vector<Instance>>::ok(exchange.instances());
}

Result<std::vector<Instance>> Client::list_instances(const QHostAddress& server,
                                                     const std::optional<QString>& instance) const {
    const auto kind = instance ? protocol::RequestKind::UnicastInstance : protocol::RequestKind::UnicastAll;
    Exchange exchange(protocol::Request{kind, server, instance}, options_.exchange_options());
    auto ran = run(exchange);
    if (ran.is_err()) {
        return Result<std::vector<Instance>>::err(ran.unwrap_err());
    }
    return Result<std::vector<Instance>>::ok(exchange.instances());
}

Result<std::optional<quint16>> Client::get_dac_port(const QHostAddress& server,
                                                    const QString& instance) const {
    Exchange exchange(protocol::Request{protocol::RequestKind::UnicastDac, server, instance},
                      options_.exchange_options());
    auto ran = run(exchange);
    if (ran.is_err()) {
        return Result<std::optional<quint16>>::err(ran.unwrap_err());
    }
    return Result<std::optional<quint16>>::ok(exchange.port());
}

} // namespace ssrp::network
