#pragma once

#include "core/instance.hpp"
#include "core/result.hpp"
#include "network/exchange.hpp"

#include <QHostAddress>
#include <QString>

#include <optional>
#include <vector>

namespace ssrp::network {

/**
 * ClientOptions - settings shared by every request a Client makes.
 */
struct ClientOptions {
    /// How long to wait for replies.
    std::chrono::milliseconds timeout{std::chrono::seconds(1)};
    /// Hop limit for IPv6 multicast requests; 1 keeps traffic on the local link.
    int multicast_hops = 1;
    quint16 port = protocol::kSsrpUdpPort;
    protocol::Codepage codepage = protocol::Codepage::Windows1252;

    /**
     * Defaults overlaid with SSRP_TIMEOUT_SECONDS, SSRP_MULTICAST_HOPS,
     * SSRP_PORT and SSRP_CODEPAGE. Invalid values are ignored with a warning.
     */
    [[nodiscard]] static ClientOptions from_environment();

    [[nodiscard]] ExchangeOptions exchange_options() const;
};

/**
 * Client - lists database server instances and looks up DAC ports.
 *
 * Each call runs one Exchange to completion in a local QEventLoop, so a
 * QCoreApplication must exist. Calls are independent: each binds its own
 * ephemeral port. Argument errors are returned before anything is sent; a
 * timeout is not an error and yields whatever arrived (possibly nothing).
 */
class Client {
public:
    explicit Client(ClientOptions options = {});

    /**
     * All instances answering a request sent to an IPv4 broadcast or IPv6
     * multicast address. Waits for the full timeout.
     */
    [[nodiscard]] Result<std::vector<Instance>> list_all_instances(const QHostAddress& address) const;

    /**
     * Instances installed on server. With an instance name, returns as soon
     * as the server answers for that instance.
     */
    [[nodiscard]] Result<std::vector<Instance>> list_instances(
        const QHostAddress& server, const std::optional<QString>& instance = std::nullopt) const;

    /**
     * TCP port of the dedicated administrator connection for instance, or
     * std::nullopt when no valid answer arrived.
     */
    [[nodiscard]] Result<std::optional<quint16>> get_dac_port(const QHostAddress& server,
                                                              const QString& instance) const;

    [[nodiscard]] const ClientOptions& options() const { return options_; }
    void set_options(const ClientOptions& options) { options_ = options; }

private:
    Result<void> run(Exchange& exchange) const;

    ClientOptions options_;
};

} // namespace ssrp::network
