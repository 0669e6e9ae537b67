#pragma once

#include "core/instance.hpp"
#include "core/result.hpp"
#include "protocol/codec.hpp"
#include "protocol/request.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QObject>
#include <QTimer>

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

class QUdpSocket;

namespace ssrp::network {

/**
 * ExchangeOptions - per-exchange socket and timing settings.
 */
struct ExchangeOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(1)};
    int multicast_hops = 1;
    quint16 port = protocol::kSsrpUdpPort;
    protocol::Codepage codepage = protocol::Codepage::Windows1252;
};

/**
 * How replies end an exchange.
 */
enum class ReplyPolicy {
    CollectUntilDeadline,  // BroadcastAll, UnicastAll: any number of servers may answer
    StopOnFirstList,       // UnicastInstance: first parsed instance list completes
    StopOnAnyReply,        // UnicastDac: first datagram completes, parsed or not
};

[[nodiscard]] ReplyPolicy reply_policy(protocol::RequestKind kind);

/**
 * Exchange - one request/response round over UDP.
 *
 * Owns the socket and the deadline timer for a single request. start() builds
 * the request, binds a wildcard endpoint of the target's address family,
 * sends once and collects replies until the reply policy or the deadline
 * ends the exchange. finished() is emitted exactly once; the socket is closed
 * before it is emitted.
 *
 * Malformed datagrams are logged and dropped; they never fail the exchange.
 */
class Exchange : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Sent,
        Collecting,
        Completed,
    };
    Q_ENUM(State)

    explicit Exchange(protocol::Request request, ExchangeOptions options = {}, QObject* parent = nullptr);
    ~Exchange() override;

    /**
     * Validate, bind and send. Errors (InvalidArgument, Encoding, Socket,
     * InvalidState) are reported before anything is sent.
     */
    Result<void> start();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] const protocol::Request& request() const { return request_; }
    [[nodiscard]] ReplyPolicy policy() const { return policy_; }

    /**
     * Instances accumulated so far, in arrival order.
     */
    [[nodiscard]] const std::vector<Instance>& instances() const { return instances_; }

    /**
     * DAC port, once a DAC reply parsed successfully.
     */
    [[nodiscard]] std::optional<quint16> port() const { return port_; }

    /**
     * Local port the exchange is bound to (0 before start()).
     */
    [[nodiscard]] quint16 localPort() const;

    /**
     * Hop limit set on the socket for IPv6 multicast targets (0 when the
     * socket is not open).
     */
    [[nodiscard]] int multicastHops() const;

    /**
     * True while the socket is a member of the target multicast group.
     */
    [[nodiscard]] bool joinedGroup() const { return joined_group_; }

signals:
    void instancesReceived(const std::vector<ssrp::Instance>& instances);
    void finished();

private slots:
    void onReadyRead();
    void onDeadline();

private:
    void setupMulticast();
    bool handleDatagram(const QByteArray& data);
    void complete();

    protocol::Request request_;
    ExchangeOptions options_;
    ReplyPolicy policy_;
    State state_ = State::Idle;

    std::unique_ptr<QUdpSocket> socket_;
    QTimer deadline_;
    bool joined_group_ = false;

    std::vector<Instance> instances_;
    std::optional<quint16> port_;
};

} // namespace ssrp::network
