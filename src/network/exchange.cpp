#include "network/exchange.hpp"

#include "core/log_categories.hpp"
#include "protocol/response_parser.hpp"

#include <QDebug>
#include <QNetworkDatagram>
#include <QUdpSocket>

namespace ssrp::network {

ReplyPolicy reply_policy(protocol::RequestKind kind) {
    switch (kind) {
        case protocol::RequestKind::BroadcastAll:
        case protocol::RequestKind::UnicastAll:
            return ReplyPolicy::CollectUntilDeadline;
        case protocol::RequestKind::UnicastInstance:
            return ReplyPolicy::StopOnFirstList;
        case protocol::RequestKind::UnicastDac:
            return ReplyPolicy::StopOnAnyReply;
    }
    return ReplyPolicy::CollectUntilDeadline;
}

Exchange::Exchange(protocol::Request request, ExchangeOptions options, QObject* parent)
    : QObject(parent)
    , request_(std::move(request))
    , options_(options)
    , policy_(reply_policy(request_.kind))
{
    deadline_.setSingleShot(true);
    deadline_.setTimerType(Qt::PreciseTimer);
    connect(&deadline_, &QTimer::timeout, this, &Exchange::onDeadline);
}

Exchange::~Exchange() {
    deadline_.stop();
    if (socket_) {
        socket_->close();
    }
}

quint16 Exchange::localPort() const {
    return socket_ ? socket_->localPort() : 0;
}

int Exchange::multicastHops() const {
    if (!socket_ || socket_->state() != QAbstractSocket::BoundState) return 0;
    return socket_->socketOption(QAbstractSocket::MulticastTtlOption).toInt();
}

Result<void> Exchange::start() {
    if (state_ != State::Idle) {
        return Result<void>::err(Error{"exchange already started", ErrorCode::InvalidState});
    }

    auto bytes = protocol::build_request(request_, protocol::Codec::for_codepage(options_.codepage));
    if (bytes.is_err()) {
        return Result<void>::err(bytes.unwrap_err());
    }

    const bool ipv6 = request_.address.protocol() == QAbstractSocket::IPv6Protocol;
    socket_ = std::make_unique<QUdpSocket>(this);
    if (!socket_->bind(ipv6 ? QHostAddress(QHostAddress::AnyIPv6) : QHostAddress(QHostAddress::AnyIPv4), 0)) {
        auto msg = socket_->errorString().toStdString();
        socket_.reset();
        return Result<void>::err(Error{"bind failed: " + msg, ErrorCode::Socket});
    }

    // QUdpSocket sets SO_BROADCAST on every IPv4 socket it opens, so an IPv4
    // broadcast target needs no extra option here.
    if (ipv6 && request_.address.isMulticast()) {
        setupMulticast();
    }

    connect(socket_.get(), &QUdpSocket::readyRead, this, &Exchange::onReadyRead);

    const auto written = socket_->writeDatagram(bytes.unwrap(), request_.address, options_.port);
    if (written < 0) {
        // A lost send runs into the deadline.
        qCWarning(ssrpExchangeLog) << "send to" << request_.address << "failed:" << socket_->errorString();
    } else {
        qCDebug(ssrpExchangeLog) << "sent" << written << "bytes to" << request_.address
                                 << "port" << options_.port << "from port" << socket_->localPort();
    }
    state_ = State::Sent;

    deadline_.start(options_.timeout);
    state_ = State::Collecting;
    return Result<void>::ok();
}

void Exchange::setupMulticast() {
    socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, options_.multicast_hops);
    joined_group_ = socket_->joinMulticastGroup(request_.address);
    if (!joined_group_) {
        qCWarning(ssrpExchangeLog) << "joining" << request_.address << "failed:" << socket_->errorString();
    }
}

void Exchange::onReadyRead() {
    if (!socket_) return;

    while (state_ == State::Collecting && socket_->hasPendingDatagrams()) {
        const auto datagram = socket_->receiveDatagram();
        qCDebug(ssrpExchangeLog) << "received" << datagram.data().size() << "bytes from"
                                 << datagram.senderAddress() << "port" << datagram.senderPort();

        if (handleDatagram(datagram.data())) {
            complete();
            return;
        }
    }
}

void Exchange::onDeadline() {
    if (state_ != State::Collecting) return;
    qCDebug(ssrpExchangeLog) << "deadline reached with" << instances_.size() << "instances";
    complete();
}

// Returns true when the reply ends the exchange.
bool Exchange::handleDatagram(const QByteArray& data) {
    if (policy_ == ReplyPolicy::StopOnAnyReply) {
        port_ = protocol::parse_port(data);
        return true;
    }

    auto list = protocol::parse_instance_list(data, protocol::Codec::for_codepage(options_.codepage));
    if (!list) {
        return false;
    }

    instances_.insert(instances_.end(), list->begin(), list->end());
    emit instancesReceived(*list);
    return policy_ == ReplyPolicy::StopOnFirstList;
}

void Exchange::complete() {
    if (state_ == State::Completed) return;

    deadline_.stop();
    if (socket_) {
        if (joined_group_) {
            socket_->leaveMulticastGroup(request_.address);
            joined_group_ = false;
        }
        socket_->close();
    }
    state_ = State::Completed;
    emit finished();
}

} // namespace ssrp::network
