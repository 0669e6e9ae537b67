#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QUdpSocket>

namespace ssrp::testing {

/**
 * UdpResponder - loopback stand-in for a browser service.
 *
 * Records every request it receives and answers each one with the queued
 * replies, in order. A reply marked from_peer is sent from a second socket so
 * the client sees a different sender.
 */
class UdpResponder : public QObject {
    Q_OBJECT

public:
    struct Reply {
        QByteArray data;
        bool from_peer = false;
        int delay_ms = 0;
    };

    explicit UdpResponder(QObject* parent = nullptr);

    // Binds address (127.0.0.1 by default) on an ephemeral port.
    bool listen(const QHostAddress& address = QHostAddress(QHostAddress::LocalHost));
    quint16 port() const { return socket_.localPort(); }

    void add_reply(QByteArray data, bool from_peer = false, int delay_ms = 0);

    const QList<QByteArray>& requests() const { return requests_; }

private slots:
    void onReadyRead();

private:
    void send(const Reply& reply, const QHostAddress& to, quint16 port);

    QUdpSocket socket_;
    QUdpSocket peer_;
    QList<Reply> replies_;
    QList<QByteArray> requests_;
};

} // namespace ssrp::testing
