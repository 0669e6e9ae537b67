#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QtGlobal>
#include <optional>
#include <vector>

class QDebug;

namespace ssrp {

/**
 * ViaListener - Virtual Interface Architecture listener (NIC + port).
 */
struct ViaListener {
    QString nic;
    quint16 port = 0;

    bool operator==(const ViaListener&) const = default;
};

/**
 * ViaInfo - NetBIOS name of the host plus its VIA listeners, in wire order.
 */
struct ViaInfo {
    QString netbios;
    std::vector<ViaListener> listeners;

    bool operator==(const ViaInfo&) const = default;
};

/**
 * BanyanVinesInfo - the "bv" block; always carries all three names.
 */
struct BanyanVinesInfo {
    QString item_name;
    QString group_name;
    QString org_name;

    bool operator==(const BanyanVinesInfo&) const = default;
};

/**
 * Instance - one database server instance as reported by the browser service.
 *
 * Built only by the response parser from validated wire data. Each optional
 * member corresponds to a protocol tag that may appear at most once.
 */
struct Instance {
    QString server;
    QString name;
    bool is_clustered = false;
    QString version;

    std::optional<QString> np_pipe_name;
    std::optional<quint16> tcp_port;
    std::optional<ViaInfo> via;
    std::optional<QString> rpc_computer_name;
    std::optional<QString> spx_service_name;
    std::optional<QString> adsp_object_name;
    std::optional<BanyanVinesInfo> banyan_vines;

    bool operator==(const Instance&) const = default;
};

// "Instance: server=HOST, name=SQLEXPRESS, isClustered=false, version=..., tcp.port=1433"
[[nodiscard]] QString to_string(const ViaListener& listener);
[[nodiscard]] QString to_string(const Instance& instance);

[[nodiscard]] QJsonObject to_json(const Instance& instance);

QDebug operator<<(QDebug debug, const Instance& instance);

} // namespace ssrp

Q_DECLARE_METATYPE(ssrp::Instance)
