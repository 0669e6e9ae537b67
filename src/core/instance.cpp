#include "core/instance.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QStringList>

namespace ssrp {

QString to_string(const ViaListener& listener) {
    return QStringLiteral("ViaListener: nic=%1, port=%2").arg(listener.nic).arg(listener.port);
}

QString to_string(const Instance& instance) {
    QString out = QStringLiteral("Instance: server=%1, name=%2, isClustered=%3, version=%4")
                      .arg(instance.server,
                           instance.name,
                           instance.is_clustered ? QStringLiteral("true") : QStringLiteral("false"),
                           instance.version);

    if (instance.np_pipe_name) {
        out += QStringLiteral(", np.pipeName=") + *instance.np_pipe_name;
    }
    if (instance.tcp_port) {
        out += QStringLiteral(", tcp.port=") + QString::number(*instance.tcp_port);
    }
    if (instance.via) {
        QStringList listeners;
        for (const auto& listener : instance.via->listeners) {
            listeners.append(to_string(listener));
        }
        out += QStringLiteral(", via.netbios=%1, via.listeners=[%2]")
                   .arg(instance.via->netbios, listeners.join(QStringLiteral(", ")));
    }
    if (instance.rpc_computer_name) {
        out += QStringLiteral(", rpc.computerName=") + *instance.rpc_computer_name;
    }
    if (instance.spx_service_name) {
        out += QStringLiteral(", spx.serviceName=") + *instance.spx_service_name;
    }
    if (instance.adsp_object_name) {
        out += QStringLiteral(", adsp.objectName=") + *instance.adsp_object_name;
    }
    if (instance.banyan_vines) {
        out += QStringLiteral(", bv.itemName=%1, bv.groupName=%2, bv.orgName=%3")
                   .arg(instance.banyan_vines->item_name,
                        instance.banyan_vines->group_name,
                        instance.banyan_vines->org_name);
    }
    return out;
}

QJsonObject to_json(const Instance& instance) {
    QJsonObject obj;
    obj["server"] = instance.server;
    obj["name"] = instance.name;
    obj["isClustered"] = instance.is_clustered;
    obj["version"] = instance.version;

    if (instance.np_pipe_name) {
        obj["np"] = QJsonObject{{"pipeName", *instance.np_pipe_name}};
    }
    if (instance.tcp_port) {
        obj["tcp"] = QJsonObject{{"port", static_cast<int>(*instance.tcp_port)}};
    }
    if (instance.via) {
        QJsonArray listeners;
        for (const auto& listener : instance.via->listeners) {
            listeners.append(QJsonObject{{"nic", listener.nic},
                                         {"port", static_cast<int>(listener.port)}});
        }
        obj["via"] = QJsonObject{{"netbios", instance.via->netbios}, {"listeners", listeners}};
    }
    if (instance.rpc_computer_name) {
        obj["rpc"] = QJsonObject{{"computerName", *instance.rpc_computer_name}};
    }
    if (instance.spx_service_name) {
        obj["spx"] = QJsonObject{{"serviceName", *instance.spx_service_name}};
    }
    if (instance.adsp_object_name) {
        obj["adsp"] = QJsonObject{{"objectName", *instance.adsp_object_name}};
    }
    if (instance.banyan_vines) {
        obj["bv"] = QJsonObject{{"itemName", instance.banyan_vines->item_name},
                                {"groupName", instance.banyan_vines->group_name},
                                {"orgName", instance.banyan_vines->org_name}};
    }
    return obj;
}

QDebug operator<<(QDebug debug, const Instance& instance) {
    QDebugStateSaver saver(debug);
    debug.noquote() << to_string(instance);
    return debug;
}

} // namespace ssrp
