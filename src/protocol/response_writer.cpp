#include "protocol/response_writer.hpp"

#include "protocol/request.hpp"
#include "protocol/response_parser.hpp"

#include <QStringList>

#include <string>

namespace ssrp::protocol {
namespace {

void append_le16(QByteArray& out, quint16 value) {
    out.append(static_cast<char>(value & 0xFF));
    out.append(static_cast<char>((value >> 8) & 0xFF));
}

} // namespace

QString format_instance_record(const Instance& instance) {
    QStringList fields{
        QStringLiteral("ServerName"), instance.server,
        QStringLiteral("InstanceName"), instance.name,
        QStringLiteral("IsClustered"), instance.is_clustered ? QStringLiteral("Yes") : QStringLiteral("No"),
        QStringLiteral("Version"), instance.version,
    };

    if (instance.np_pipe_name) {
        fields << QStringLiteral("np") << *instance.np_pipe_name;
    }
    if (instance.tcp_port) {
        fields << QStringLiteral("tcp") << QString::number(*instance.tcp_port);
    }
    if (instance.via) {
        QStringList via{instance.via->netbios};
        for (const auto& listener : instance.via->listeners) {
            via << listener.nic + QLatin1Char(':') + QString::number(listener.port);
        }
        fields << QStringLiteral("via") << via.join(QLatin1Char(','));
    }
    if (instance.rpc_computer_name) {
        fields << QStringLiteral("rpc") << *instance.rpc_computer_name;
    }
    if (instance.spx_service_name) {
        fields << QStringLiteral("spx") << *instance.spx_service_name;
    }
    if (instance.adsp_object_name) {
        fields << QStringLiteral("adsp") << *instance.adsp_object_name;
    }
    if (instance.banyan_vines) {
        fields << QStringLiteral("bv") << instance.banyan_vines->item_name
               << instance.banyan_vines->group_name << instance.banyan_vines->org_name;
    }

    return fields.join(QLatin1Char(';')) + QStringLiteral(";;");
}

Result<QByteArray> build_instance_list_response(const std::vector<Instance>& instances,
                                                const Codec& codec) {
    QString text;
    for (const auto& instance : instances) {
        text += format_instance_record(instance);
    }

    auto payload = codec.encode(text);
    if (payload.is_err()) {
        return payload;
    }
    const auto size = payload.unwrap().size();
    if (size > 0xFFFF) {
        return Result<QByteArray>::err(Error{
            "payload of " + std::to_string(size) + " bytes does not fit the size field",
            ErrorCode::InvalidArgument});
    }

    QByteArray out;
    out.reserve(kResponseHeaderSize + size);
    out.append(static_cast<char>(kServerResponse));
    append_le16(out, static_cast<quint16>(size));
    out.append(payload.unwrap());
    return Result<QByteArray>::ok(std::move(out));
}

QByteArray build_port_response(quint16 port) {
    QByteArray out;
    out.reserve(kDacResponseSize);
    out.append(static_cast<char>(kServerResponse));
    append_le16(out, static_cast<quint16>(kDacResponseSize));
    out.append(static_cast<char>(kProtocolVersion));
    append_le16(out, port);
    return out;
}

} // namespace ssrp::protocol
