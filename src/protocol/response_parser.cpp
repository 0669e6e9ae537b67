#include "protocol/response_parser.hpp"

#include "core/log_categories.hpp"
#include "protocol/request.hpp"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>

#include <string>

namespace ssrp::protocol {
namespace {

const QString kFieldSeparator = QStringLiteral(";");
const QString kRecordTerminator = QStringLiteral(";;");

const QString kServerName = QStringLiteral("ServerName");
const QString kInstanceName = QStringLiteral("InstanceName");
const QString kIsClustered = QStringLiteral("IsClustered");
const QString kVersion = QStringLiteral("Version");

const QString kNpInfo = QStringLiteral("np");
const QString kTcpInfo = QStringLiteral("tcp");
const QString kViaInfo = QStringLiteral("via");
const QString kRpcInfo = QStringLiteral("rpc");
const QString kSpxInfo = QStringLiteral("spx");
const QString kAdspInfo = QStringLiteral("adsp");
const QString kBvInfo = QStringLiteral("bv");

constexpr qsizetype kMandatoryFields = 8;

template<typename T>
Result<T> fail(std::string message) {
    return Result<T>::err(Error{std::move(message), ErrorCode::Malformed});
}

void warn(const char* message) {
    qCWarning(ssrpParserLog).noquote() << message;
}

quint16 read_le16(const QByteArray& bytes, qsizetype offset) {
    return static_cast<quint16>(static_cast<uchar>(bytes.at(offset)) |
                                (static_cast<uchar>(bytes.at(offset + 1)) << 8));
}

Result<quint16> parse_port_number(const QString& text, const char* what) {
    bool ok = false;
    const int value = text.toInt(&ok, 10);
    if (!ok || value < 0 || value > 65535) {
        return fail<quint16>(std::string("Invalid ") + what + " value");
    }
    return Result<quint16>::ok(static_cast<quint16>(value));
}

/**
 * Walks the optional "<tag>;<value>" fields of one record.
 */
class InfoReader {
public:
    InfoReader(const QStringList& parts, const Codec& codec)
        : parts_(parts), codec_(codec), pos_(kMandatoryFields) {}

    Result<void> read_into(Instance& instance) {
        while (pos_ < parts_.size()) {
            const auto& tag = parts_.at(pos_++);
            Result<void> step = Result<void>::ok();
            if (tag == kNpInfo) {
                step = read_np(instance);
            } else if (tag == kTcpInfo) {
                step = read_tcp(instance);
            } else if (tag == kViaInfo) {
                step = read_via(instance);
            } else if (tag == kRpcInfo) {
                step = read_text(instance.rpc_computer_name, "rpc", "COMPUTERNAME", 0);
            } else if (tag == kSpxInfo) {
                step = read_text(instance.spx_service_name, "spx", "SERVICENAME", 1024);
            } else if (tag == kAdspInfo) {
                step = read_text(instance.adsp_object_name, "adsp", "ADSPOBJECTNAME", 0);
            } else if (tag == kBvInfo) {
                step = read_bv(instance);
            } else {
                return fail<void>("Unknown protocol identifier: '" + tag.toStdString() + "'");
            }
            if (step.is_err()) {
                return step;
            }
        }
        return Result<void>::ok();
    }

private:
    Result<QString> next() {
        if (pos_ >= parts_.size()) {
            return fail<QString>("Unexpected end of message");
        }
        return Result<QString>::ok(parts_.at(pos_++));
    }

    static Result<void> duplicate(const char* tag) {
        return fail<void>(std::string("'") + tag + "' listed more than once");
    }

    Result<void> read_np(Instance& instance) {
        if (instance.np_pipe_name) return duplicate("np");
        return next().and_then([&instance](QString value) {
            instance.np_pipe_name = std::move(value);
            return Result<void>::ok();
        });
    }

    Result<void> read_tcp(Instance& instance) {
        if (instance.tcp_port) return duplicate("tcp");
        return next()
            .and_then([](const QString& value) { return parse_port_number(value, "TCP_PORT"); })
            .and_then([&instance](quint16 port) {
                instance.tcp_port = port;
                return Result<void>::ok();
            });
    }

    // via;<netbios>,<nic>:<port>[,<nic>:<port>...]
    Result<void> read_via(Instance& instance) {
        if (instance.via) return duplicate("via");
        auto value = next();
        if (value.is_err()) return Result<void>::err(value.unwrap_err());
        const auto& field = value.unwrap();

        if (codec_.byte_length(field) > 128) warn("VIA_INFO greater than 128 bytes");

        const auto segments = field.split(QLatin1Char(','));
        if (segments.size() < 2) return fail<void>("Invalid VIA_PARAMETERS value");
        if (codec_.byte_length(segments.first()) > 15) return fail<void>("NETBIOS greater than 15 bytes");

        ViaInfo via;
        via.netbios = segments.first();
        via.listeners.reserve(static_cast<size_t>(segments.size() - 1));
        for (qsizetype i = 1; i < segments.size(); ++i) {
            const auto listener = segments.at(i).split(QLatin1Char(':'));
            if (listener.size() != 2) return fail<void>("Invalid VIALISTENINFO value");
            auto port = parse_port_number(listener.at(1), "VIAPORT");
            if (port.is_err()) return Result<void>::err(port.unwrap_err());
            via.listeners.push_back(ViaListener{listener.at(0), port.unwrap()});
        }
        instance.via = std::move(via);
        return Result<void>::ok();
    }

    // max_bytes == 0: no byte limit, only the 127 character warning.
    Result<void> read_text(std::optional<QString>& target, const char* tag, const char* label,
                           qsizetype max_bytes) {
        if (target) return duplicate(tag);
        auto value = next();
        if (value.is_err()) return Result<void>::err(value.unwrap_err());
        const auto& text = value.unwrap();
        if (max_bytes > 0 && codec_.byte_length(text) > max_bytes) {
            return fail<void>(std::string(label) + " greater than " + std::to_string(max_bytes) + " bytes");
        }
        if (text.size() > 127) {
            warn((std::string(label) + " greater than 127 characters").c_str());
        }
        target = text;
        return Result<void>::ok();
    }

    Result<void> read_bv(Instance& instance) {
        if (instance.banyan_vines) return duplicate("bv");
        BanyanVinesInfo bv;
        struct Field { QString* target; const char* label; };
        const Field fields[] = {
            {&bv.item_name, "ITEMNAME"},
            {&bv.group_name, "GROUPNAME"},
            {&bv.org_name, "ORGNAME"},
        };
        for (const auto& field : fields) {
            auto value = next();
            if (value.is_err()) return Result<void>::err(value.unwrap_err());
            if (value.unwrap().size() > 127) {
                warn((std::string(field.label) + " greater than 127 characters").c_str());
            }
            *field.target = std::move(value).unwrap();
        }
        instance.banyan_vines = std::move(bv);
        return Result<void>::ok();
    }

    const QStringList& parts_;
    const Codec& codec_;
    qsizetype pos_;
};

Result<Instance> decode_instance(const QString& record, const Codec& codec) {
    static const QRegularExpression version_pattern(
        QRegularExpression::anchoredPattern(QStringLiteral("[0-9.]+")));

    const auto parts = record.split(kFieldSeparator);
    if (parts.size() < kMandatoryFields) return fail<Instance>("Unexpected end of message");

    Instance instance;

    if (parts.at(0) != kServerName) return fail<Instance>("Missing token: 'ServerName'");
    if (codec.byte_length(parts.at(1)) > 255) return fail<Instance>("SERVERNAME greater than 255 bytes");
    instance.server = parts.at(1);

    if (parts.at(2) != kInstanceName) return fail<Instance>("Missing token: 'InstanceName'");
    if (codec.byte_length(parts.at(3)) > 255) return fail<Instance>("INSTANCENAME greater than 255 bytes");
    if (parts.at(3).size() > 16) warn("INSTANCENAME greater than 16 characters");
    instance.name = parts.at(3);

    if (parts.at(4) != kIsClustered) return fail<Instance>("Missing token: 'IsClustered'");
    if (parts.at(5) != QLatin1String("Yes") && parts.at(5) != QLatin1String("No")) {
        return fail<Instance>("Invalid YES_OR_NO value");
    }
    instance.is_clustered = parts.at(5) == QLatin1String("Yes");

    if (parts.at(6) != kVersion) return fail<Instance>("Missing token: 'Version'");
    const auto& version = parts.at(7);
    if (version.isEmpty()) return fail<Instance>("VERSION_STRING is empty");
    if (codec.byte_length(version) > 16) return fail<Instance>("VERSION_STRING greater than 16 bytes");
    if (!version_pattern.match(version).hasMatch()) {
        return fail<Instance>("VERSION_STRING doesn't match [0-9\\.]+");
    }
    instance.version = version;

    auto info = InfoReader(parts, codec).read_into(instance);
    if (info.is_err()) return Result<Instance>::err(info.unwrap_err());
    return Result<Instance>::ok(std::move(instance));
}

// The payload must end exactly after a ";;" terminator.
Result<std::vector<Instance>> decode_records(const QString& data, const Codec& codec) {
    std::vector<Instance> instances;

    qsizetype start = 0;
    do {
        const auto end = data.indexOf(kRecordTerminator, start);
        if (end == -1) return fail<std::vector<Instance>>("Missing token: ';;'");

        const auto record = data.mid(start, end - start);
        if (codec.byte_length(record) + kRecordTerminator.size() > kMaxInstanceRecordBytes) {
            return fail<std::vector<Instance>>("Instance greater than 1024 bytes");
        }

        auto instance = decode_instance(record, codec);
        if (instance.is_err()) return Result<std::vector<Instance>>::err(instance.unwrap_err());
        instances.push_back(std::move(instance).unwrap());

        start = end + kRecordTerminator.size();
    } while (start != data.size());

    return Result<std::vector<Instance>>::ok(std::move(instances));
}

} // namespace

Result<std::vector<Instance>> decode_instance_list(const QByteArray& bytes, const Codec& codec) {
    if (bytes.isNull()) return fail<std::vector<Instance>>("Invalid null response");
    if (bytes.size() < kResponseHeaderSize) {
        return fail<std::vector<Instance>>("Invalid response length: " + std::to_string(bytes.size()));
    }
    if (static_cast<uchar>(bytes.at(0)) != kServerResponse) {
        return fail<std::vector<Instance>>("Invalid response type: " +
                                           std::to_string(static_cast<uchar>(bytes.at(0))));
    }

    const auto size = read_le16(bytes, 1);
    if (size == 0 || kResponseHeaderSize + size > bytes.size()) {
        return fail<std::vector<Instance>>("Invalid data size: " + std::to_string(size));
    }

    const auto data = codec.decode(bytes.mid(kResponseHeaderSize, size));
    return decode_records(data, codec);
}

Result<quint16> decode_port(const QByteArray& bytes) {
    if (bytes.isNull()) return fail<quint16>("Invalid null response");
    if (bytes.size() != kDacResponseSize) {
        return fail<quint16>("Invalid response length: " + std::to_string(bytes.size()));
    }
    if (static_cast<uchar>(bytes.at(0)) != kServerResponse) {
        return fail<quint16>("Invalid response type: " + std::to_string(static_cast<uchar>(bytes.at(0))));
    }

    const auto size = read_le16(bytes, 1);
    if (size != kDacResponseSize) return fail<quint16>("Invalid data size: " + std::to_string(size));

    const auto version = static_cast<uchar>(bytes.at(3));
    if (version != kProtocolVersion) {
        return fail<quint16>("Invalid protocol version: " + std::to_string(version));
    }

    return Result<quint16>::ok(read_le16(bytes, 4));
}

std::optional<std::vector<Instance>> parse_instance_list(const QByteArray& bytes, const Codec& codec) {
    auto result = decode_instance_list(bytes, codec);
    if (result.is_err()) {
        qCDebug(ssrpParserLog).noquote() << QString::fromStdString(result.unwrap_err().message);
        return std::nullopt;
    }
    return std::move(result).unwrap();
}

std::optional<quint16> parse_port(const QByteArray& bytes) {
    const auto result = decode_port(bytes);
    if (result.is_err()) {
        qCDebug(ssrpParserLog).noquote() << QString::fromStdString(result.unwrap_err().message);
        return std::nullopt;
    }
    return result.unwrap();
}

} // namespace ssrp::protocol
