#include "protocol/request.hpp"

#include <string>

namespace ssrp::protocol {

bool request_needs_instance(RequestKind kind) {
    return kind == RequestKind::UnicastInstance || kind == RequestKind::UnicastDac;
}

Result<QByteArray> check_instance_name(const QString& instance, const Codec& codec) {
    auto encoded = codec.encode(instance);
    if (encoded.is_err()) {
        return Result<QByteArray>::err(Error{
            "instance name is not representable: " + encoded.unwrap_err().message,
            ErrorCode::Encoding});
    }
    if (encoded.unwrap().size() > kMaxInstanceNameBytes) {
        return Result<QByteArray>::err(Error{
            "instance must not be greater than " + std::to_string(kMaxInstanceNameBytes) +
                " bytes in length",
            ErrorCode::InvalidArgument});
    }
    return encoded;
}

Result<QByteArray> build_request(const Request& request, const Codec& codec) {
    if (request.address.isNull()) {
        return Result<QByteArray>::err(Error{"address must be not null", ErrorCode::InvalidArgument});
    }

    QByteArray bytes;
    bytes.append(static_cast<char>(request.kind));

    if (!request_needs_instance(request.kind)) {
        return Result<QByteArray>::ok(std::move(bytes));
    }

    if (!request.instance) {
        return Result<QByteArray>::err(Error{"instance must be not null", ErrorCode::InvalidArgument});
    }

    if (request.kind == RequestKind::UnicastDac) {
        bytes.append(static_cast<char>(kProtocolVersion));
    }
    return check_instance_name(*request.instance, codec).map([&bytes](const QByteArray& name) {
        QByteArray out = bytes;
        out.append(name);
        out.append('\0');
        return out;
    });
}

} // namespace ssrp::protocol
