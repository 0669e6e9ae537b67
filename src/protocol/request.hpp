#pragma once

#include "core/result.hpp"
#include "protocol/codec.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <cstdint>
#include <optional>

namespace ssrp::protocol {

/// Protocol version carried by DAC requests and responses.
inline constexpr uint8_t kProtocolVersion = 0x01;

/// Well-known UDP port of the browser service.
inline constexpr quint16 kSsrpUdpPort = 1434;

/// Longest instance name a request may carry, in encoded bytes.
inline constexpr qsizetype kMaxInstanceNameBytes = 32;

/**
 * Client request types.
 *
 * Format:
 * - BroadcastAll (CLNT_BCAST_EX):     0x02
 * - UnicastAll (CLNT_UCAST_EX):       0x03
 * - UnicastInstance (CLNT_UCAST_INST): 0x04 <instance> 0x00
 * - UnicastDac (CLNT_UCAST_DAC):      0x0F <version> <instance> 0x00
 */
enum class RequestKind : uint8_t {
    BroadcastAll = 0x02,
    UnicastAll = 0x03,
    UnicastInstance = 0x04,
    UnicastDac = 0x0F,
};

/**
 * Request - one discovery request, consumed once by an Exchange.
 */
struct Request {
    RequestKind kind = RequestKind::UnicastAll;
    QHostAddress address;
    std::optional<QString> instance;
};

[[nodiscard]] bool request_needs_instance(RequestKind kind);

/**
 * Validate an instance name: representable in the codepage and at most
 * kMaxInstanceNameBytes once encoded. Returns the encoded bytes.
 */
[[nodiscard]] Result<QByteArray> check_instance_name(const QString& instance, const Codec& codec);

/**
 * Build the datagram for a request. Fails with InvalidArgument or Encoding
 * before anything is sent.
 */
[[nodiscard]] Result<QByteArray> build_request(const Request& request, const Codec& codec);

} // namespace ssrp::protocol
