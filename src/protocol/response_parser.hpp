#pragma once

#include "core/instance.hpp"
#include "core/result.hpp"
#include "protocol/codec.hpp"

#include <QByteArray>
#include <cstdint>
#include <optional>
#include <vector>

namespace ssrp::protocol {

/// First byte of every server response (SVR_RESP).
inline constexpr uint8_t kServerResponse = 0x05;

/// Size of the marker + little-endian length header.
inline constexpr qsizetype kResponseHeaderSize = 3;

/// Exact size of a DAC response datagram.
inline constexpr qsizetype kDacResponseSize = 6;

/// Upper bound of one instance record including its ";;" terminator.
inline constexpr qsizetype kMaxInstanceRecordBytes = 1024;

/**
 * Server response parsing.
 *
 * Response format:
 * - Marker (1 byte): 0x05
 * - Size (2 bytes, little-endian)
 * - Payload (size bytes)
 *
 * Instance list payload: records terminated by ";;", fields separated by ";":
 *   ServerName;<s>;InstanceName;<s>;IsClustered;Yes|No;Version;<d.d.d>[;<tag>;<value>...];;
 *
 * DAC payload: version (1 byte, 0x01) + port (2 bytes, little-endian).
 *
 * The decode_* functions report why a datagram was rejected. The parse_*
 * functions never fail: a rejected datagram is logged on ssrp.parser at
 * debug level and yields std::nullopt. A single bad record rejects the whole
 * datagram.
 */

[[nodiscard]] Result<std::vector<Instance>> decode_instance_list(
    const QByteArray& bytes, const Codec& codec = Codec::windows1252());

[[nodiscard]] Result<quint16> decode_port(const QByteArray& bytes);

[[nodiscard]] std::optional<std::vector<Instance>> parse_instance_list(
    const QByteArray& bytes, const Codec& codec = Codec::windows1252());

[[nodiscard]] std::optional<quint16> parse_port(const QByteArray& bytes);

} // namespace ssrp::protocol
