#pragma once

#include "core/instance.hpp"
#include "core/result.hpp"
#include "protocol/codec.hpp"

#include <QByteArray>
#include <vector>

namespace ssrp::protocol {

// Server-side SVR_RESP datagrams, in the format the response parser accepts.
// Kept separate so responders and tests can produce wire data without sockets.

/**
 * Serialize one record, including its ";;" terminator, as text.
 */
[[nodiscard]] QString format_instance_record(const Instance& instance);

/**
 * Build an instance list response. Fails with InvalidArgument when the
 * payload does not fit the 16-bit size field, or Encoding when a value is not
 * representable in the codepage.
 */
[[nodiscard]] Result<QByteArray> build_instance_list_response(
    const std::vector<Instance>& instances, const Codec& codec = Codec::windows1252());

[[nodiscard]] QByteArray build_port_response(quint16 port);

} // namespace ssrp::protocol
