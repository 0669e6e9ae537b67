#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "protocol/response_parser.hpp"

#include <vector>

using namespace ssrp;
using namespace ssrp::protocol;

namespace {

QByteArray to_bytes(const std::vector<uint8_t>& raw) {
    QByteArray out;
    out.reserve(static_cast<qsizetype>(raw.size()));
    for (const auto b : raw) {
        out.append(static_cast<char>(b));
    }
    return out;
}

} // namespace

TEST_CASE("Property: parser never throws on arbitrary bytes", "[property][parser]") {
    REQUIRE(rc::check("parse_instance_list and parse_port are total",
        [](std::vector<uint8_t> raw) {
            const auto bytes = to_bytes(raw);
            const auto list = parse_instance_list(bytes);
            RC_ASSERT(!list || (bytes.size() > 3 && !list->empty()));

            const auto port = parse_port(bytes);
            RC_ASSERT(!port || bytes.size() == 6);
        }
    ));
}

TEST_CASE("Property: wrong marker is always rejected", "[property][parser]") {
    REQUIRE(rc::check("first byte other than 0x05 yields nullopt",
        [](uint8_t marker, std::vector<uint8_t> rest) {
            RC_PRE(marker != 0x05);
            auto bytes = to_bytes(rest);
            bytes.prepend(static_cast<char>(marker));
            RC_ASSERT(!parse_instance_list(bytes).has_value());
            RC_ASSERT(!parse_port(bytes).has_value());
        }
    ));
}

TEST_CASE("Property: framed noise is rejected or parsed, never both", "[property][parser]") {
    REQUIRE(rc::check("random payload behind a valid header",
        [](std::vector<uint8_t> payload) {
            RC_PRE(!payload.empty() && payload.size() <= 0xFFFF);
            QByteArray bytes;
            bytes.append(static_cast<char>(0x05));
            bytes.append(static_cast<char>(payload.size() & 0xFF));
            bytes.append(static_cast<char>((payload.size() >> 8) & 0xFF));
            bytes.append(to_bytes(payload));

            const auto decoded = decode_instance_list(bytes);
            const auto parsed = parse_instance_list(bytes);
            RC_ASSERT(decoded.is_ok() == parsed.has_value());
            if (parsed) {
                RC_ASSERT(!parsed->empty());
            }
        }
    ));
}

TEST_CASE("Property: any well-framed DAC reply yields its port", "[property][dac]") {
    REQUIRE(rc::check("05 06 00 01 lo hi decodes to hi:lo",
        [](uint8_t lo, uint8_t hi) {
            const QByteArray bytes = to_bytes({0x05, 0x06, 0x00, 0x01, lo, hi});
            const auto port = parse_port(bytes);
            RC_ASSERT(port.has_value());
            RC_ASSERT(*port == static_cast<quint16>(lo | (hi << 8)));
        }
    ));
}
