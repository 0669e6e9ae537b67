#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHash>
#include <QString>
#include <array>
#include <optional>

namespace ssrp::protocol {

/**
 * Single-byte codepages the wire text can be carried in.
 */
enum class Codepage {
    Windows1252,
    Latin1,
};

[[nodiscard]] std::optional<Codepage> codepage_from_name(const QString& name);
[[nodiscard]] QString codepage_name(Codepage codepage);

/**
 * Codec - converts between QString and the one-byte-per-character encoding
 * the protocol puts on the wire.
 *
 * The browser service encodes with the host's ANSI codepage. That codepage is
 * not discoverable from the datagram, so it is configured; windows-1252 is the
 * default. Other 8-bit codepages can be supplied as a table.
 */
class Codec {
public:
    using Table = std::array<char16_t, 256>;

    [[nodiscard]] static const Codec& windows1252();
    [[nodiscard]] static const Codec& latin1();
    [[nodiscard]] static const Codec& for_codepage(Codepage codepage);

    /**
     * Build a codec from a byte -> UTF-16 table. Entries equal to 0xFFFF mark
     * bytes that are undefined in the codepage; they decode to the code point
     * with the same value and are never produced by encode().
     */
    [[nodiscard]] static Codec from_table(const Table& table);

    /**
     * Encode text. Fails with ErrorCode::Encoding on the first character the
     * codepage cannot represent.
     */
    [[nodiscard]] Result<QByteArray> encode(const QString& text) const;

    [[nodiscard]] QString decode(const QByteArray& bytes) const;

    /**
     * Length of text once encoded; one byte per code point.
     *
     * Equals encode(text).unwrap().size() whenever encode() succeeds, and the
     * source byte count for anything decode() produced. Text the codepage
     * cannot represent still counts one byte per code point; callers
     * validating outgoing text use encode() instead.
     */
    [[nodiscard]] qsizetype byte_length(const QString& text) const;

private:
    explicit Codec(const Table& table);

    Table table_{};
    QHash<char16_t, char> reverse_;
};

} // namespace ssrp::protocol
