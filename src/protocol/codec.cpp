#include "protocol/codec.hpp"

#include <string>

namespace ssrp::protocol {
namespace {

constexpr char16_t kUndefined = 0xFFFF;

Codec::Table latin1_table() {
    Codec::Table table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = static_cast<char16_t>(i);
    }
    return table;
}

// windows-1252 differs from ISO-8859-1 only in 0x80..0x9F.
Codec::Table windows1252_table() {
    auto table = latin1_table();
    constexpr std::array<char16_t, 32> high = {
        0x20AC, kUndefined, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
        0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, kUndefined, 0x017D, kUndefined,
        kUndefined, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
        0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, kUndefined, 0x017E, 0x0178,
    };
    for (size_t i = 0; i < high.size(); ++i) {
        table[0x80 + i] = high[i];
    }
    return table;
}

} // namespace

std::optional<Codepage> codepage_from_name(const QString& name) {
    const auto key = name.trimmed().toLower();
    if (key == QLatin1String("cp1252") || key == QLatin1String("windows-1252")) {
        return Codepage::Windows1252;
    }
    if (key == QLatin1String("latin1") || key == QLatin1String("iso-8859-1")) {
        return Codepage::Latin1;
    }
    return std::nullopt;
}

QString codepage_name(Codepage codepage) {
    switch (codepage) {
        case Codepage::Windows1252: return QStringLiteral("windows-1252");
        case Codepage::Latin1: return QStringLiteral("iso-8859-1");
    }
    return QString{};
}

Codec::Codec(const Table& table)
    : table_(table)
{
    reverse_.reserve(static_cast<qsizetype>(table_.size()));
    for (size_t i = 0; i < table_.size(); ++i) {
        if (table_[i] != kUndefined) {
            reverse_.insert(table_[i], static_cast<char>(i));
        }
    }
}

const Codec& Codec::windows1252() {
    static const Codec codec(windows1252_table());
    return codec;
}

const Codec& Codec::latin1() {
    static const Codec codec(latin1_table());
    return codec;
}

const Codec& Codec::for_codepage(Codepage codepage) {
    switch (codepage) {
        case Codepage::Windows1252: return windows1252();
        case Codepage::Latin1: return latin1();
    }
    return windows1252();
}

Codec Codec::from_table(const Table& table) {
    return Codec(table);
}

Result<QByteArray> Codec::encode(const QString& text) const {
    QByteArray out;
    out.reserve(text.size());
    for (qsizetype i = 0; i < text.size(); ++i) {
        const char16_t ch = text.at(i).unicode();
        const auto it = reverse_.constFind(ch);
        if (it == reverse_.cend()) {
            return Result<QByteArray>::err(Error{
                "character U+" + QString::number(static_cast<uint>(ch), 16).toUpper().rightJustified(4, '0').toStdString() +
                    " at position " + std::to_string(i) + " has no single-byte representation",
                ErrorCode::Encoding});
        }
        out.append(it.value());
    }
    return Result<QByteArray>::ok(std::move(out));
}

QString Codec::decode(const QByteArray& bytes) const {
    QString out;
    out.reserve(bytes.size());
    for (const char byte : bytes) {
        const auto index = static_cast<uchar>(byte);
        const char16_t ch = table_[index];
        out.append(QChar(ch == kUndefined ? static_cast<char16_t>(index) : ch));
    }
    return out;
}

qsizetype Codec::byte_length(const QString& text) const {
    qsizetype length = 0;
    for (qsizetype i = 0; i < text.size(); ++i) {
        if (text.at(i).isHighSurrogate() && i + 1 < text.size() && text.at(i + 1).isLowSurrogate()) {
            ++i;
        }
        ++length;
    }
    return length;
}

} // namespace ssrp::protocol
