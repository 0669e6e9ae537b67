#include <catch2/catch_test_macros.hpp>

#include "protocol/codec.hpp"

using namespace ssrp;
using namespace ssrp::protocol;

TEST_CASE("Codec: encodes ASCII one byte per character", "[codec]") {
    const auto encoded = Codec::windows1252().encode(QStringLiteral("SQLEXPRESS"));
    REQUIRE(encoded.is_ok());
    REQUIRE(encoded.unwrap() == QByteArray("SQLEXPRESS"));
}

TEST_CASE("Codec: windows-1252 maps the 0x80 block", "[codec]") {
    const auto& codec = Codec::windows1252();

    const auto encoded = codec.encode(QString(QChar(0x20AC)) + QChar(0x2122));
    REQUIRE(encoded.is_ok());
    REQUIRE(encoded.unwrap() == QByteArray("\x80\x99"));

    REQUIRE(codec.decode(QByteArray("\x80\x99")) == QString(QChar(0x20AC)) + QChar(0x2122));
}

TEST_CASE("Codec: latin1 maps high bytes to the same code point", "[codec]") {
    const auto& codec = Codec::latin1();
    REQUIRE(codec.decode(QByteArray("\xE9\x80")) == QString(QChar(0x00E9)) + QChar(0x0080));

    const auto encoded = codec.encode(QString(QChar(0x00E9)));
    REQUIRE(encoded.is_ok());
    REQUIRE(encoded.unwrap() == QByteArray("\xE9"));
}

TEST_CASE("Codec: unmappable character is an encoding error", "[codec]") {
    const auto encoded = Codec::windows1252().encode(QStringLiteral("DB") + QChar(0x4E2D));
    REQUIRE(encoded.is_err());
    REQUIRE(encoded.unwrap_err().code == ErrorCode::Encoding);
    REQUIRE(encoded.unwrap_err().message.find("U+4E2D") != std::string::npos);
    REQUIRE(encoded.unwrap_err().message.find("position 2") != std::string::npos);
}

TEST_CASE("Codec: latin1 rejects characters windows-1252 accepts", "[codec]") {
    REQUIRE(Codec::windows1252().encode(QString(QChar(0x20AC))).is_ok());
    REQUIRE(Codec::latin1().encode(QString(QChar(0x20AC))).is_err());
}

TEST_CASE("Codec: undefined windows-1252 bytes decode to their own code point", "[codec]") {
    const auto decoded = Codec::windows1252().decode(QByteArray("\x81\x8D"));
    REQUIRE(decoded == QString(QChar(0x0081)) + QChar(0x008D));
}

TEST_CASE("Codec: byte length counts code points", "[codec]") {
    const auto& codec = Codec::windows1252();
    REQUIRE(codec.byte_length(QString{}) == 0);
    REQUIRE(codec.byte_length(QStringLiteral("MSSQLSERVER")) == 11);
    REQUIRE(codec.byte_length(QString(QChar(0x00E9))) == 1);
    REQUIRE(codec.byte_length(QString::fromUcs4(U"\U0001F600")) == 1);
}

TEST_CASE("Codec: byte length matches the encoded size", "[codec]") {
    QByteArray every_byte;
    for (int i = 0; i < 256; ++i) {
        every_byte.append(static_cast<char>(i));
    }

    for (const Codec* codec : {&Codec::windows1252(), &Codec::latin1()}) {
        const auto text = codec->decode(every_byte);
        REQUIRE(codec->byte_length(text) == 256);

        const QString representable = QStringLiteral("CAF") + QChar(0x00C9) + QStringLiteral(" SQL$01");
        const auto encoded = codec->encode(representable);
        REQUIRE(encoded.is_ok());
        REQUIRE(codec->byte_length(representable) == encoded.unwrap().size());
    }

    const auto euro = QString(QChar(0x20AC));
    REQUIRE(Codec::windows1252().byte_length(euro) == Codec::windows1252().encode(euro).unwrap().size());
}

TEST_CASE("Codec: custom table", "[codec]") {
    Codec::Table table{};
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = static_cast<char16_t>(i);
    }
    table[0xA4] = 0x20AC;  // ISO-8859-15 euro sign

    const auto codec = Codec::from_table(table);
    const auto encoded = codec.encode(QString(QChar(0x20AC)));
    REQUIRE(encoded.is_ok());
    REQUIRE(encoded.unwrap() == QByteArray("\xA4"));
    REQUIRE(codec.decode(QByteArray("\xA4")) == QString(QChar(0x20AC)));
}

TEST_CASE("Codec: codepage names", "[codec][config]") {
    REQUIRE(codepage_from_name(QStringLiteral("cp1252")) == Codepage::Windows1252);
    REQUIRE(codepage_from_name(QStringLiteral(" Windows-1252 ")) == Codepage::Windows1252);
    REQUIRE(codepage_from_name(QStringLiteral("latin1")) == Codepage::Latin1);
    REQUIRE_FALSE(codepage_from_name(QStringLiteral("utf-8")).has_value());
    REQUIRE(codepage_name(Codepage::Latin1) == QStringLiteral("iso-8859-1"));
}
