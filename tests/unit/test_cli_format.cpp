#include <catch2/catch_test_macros.hpp>

#include "cli/format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace ssrp;

TEST_CASE("CLI format: instance lines", "[cli]") {
    Instance a;
    a.server = QStringLiteral("A");
    a.name = QStringLiteral("ONE");
    a.version = QStringLiteral("1.0");
    Instance b = a;
    b.name = QStringLiteral("TWO");
    b.tcp_port = 1433;

    REQUIRE(cli::format_instances({}) == QString{});
    REQUIRE(cli::format_instances({a, b}) ==
            QStringLiteral("Instance: server=A, name=ONE, isClustered=false, version=1.0\n"
                           "Instance: server=A, name=TWO, isClustered=false, version=1.0, tcp.port=1433\n"));
}

TEST_CASE("CLI format: instance JSON", "[cli]") {
    Instance a;
    a.server = QStringLiteral("A");
    a.name = QStringLiteral("ONE");
    a.version = QStringLiteral("1.0");
    a.tcp_port = 1433;

    const auto doc = QJsonDocument::fromJson(cli::format_instances_json({a}).toUtf8());
    REQUIRE(doc.isObject());
    const auto instances = doc.object().value("instances").toArray();
    REQUIRE(instances.size() == 1);
    REQUIRE(instances.at(0).toObject().value("tcp").toObject().value("port").toInt() == 1433);

    const auto empty = QJsonDocument::fromJson(cli::format_instances_json({}).toUtf8());
    REQUIRE(empty.object().value("instances").toArray().isEmpty());
}

TEST_CASE("CLI format: DAC port", "[cli][dac]") {
    REQUIRE(cli::format_dac_port(50975, false) == QStringLiteral("DAC port: 50975\n"));
    REQUIRE(cli::format_dac_port(std::nullopt, false) == QStringLiteral("DAC port: unavailable\n"));

    const auto found = QJsonDocument::fromJson(cli::format_dac_port(50975, true).toUtf8());
    REQUIRE(found.object().value("port").toInt() == 50975);

    const auto missing = QJsonDocument::fromJson(cli::format_dac_port(std::nullopt, true).toUtf8());
    REQUIRE(missing.object().value("port").isNull());
}
