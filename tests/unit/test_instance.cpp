#include <catch2/catch_test_macros.hpp>

#include "core/instance.hpp"

#include <QJsonArray>

using namespace ssrp;

namespace {

Instance make_instance() {
    Instance instance;
    instance.server = QStringLiteral("HOST");
    instance.name = QStringLiteral("SQLEXPRESS");
    instance.version = QStringLiteral("12.0.2000.8");
    return instance;
}

} // namespace

TEST_CASE("Instance: to_string with mandatory fields", "[instance]") {
    REQUIRE(to_string(make_instance()) ==
            QStringLiteral("Instance: server=HOST, name=SQLEXPRESS, isClustered=false, version=12.0.2000.8"));
}

TEST_CASE("Instance: to_string lists present protocols", "[instance]") {
    auto instance = make_instance();
    instance.is_clustered = true;
    instance.tcp_port = 1433;
    instance.via = ViaInfo{QStringLiteral("NB"), {ViaListener{QStringLiteral("0"), 1433}}};
    instance.banyan_vines = BanyanVinesInfo{QStringLiteral("i"), QStringLiteral("g"), QStringLiteral("o")};

    REQUIRE(to_string(instance) ==
            QStringLiteral("Instance: server=HOST, name=SQLEXPRESS, isClustered=true, version=12.0.2000.8, "
                           "tcp.port=1433, via.netbios=NB, via.listeners=[ViaListener: nic=0, port=1433], "
                           "bv.itemName=i, bv.groupName=g, bv.orgName=o"));
}

TEST_CASE("Instance: to_json omits absent protocols", "[instance]") {
    auto instance = make_instance();
    instance.np_pipe_name = QStringLiteral("\\\\HOST\\pipe\\sql\\query");

    const auto obj = to_json(instance);
    REQUIRE(obj.value("server").toString() == QStringLiteral("HOST"));
    REQUIRE(obj.value("name").toString() == QStringLiteral("SQLEXPRESS"));
    REQUIRE(obj.value("isClustered").toBool() == false);
    REQUIRE(obj.value("version").toString() == QStringLiteral("12.0.2000.8"));
    REQUIRE(obj.value("np").toObject().value("pipeName").toString() ==
            QStringLiteral("\\\\HOST\\pipe\\sql\\query"));
    REQUIRE_FALSE(obj.contains("tcp"));
    REQUIRE_FALSE(obj.contains("via"));
    REQUIRE_FALSE(obj.contains("bv"));
}

TEST_CASE("Instance: to_json via listeners", "[instance]") {
    auto instance = make_instance();
    instance.via = ViaInfo{QStringLiteral("NB"), {ViaListener{QStringLiteral("0"), 1433},
                                                  ViaListener{QStringLiteral("1"), 1434}}};

    const auto via = to_json(instance).value("via").toObject();
    REQUIRE(via.value("netbios").toString() == QStringLiteral("NB"));
    const auto listeners = via.value("listeners").toArray();
    REQUIRE(listeners.size() == 2);
    REQUIRE(listeners.at(1).toObject().value("nic").toString() == QStringLiteral("1"));
    REQUIRE(listeners.at(1).toObject().value("port").toInt() == 1434);
}

TEST_CASE("Instance: equality covers optional protocols", "[instance]") {
    auto a = make_instance();
    auto b = make_instance();
    REQUIRE(a == b);

    b.tcp_port = 1433;
    REQUIRE_FALSE(a == b);

    a.tcp_port = 1433;
    a.spx_service_name = QStringLiteral("svc");
    REQUIRE_FALSE(a == b);
}
