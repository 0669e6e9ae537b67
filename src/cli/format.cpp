#include "cli/format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace ssrp::cli {

QString format_instances(const std::vector<Instance>& instances) {
    QStringList lines;
    lines.reserve(static_cast<qsizetype>(instances.size()));
    for (const auto& instance : instances) {
        lines.append(to_string(instance));
    }
    if (lines.isEmpty()) {
        return QString{};
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_instances_json(const std::vector<Instance>& instances) {
    QJsonArray array;
    for (const auto& instance : instances) {
        array.append(to_json(instance));
    }
    QJsonObject root;
    root["instances"] = array;
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_dac_port(std::optional<quint16> port, bool json) {
    if (json) {
        QJsonObject root;
        root["port"] = port ? QJsonValue(static_cast<int>(*port)) : QJsonValue(QJsonValue::Null);
        return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
    }
    return QStringLiteral("DAC port: %1\n")
        .arg(port ? QString::number(*port) : QStringLiteral("unavailable"));
}

} // namespace ssrp::cli
