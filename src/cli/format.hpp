#pragma once

#include "core/instance.hpp"

#include <QString>
#include <optional>
#include <vector>

namespace ssrp::cli {

// One "Instance: ..." line per instance.
[[nodiscard]] QString format_instances(const std::vector<Instance>& instances);

// JSON output:
// { "instances": [ { "server", "name", "isClustered", "version", "tcp"?: { "port" }, ... } ] }
[[nodiscard]] QString format_instances_json(const std::vector<Instance>& instances);

// "DAC port: 50975" or "DAC port: unavailable"; JSON: { "port": 50975 | null }
[[nodiscard]] QString format_dac_port(std::optional<quint16> port, bool json);

} // namespace ssrp::cli
