/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "gsched/ClusterConfig.h"

#include <list>

#include "gsched/Logger.h"
#include "gsched/String.h"

namespace gsched {

namespace {

GschedExpected<Physical> ParseGpus(const YAML::Node& gpus_node) {
  if (gpus_node.IsSequence()) {
    std::vector<int64_t> indices;
    for (const auto& index : gpus_node)
      indices.emplace_back(index.as<int64_t>());
    return Physical::FromIndices(indices);
  }

  auto indices = util::ParseIndexList(gpus_node.as<std::string>());
  if (!indices) return std::unexpected(std::move(indices).error());
  return Physical(std::move(indices).value());
}

GschedExpected<std::list<std::string>> ParseNodeNames(
    const YAML::Node& name_node) {
  std::list<std::string> names;
  if (name_node.IsSequence()) {
    for (const auto& name : name_node) {
      if (!util::ParseHostList(name.as<std::string>(), &names))
        return std::unexpected(
            FormatRichErr(GschedErrCode::ERR_CONFIG,
                          "Illegal node name '{}'", name.as<std::string>()));
    }
  } else if (!util::ParseHostList(name_node.as<std::string>(), &names)) {
    return std::unexpected(FormatRichErr(GschedErrCode::ERR_CONFIG,
                                         "Illegal node name '{}'",
                                         name_node.as<std::string>()));
  }

  return names;
}

}  // namespace

GschedExpected<ClusterConfig> ParseClusterConfig(const YAML::Node& config) {
  ClusterConfig cluster_config;

  try {
    cluster_config.GschedDebugLevel =
        util::YamlValueOr<YAML::Node, std::string>(config["GschedDebugLevel"],
                                                   "info");
    if (!StrToLogLevel(cluster_config.GschedDebugLevel).has_value())
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_CONFIG, "Illegal debug level '{}'",
          cluster_config.GschedDebugLevel));

    cluster_config.GschedLogFile = util::YamlValueOr<YAML::Node, std::string>(
        config["GschedLogFile"], kDefaultLogPath);

    if (config["MaxLogFileSize"]) {
      auto size = util::ParseMemory(config["MaxLogFileSize"].as<std::string>());
      if (!size)
        return std::unexpected(FormatRichErr(GschedErrCode::ERR_CONFIG,
                                             "Illegal MaxLogFileSize: {}",
                                             size.error().description()));
      cluster_config.MaxLogFileSize = size.value();
    }

    cluster_config.MaxLogFileNum = util::YamlValueOr<YAML::Node, uint64_t>(
        config["MaxLogFileNum"], kDefaultMaxLogFileNum);

    PhysicalCluster::MapType inventory;
    if (config["Nodes"]) {
      for (const auto& node : config["Nodes"]) {
        if (!node["name"])
          return std::unexpected(FormatRichErr(GschedErrCode::ERR_CONFIG,
                                               "Node entry without a name"));

        auto names = ParseNodeNames(node["name"]);
        if (!names) return std::unexpected(std::move(names).error());
        GSCHED_TRACE("node name list parsed: {}",
                     fmt::join(names.value(), ", "));

        Physical gpus;
        if (node["gpus"]) {
          auto parsed = ParseGpus(node["gpus"]);
          if (!parsed)
            return std::unexpected(FormatRichErr(
                GschedErrCode::ERR_CONFIG, "Illegal gpus of node(s) {}: {}",
                fmt::join(names.value(), ","), parsed.error().description()));
          gpus = std::move(parsed).value();
        }

        for (const auto& name : names.value()) {
          if (inventory.contains(name))
            return std::unexpected(FormatRichErr(
                GschedErrCode::ERR_CONFIG, "Node '{}' is defined twice", name));

          if (gpus.IsZero()) {
            GSCHED_WARN("Node {} has no GPU and is skipped.", name);
            continue;
          }
          inventory.emplace(name, gpus);
        }
      }
    }

    auto total = PhysicalCluster::Create(std::move(inventory));
    if (!total) return std::unexpected(std::move(total).error());
    cluster_config.Resource =
        PhysicalAllocationCluster::FromTotal(total.value());
  } catch (const YAML::Exception& e) {
    return std::unexpected(FormatRichErr(
        GschedErrCode::ERR_CONFIG, "Invalid config: {}", e.what()));
  }

  return cluster_config;
}

GschedExpected<ClusterConfig> LoadClusterConfig(
    const std::filesystem::path& path) {
  YAML::Node config;
  try {
    config = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    return std::unexpected(FormatRichErr(GschedErrCode::ERR_CONFIG,
                                         "Failed to load config file {}: {}",
                                         path.string(), e.what()));
  }

  return ParseClusterConfig(config);
}

}  // namespace gsched
