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

#include <cxxopts.hpp>
#include <filesystem>

#include "gsched/ClusterConfig.h"
#include "gsched/Json.h"
#include "gsched/Logger.h"
#include "gsched/String.h"

namespace {

void PrintClusterView(const gsched::PhysicalAllocationCluster& cluster) {
  using gsched::util::IndexListToStr;

  fmt::print("{:<24} {:>6} {:<16} {:<16} {:<16}\n", "NODE", "GPUS", "TOTAL",
             "ACQUIRED", "RELEASED");
  for (const auto& [node_id, alloc] : cluster) {
    fmt::print("{:<24} {:>6} {:<16} {:<16} {:<16}\n", node_id,
               alloc.Total().size(),
               IndexListToStr(alloc.Total().GpuIndices()),
               IndexListToStr(alloc.Acquired().GpuIndices()),
               IndexListToStr(alloc.Released().GpuIndices()));
  }

  auto num_gpu = cluster.Total().AsLogical().Reduce();
  if (num_gpu.has_value())
    fmt::print("{} node(s), {} GPU(s) in total\n", cluster.size(),
               num_gpu.value().NumGpu());
}

}  // namespace

int main(int argc, char** argv) {
  cxxopts::Options options("gsched_inspect");

  // clang-format off
  options.add_options()
      ("C,config", "Path to configuration file",
      cxxopts::value<std::string>()->default_value(gsched::kDefaultConfigPath))
      ("j,json", "Print the cluster resource as JSON")
      ("v,version", "Display version information")
      ("h,help", "Display help for gsched_inspect")
      ;
  // clang-format on

  cxxopts::ParseResult parsed_args;
  try {
    parsed_args = options.parse(argc, argv);
  } catch (cxxopts::exceptions::exception& e) {
    fmt::print(stderr, "{}\n{}", e.what(), options.help());
    return 1;
  }

  if (parsed_args.count("help") > 0) {
    fmt::print("{}\n", options.help());
    return 0;
  }

  if (parsed_args.count("version") > 0) {
    fmt::print("Version: {}\n", GSCHED_VERSION_STRING);
    return 0;
  }

  std::filesystem::path config_path = parsed_args["config"].as<std::string>();
  if (!std::filesystem::exists(config_path)) {
    fmt::print(stderr, "Config file {} does not exist.\n",
               config_path.string());
    return 1;
  }

  gsched::InitConsoleLogger(spdlog::level::warn);

  auto config = gsched::LoadClusterConfig(config_path);
  if (!config) {
    fmt::print(stderr, "{}: {}\n",
               gsched::GschedErrStr(config.error().code()),
               config.error().description());
    return 1;
  }

  auto log_level = gsched::StrToLogLevel(config->GschedDebugLevel);
  gsched::InitLogger(log_level.value_or(spdlog::level::info),
                     config->GschedLogFile, false, config->MaxLogFileSize,
                     config->MaxLogFileNum);
  GSCHED_DEBUG("Loaded {} node(s) from {}", config->Resource.size(),
               config_path.string());

  if (parsed_args.count("json") > 0)
    fmt::print("{}\n", gsched::codec::DumpJson(config->Resource, 2));
  else
    PrintClusterView(config->Resource);

  spdlog::shutdown();
  return 0;
}
