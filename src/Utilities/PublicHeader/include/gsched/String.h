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

#pragma once

#include <absl/strings/str_join.h>
#include <spdlog/fmt/fmt.h>

#include <list>
#include <set>
#include <string>

#include "PublicHeader.h"

namespace gsched::util {

template <typename YamlNode, typename T, typename DefaultType = T>
T YamlValueOr(const YamlNode &node, const DefaultType &default_value) {
  return node ? node.template as<T>() : default_value;
}

std::string ReadableMemory(uint64_t memory_bytes);

// Accepts "512K", "50M", "1G" or a plain byte count.
GschedExpected<uint64_t> ParseMemory(const std::string &mem);

// "0-3,6" -> {0, 1, 2, 3, 6}. Whitespace is ignored. An empty string gives
// an empty set.
GschedExpected<std::set<gpu_index_t>> ParseIndexList(
    const std::string &index_str);

// Inverse of ParseIndexList: consecutive runs are folded into ranges.
std::string IndexListToStr(const std::set<gpu_index_t> &indices);

// "cn[01-03,07],login" -> cn01 cn02 cn03 cn07 login
bool ParseHostList(const std::string &host_str,
                   std::list<std::string> *host_list);

// RFC3339 in UTC with microsecond precision.
std::string ReadableUnixTime(double unix_seconds);

}  // namespace gsched::util
