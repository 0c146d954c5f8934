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

#include "gsched/String.h"

#include <absl/strings/str_split.h>
#include <absl/time/time.h>
#include <re2/re2.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <vector>

#include "gsched/Logger.h"

namespace gsched::util {

namespace {

bool ParseUint(std::string_view str, uint64_t *value) {
  if (str.empty()) return false;
  auto result = std::from_chars(str.data(), str.data() + str.size(), *value);
  return result.ec == std::errc() && result.ptr == str.data() + str.size();
}

// Upper bounds on how many entries a single "a-b" range may expand to.
constexpr uint64_t kMaxGpuRangeWidth = 1024;
constexpr uint64_t kMaxHostRangeWidth = 65536;

std::string RemoveSpaces(const std::string &str) {
  std::string res;
  res.reserve(str.size());
  for (const auto &c : str)
    if (c != ' ' && c != '\t') res += c;
  return res;
}

}  // namespace

std::string ReadableMemory(uint64_t memory_bytes) {
  if (memory_bytes < 1024)
    return fmt::format("{}B", memory_bytes);
  else if (memory_bytes < 1024 * 1024)
    return fmt::format("{}K", memory_bytes / 1024);
  else if (memory_bytes < 1024 * 1024 * 1024)
    return fmt::format("{}M", memory_bytes / 1024 / 1024);
  else
    return fmt::format("{}G", memory_bytes / 1024 / 1024 / 1024);
}

GschedExpected<uint64_t> ParseMemory(const std::string &mem) {
  static const LazyRE2 mem_regex = {R"((\d+)([KMGB]?))"};
  std::string num_str, unit;
  if (!RE2::FullMatch(mem, *mem_regex, &num_str, &unit))
    return std::unexpected(FormatRichErr(
        GschedErrCode::ERR_INVALID_PARAM, "Illegal memory format: '{}'", mem));

  uint64_t memory_bytes;
  if (!ParseUint(num_str, &memory_bytes))
    return std::unexpected(FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                                         "Memory value out of range: '{}'",
                                         mem));

  uint64_t multiplier = 1;
  if (unit == "K")
    multiplier = 1024;
  else if (unit == "M")
    multiplier = 1024 * 1024;
  else if (unit == "G")
    multiplier = 1024 * 1024 * 1024;

  if (memory_bytes > std::numeric_limits<uint64_t>::max() / multiplier)
    return std::unexpected(FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                                         "Memory value out of range: '{}'",
                                         mem));

  return memory_bytes * multiplier;
}

GschedExpected<std::set<gpu_index_t>> ParseIndexList(
    const std::string &index_str) {
  static const LazyRE2 num_regex = {R"(\d+)"};
  static const LazyRE2 scope_regex = {R"((\d+)-(\d+))"};

  std::set<gpu_index_t> indices;
  std::string stripped = RemoveSpaces(index_str);
  if (stripped.empty()) return indices;

  constexpr uint64_t kMaxIndex = std::numeric_limits<gpu_index_t>::max();

  std::vector<std::string> units = absl::StrSplit(stripped, ',');
  for (const auto &unit : units) {
    uint64_t start, end;
    std::string start_str, end_str;
    if (RE2::FullMatch(unit, *num_regex)) {
      if (!ParseUint(unit, &start) || start > kMaxIndex)
        return std::unexpected(
            FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                          "GPU index '{}' is out of range", unit));
      end = start;
    } else if (RE2::FullMatch(unit, *scope_regex, &start_str, &end_str)) {
      if (!ParseUint(start_str, &start) || !ParseUint(end_str, &end) ||
          end > kMaxIndex)
        return std::unexpected(
            FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                          "GPU index range '{}' is out of range", unit));
      if (start > end)
        return std::unexpected(
            FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                          "GPU index range '{}' is reversed", unit));
      if (end - start >= kMaxGpuRangeWidth)
        return std::unexpected(FormatRichErr(
            GschedErrCode::ERR_INVALID_PARAM,
            "GPU index range '{}' spans more than {} GPUs", unit,
            kMaxGpuRangeWidth));
    } else {
      return std::unexpected(
          FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                        "Illegal GPU index list '{}' near '{}'", index_str,
                        unit));
    }

    for (uint64_t offset = 0; offset <= end - start; offset++)
      indices.emplace(static_cast<gpu_index_t>(start + offset));
  }

  return indices;
}

std::string IndexListToStr(const std::set<gpu_index_t> &indices) {
  std::vector<std::string> units;
  auto it = indices.begin();
  while (it != indices.end()) {
    gpu_index_t first = *it;
    gpu_index_t last = first;
    ++it;
    while (it != indices.end() && *it == last + 1) {
      last = *it;
      ++it;
    }

    if (first == last)
      units.emplace_back(std::to_string(first));
    else
      units.emplace_back(fmt::format("{}-{}", first, last));
  }

  return absl::StrJoin(units, ",");
}

bool ParseHostList(const std::string &host_str,
                   std::list<std::string> *host_list) {
  static const LazyRE2 bracket_regex = {
      R"(([^\[\]]*)\[([^\[\]]+)\]([^\[\]]*))"};
  static const LazyRE2 scope_regex = {R"((\d+)-(\d+))"};
  static const LazyRE2 num_regex = {R"(\d+)"};

  std::string name_str = RemoveSpaces(host_str);

  // Split on the commas that are outside of brackets.
  std::vector<std::string> units;
  std::string current;
  int depth = 0;
  for (const auto &c : name_str) {
    if (c == '[') {
      if (++depth > 1) {
        GSCHED_ERROR("Illegal node name string format: duplicate brackets");
        return false;
      }
    } else if (c == ']') {
      if (--depth < 0) {
        GSCHED_ERROR("Illegal node name string format: isolated bracket");
        return false;
      }
    } else if (c == ',' && depth == 0) {
      units.emplace_back(std::move(current));
      current.clear();
      continue;
    }
    current += c;
  }
  if (depth != 0) {
    GSCHED_ERROR("Illegal node name string format: isolated bracket");
    return false;
  }
  units.emplace_back(std::move(current));

  for (const auto &unit : units) {
    if (unit.empty()) continue;

    std::string head, body, tail;
    if (!RE2::FullMatch(unit, *bracket_regex, &head, &body, &tail)) {
      if (unit.find_first_of("[]") != std::string::npos) {
        GSCHED_ERROR("Illegal node name string format: '{}'", unit);
        return false;
      }
      host_list->emplace_back(unit);
      continue;
    }

    std::vector<std::string> parts = absl::StrSplit(body, ',');
    for (const auto &part : parts) {
      std::string start_str, end_str;
      if (RE2::FullMatch(part, *num_regex)) {
        host_list->emplace_back(fmt::format("{}{}{}", head, part, tail));
      } else if (RE2::FullMatch(part, *scope_regex, &start_str, &end_str)) {
        uint64_t start, end;
        if (!ParseUint(start_str, &start) || !ParseUint(end_str, &end) ||
            start > end) {
          GSCHED_ERROR("Illegal node range '{}' in '{}'", part, unit);
          return false;
        }
        if (end - start >= kMaxHostRangeWidth) {
          GSCHED_ERROR("Node range '{}' in '{}' spans more than {} nodes",
                       part, unit, kMaxHostRangeWidth);
          return false;
        }
        size_t width = start_str.length();
        for (uint64_t offset = 0; offset <= end - start; offset++)
          host_list->emplace_back(
              fmt::format("{}{:0>{}}{}", head, start + offset, width, tail));
      } else {
        GSCHED_ERROR("Illegal node name string format: '{}'", unit);
        return false;
      }
    }
  }

  return true;
}

std::string ReadableUnixTime(double unix_seconds) {
  absl::Time time =
      absl::UnixEpoch() + absl::Microseconds(static_cast<int64_t>(
                              std::llround(unix_seconds * 1'000'000)));
  return absl::FormatTime("%Y-%m-%dT%H:%M:%E6SZ", time, absl::UTCTimeZone());
}

}  // namespace gsched::util
