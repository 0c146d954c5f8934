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

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "protos/PublicDefs.pb.h"

#if !defined(GSCHED_VERSION_STRING)
#  define GSCHED_VERSION_STRING "Unknown"
#endif

namespace gsched {

using GschedErrCode = gsched::grpc::ErrCode;

using GschedRichError = gsched::grpc::RichError;

template <typename T>
using GschedExpected = std::expected<T, GschedRichError>;

using NodeId = std::string;
using gpu_index_t = uint32_t;

constexpr const char* kLogPattern =
    "[%^%L%$ %C-%m-%d %H:%M:%S.%e %s:%#][%n] %v";

constexpr uint64_t kDefaultMaxLogFileSize = 1024 * 1024 * 50;  // 50 MiB
constexpr uint64_t kDefaultMaxLogFileNum = 3;

inline const char* const kDefaultConfigPath = "/etc/gsched/config.yaml";
inline const char* const kDefaultLogPath = "/tmp/gsched/gsched.log";

namespace Internal {

constexpr size_t kErrCodeCount = 9;

// clang-format off
constexpr std::array<std::string_view, kErrCodeCount> kGschedErrStrArr = {
    // 0 - 4
    "Success",
    "Invalid resource construction",
    "Resource conflict",
    "Insufficient resource",
    "Node set mismatch",

    // 5 - 8
    "Invalid state transition",
    "Invalid parameter",
    "Malformed document",
    "Invalid configuration",
};
// clang-format on

}  // namespace Internal

template <typename... Args>
inline GschedRichError FormatRichErr(GschedErrCode code,
                                     fmt::format_string<Args...> fmt,
                                     Args&&... args) {
  GschedRichError rich_err;

  rich_err.set_code(code);
  rich_err.set_description(fmt::format(fmt, std::forward<Args>(args)...));

  return rich_err;
}

inline std::string_view GschedErrStr(GschedErrCode err) {
  auto idx = static_cast<size_t>(err);
  if (idx >= Internal::kErrCodeCount) return "Unknown error";
  return Internal::kGschedErrStrArr[idx];
}

// Prefixes the description of an existing error with some context while
// keeping its code and transition payload.
GschedRichError WrapRichErr(GschedRichError err, std::string_view context);

}  // namespace gsched
