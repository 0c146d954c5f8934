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

#include "gsched/Json.h"

#include <limits>

namespace gsched::codec {

namespace Internal {

const json* FindMember(const json& j, std::string_view key) {
  if (!j.is_object()) return nullptr;
  auto it = j.find(std::string(key));
  if (it == j.end()) return nullptr;
  return &*it;
}

}  // namespace Internal

GschedExpected<json> ParseJson(std::string_view text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded())
    return Internal::Malformed("Document is not valid JSON");
  return j;
}

json JsonCodec<Logical>::Encode(const Logical& value) {
  return json{{"num_gpu", value.NumGpu()}};
}

GschedExpected<Logical> JsonCodec<Logical>::Decode(const json& j) {
  const json* num_gpu = Internal::FindMember(j, "num_gpu");
  if (num_gpu == nullptr || !num_gpu->is_number_integer())
    return Internal::Malformed(
        "Logical must be an object with an integer 'num_gpu', got {}",
        j.dump());

  // Decoded unsigned so that counts above INT64_MAX do not wrap.
  if (num_gpu->is_number_unsigned()) {
    auto count = num_gpu->get<uint64_t>();
    if (count > std::numeric_limits<uint32_t>::max())
      return std::unexpected(
          FormatRichErr(GschedErrCode::ERR_INVALID_CONSTRUCTION,
                        "GPU count {} is too large", count));
    return Logical(static_cast<uint32_t>(count));
  }

  return Logical::FromCount(num_gpu->get<int64_t>());
}

json JsonCodec<Physical>::Encode(const Physical& value) {
  return json{{"gpu_indices", value.GpuIndices()}};
}

GschedExpected<Physical> JsonCodec<Physical>::Decode(const json& j) {
  const json* indices_j = Internal::FindMember(j, "gpu_indices");
  if (indices_j == nullptr || !indices_j->is_array())
    return Internal::Malformed(
        "Physical must be an object with a 'gpu_indices' array, got {}",
        j.dump());

  std::vector<int64_t> indices;
  indices.reserve(indices_j->size());
  for (const auto& index : *indices_j) {
    if (!index.is_number_integer())
      return Internal::Malformed("GPU index {} is not an integer",
                                 index.dump());
    if (index.is_number_unsigned() &&
        index.get<uint64_t>() > std::numeric_limits<gpu_index_t>::max())
      return std::unexpected(
          FormatRichErr(GschedErrCode::ERR_INVALID_CONSTRUCTION,
                        "Illegal GPU index {}", index.get<uint64_t>()));
    indices.emplace_back(index.get<int64_t>());
  }

  return Physical::FromIndices(indices);
}

}  // namespace gsched::codec
