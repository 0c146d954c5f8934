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

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "gsched/ResourceModel.h"
#include "gsched/State.h"

namespace gsched::codec {

using json = nlohmann::json;

// Structural problems (wrong JSON types, missing fields) are reported as
// ERR_MALFORMED_DOCUMENT. Values that are well formed but violate a rule
// of the model keep the error of the model.
template <typename T>
struct JsonCodec;

template <typename T>
json ToJson(const T& value) {
  return JsonCodec<T>::Encode(value);
}

template <typename T>
GschedExpected<T> FromJson(const json& j) {
  return JsonCodec<T>::Decode(j);
}

GschedExpected<json> ParseJson(std::string_view text);

template <typename T>
std::string DumpJson(const T& value, int indent = -1) {
  return ToJson(value).dump(indent);
}

template <typename T>
GschedExpected<T> LoadJson(std::string_view text) {
  auto j = ParseJson(text);
  if (!j) return std::unexpected(std::move(j).error());
  return FromJson<T>(j.value());
}

namespace Internal {

template <typename... Args>
std::unexpected<GschedRichError> Malformed(fmt::format_string<Args...> fmt,
                                           Args&&... args) {
  return std::unexpected(FormatRichErr(GschedErrCode::ERR_MALFORMED_DOCUMENT,
                                       fmt, std::forward<Args>(args)...));
}

// Returns the member `key` of an object, or nullptr if it is missing or
// `j` is not an object.
const json* FindMember(const json& j, std::string_view key);

}  // namespace Internal

template <>
struct JsonCodec<Logical> {
  static json Encode(const Logical& value);
  static GschedExpected<Logical> Decode(const json& j);
};

template <>
struct JsonCodec<Physical> {
  static json Encode(const Physical& value);
  static GschedExpected<Physical> Decode(const json& j);
};

template <typename R>
struct JsonCodec<Allocation<R>> {
  static json Encode(const Allocation<R>& value) {
    return json{{"total", ToJson(value.Total())},
                {"released", ToJson(value.Released())}};
  }

  static GschedExpected<Allocation<R>> Decode(const json& j) {
    const json* total_j = Internal::FindMember(j, "total");
    const json* released_j = Internal::FindMember(j, "released");
    if (total_j == nullptr || released_j == nullptr)
      return Internal::Malformed(
          "Allocation must be an object with 'total' and 'released'");

    auto total = FromJson<R>(*total_j);
    if (!total) return std::unexpected(WrapRichErr(total.error(), "total"));

    auto released = FromJson<R>(*released_j);
    if (!released)
      return std::unexpected(WrapRichErr(released.error(), "released"));

    return Allocation<R>::Create(std::move(total).value(),
                                 std::move(released).value());
  }
};

template <typename R>
struct JsonCodec<ResourceGroup<R>> {
  static json Encode(const ResourceGroup<R>& value) {
    json j = json::object();
    for (const auto& [node_id, res] : value) j[node_id] = ToJson(res);
    return j;
  }

  static GschedExpected<ResourceGroup<R>> Decode(const json& j) {
    if (!j.is_object())
      return Internal::Malformed("Resource group must be a JSON object");

    typename ResourceGroup<R>::MapType resources;
    for (const auto& [node_id, res_j] : j.items()) {
      auto res = FromJson<R>(res_j);
      if (!res)
        return std::unexpected(
            WrapRichErr(res.error(), fmt::format("node '{}'", node_id)));
      resources.emplace(node_id, std::move(res).value());
    }
    return ResourceGroup<R>::Create(std::move(resources));
  }
};

template <typename R>
struct JsonCodec<AllocationGroup<R>> {
  static json Encode(const AllocationGroup<R>& value) {
    return ToJson(value.Allocations());
  }

  static GschedExpected<AllocationGroup<R>> Decode(const json& j) {
    auto group = FromJson<ResourceGroup<Allocation<R>>>(j);
    if (!group) return std::unexpected(std::move(group).error());
    return AllocationGroup<R>(std::move(group).value());
  }
};

template <StateMachineEnum S>
struct JsonCodec<StateHistory<S>> {
  static json Encode(const StateHistory<S>& value) {
    json states = json::array();
    for (const auto& s : value.States()) states.push_back(ToUnderlying(s));
    return json{{"timestamps", value.Timestamps()}, {"states", states}};
  }

  static GschedExpected<StateHistory<S>> Decode(const json& j) {
    const json* timestamps_j = Internal::FindMember(j, "timestamps");
    const json* states_j = Internal::FindMember(j, "states");
    if (timestamps_j == nullptr || states_j == nullptr ||
        !timestamps_j->is_array() || !states_j->is_array())
      return Internal::Malformed(
          "State history must be an object with 'timestamps' and 'states' "
          "arrays");

    std::vector<double> timestamps;
    for (const auto& ts : *timestamps_j) {
      if (!ts.is_number())
        return Internal::Malformed("Timestamp {} is not a number", ts.dump());
      timestamps.emplace_back(ts.get<double>());
    }

    std::vector<S> states;
    for (const auto& raw : *states_j) {
      if (!raw.is_number_unsigned())
        return Internal::Malformed("State {} is not a non-negative integer",
                                   raw.dump());
      auto state = StateFromUnderlying<S>(raw.get<uint64_t>());
      if (!state) return std::unexpected(std::move(state).error());
      states.emplace_back(state.value());
    }

    return StateHistory<S>::FromRaw(std::move(timestamps), std::move(states));
  }
};

}  // namespace gsched::codec
