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

#include <absl/container/btree_map.h>

#include <string>
#include <utility>
#include <vector>

#include "Allocation.h"
#include "Resource.h"

namespace gsched {

template <ResourceUnit R>
class AllocationGroup;

// A per-node map of resources. Every stored entry is non-empty: the
// factory rejects empty entries and arithmetic drops nodes whose result
// became empty.
template <ResourceUnit R>
class ResourceGroup {
 public:
  using UnitType = R;
  using MapType = absl::btree_map<NodeId, R>;
  using const_iterator = typename MapType::const_iterator;

  ResourceGroup() = default;

  static ResourceGroup Empty() { return ResourceGroup{}; }

  static GschedExpected<ResourceGroup> Create(MapType resources) {
    for (const auto& [node_id, res] : resources) {
      if (res.IsZero())
        return std::unexpected(
            FormatRichErr(GschedErrCode::ERR_INVALID_CONSTRUCTION,
                          "Resource of node '{}' is empty", node_id));
    }
    return ResourceGroup(std::move(resources));
  }

  // A group holding a single node, or nothing if `res` is empty.
  static ResourceGroup FromNode(const NodeId& node_id, R res) {
    MapType resources;
    if (!res.IsZero()) resources.emplace(node_id, std::move(res));
    return ResourceGroup(std::move(resources));
  }

  // Grpc conversion
  template <typename Message>
    requires std::same_as<Message, GrpcMessageOf_t<ResourceGroup>>
  static GschedExpected<ResourceGroup> FromGrpc(const Message& rhs) {
    MapType resources;
    for (const auto& [node_id, grpc_res] : rhs.resources()) {
      auto res = R::FromGrpc(grpc_res);
      if (!res)
        return std::unexpected(
            WrapRichErr(std::move(res).error(), fmt::format("node '{}'",
                                                            node_id)));
      resources.emplace(node_id, std::move(res).value());
    }
    return Create(std::move(resources));
  }

  template <typename Message>
    requires std::same_as<Message, GrpcMessageOf_t<ResourceGroup>>
  explicit operator Message() const {
    Message val;
    auto* grpc_resources = val.mutable_resources();
    for (const auto& [node_id, res] : resources_)
      (*grpc_resources)[node_id] = static_cast<GrpcMessageOf_t<R>>(res);
    return val;
  }

  const R& at(const NodeId& node_id) const { return resources_.at(node_id); }
  bool contains(const NodeId& node_id) const {
    return resources_.contains(node_id);
  }
  size_t size() const { return resources_.size(); }
  const_iterator begin() const { return resources_.begin(); }
  const_iterator end() const { return resources_.end(); }

  const MapType& Resources() const { return resources_; }

  std::vector<NodeId> NodeIds() const {
    std::vector<NodeId> node_ids;
    node_ids.reserve(resources_.size());
    for (const auto& [node_id, _] : resources_) node_ids.emplace_back(node_id);
    return node_ids;
  }

  // True if every node of `rhs` is also a node of this group. The value
  // types may differ.
  template <ResourceUnit U>
  bool ContainsNodesOf(const ResourceGroup<U>& rhs) const {
    for (const auto& [node_id, _] : rhs)
      if (!resources_.contains(node_id)) return false;
    return true;
  }

  GschedExpected<ResourceGroup> Add(const ResourceGroup& rhs) const {
    MapType result = resources_;
    for (const auto& [node_id, rhs_res] : rhs.resources_) {
      auto it = result.find(node_id);
      if (it == result.end()) {
        result.emplace(node_id, rhs_res);
        continue;
      }

      auto sum = it->second.Add(rhs_res);
      if (!sum)
        return std::unexpected(WrapRichErr(
            std::move(sum).error(), fmt::format("node '{}'", node_id)));
      it->second = std::move(sum).value();
    }
    return ResourceGroup(std::move(result));
  }

  // Every node of `rhs` must be present in this group.
  GschedExpected<ResourceGroup> Subtract(const ResourceGroup& rhs) const {
    if (!ContainsNodesOf(rhs))
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INVALID_KEY_SET,
          "Nodes [{}] are not part of the group [{}]",
          fmt::join(rhs.NodeIdsNotIn_(*this), ","), fmt::join(NodeIds(), ",")));

    MapType result;
    for (const auto& [node_id, res] : resources_) {
      auto rhs_it = rhs.resources_.find(node_id);
      if (rhs_it == rhs.resources_.end()) {
        result.emplace(node_id, res);
        continue;
      }

      auto diff = res.Subtract(rhs_it->second);
      if (!diff)
        return std::unexpected(WrapRichErr(
            std::move(diff).error(), fmt::format("node '{}'", node_id)));
      if (!diff.value().IsZero())
        result.emplace(node_id, std::move(diff).value());
    }
    return ResourceGroup(std::move(result));
  }

  // Collapses the whole group into one value.
  GschedExpected<R> Reduce() const {
    R result = R::Empty();
    for (const auto& [node_id, res] : resources_) {
      auto sum = result.Add(res);
      if (!sum)
        return std::unexpected(WrapRichErr(
            std::move(sum).error(), fmt::format("node '{}'", node_id)));
      result = std::move(sum).value();
    }
    return result;
  }

  auto AsLogical() const
    requires PhysicalResourceUnit<R>
  {
    using L = LogicalTypeOf_t<R>;
    typename ResourceGroup<L>::MapType result;
    for (const auto& [node_id, res] : resources_)
      result.emplace(node_id, res.AsLogical());
    return ResourceGroup<L>(std::move(result));
  }

  // Node-wise intersection. Nodes left with nothing in common are dropped.
  ResourceGroup Intersection(const ResourceGroup& rhs) const
    requires PhysicalResourceUnit<R>
  {
    MapType result;
    for (const auto& [node_id, res] : resources_) {
      auto rhs_it = rhs.resources_.find(node_id);
      if (rhs_it == rhs.resources_.end()) continue;

      R common = res.Intersection(rhs_it->second);
      if (!common.IsZero()) result.emplace(node_id, std::move(common));
    }
    return ResourceGroup(std::move(result));
  }

  bool IsSubset(const ResourceGroup& rhs) const { return *this <= rhs; }

  bool IsZero() const { return resources_.empty(); }
  explicit operator bool() const { return !IsZero(); }

  friend bool operator==(const ResourceGroup& lhs, const ResourceGroup& rhs) {
    return lhs.resources_ == rhs.resources_;
  }

  // Every node of lhs is present in rhs with a value <= the one in rhs.
  friend bool operator<=(const ResourceGroup& lhs, const ResourceGroup& rhs) {
    for (const auto& [node_id, lhs_res] : lhs.resources_) {
      auto rhs_it = rhs.resources_.find(node_id);
      if (rhs_it == rhs.resources_.end()) return false;
      if (!(lhs_res <= rhs_it->second)) return false;
    }
    return true;
  }

  friend bool operator>=(const ResourceGroup& lhs, const ResourceGroup& rhs) {
    return rhs <= lhs;
  }

  friend bool operator<(const ResourceGroup& lhs, const ResourceGroup& rhs) {
    return lhs <= rhs && !(lhs == rhs);
  }

  friend bool operator>(const ResourceGroup& lhs, const ResourceGroup& rhs) {
    return rhs < lhs;
  }

 private:
  template <ResourceUnit U>
  friend class ResourceGroup;

  template <ResourceUnit U>
  friend class AllocationGroup;

  explicit ResourceGroup(MapType resources)
      : resources_(std::move(resources)) {}

  std::vector<NodeId> NodeIdsNotIn_(const ResourceGroup& rhs) const {
    std::vector<NodeId> node_ids;
    for (const auto& [node_id, _] : resources_)
      if (!rhs.resources_.contains(node_id)) node_ids.emplace_back(node_id);
    return node_ids;
  }

  MapType resources_;
};

template <typename R>
  requires PhysicalResourceUnit<R>
struct LogicalTypeOf<ResourceGroup<R>> {
  using type = ResourceGroup<LogicalTypeOf_t<R>>;
};

template <>
struct GrpcMessageOf<ResourceGroup<Logical>> {
  using type = grpc::LogicalCluster;
};

template <>
struct GrpcMessageOf<ResourceGroup<Physical>> {
  using type = grpc::PhysicalCluster;
};

template <>
struct GrpcMessageOf<ResourceGroup<Allocation<Logical>>> {
  using type = grpc::LogicalAllocationCluster;
};

template <>
struct GrpcMessageOf<ResourceGroup<Allocation<Physical>>> {
  using type = grpc::PhysicalAllocationCluster;
};

}  // namespace gsched

namespace fmt {

// Printed by the formatter below instead of as a plain range.
template <typename R, typename Char>
struct is_range<gsched::ResourceGroup<R>, Char> : std::false_type {};

template <typename R>
struct formatter<gsched::ResourceGroup<R>> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const gsched::ResourceGroup<R>& v, FormatContext& ctx) const {
    auto out = fmt::format_to(ctx.out(), "{{");
    bool first = true;
    for (const auto& [node_id, res] : v) {
      out = fmt::format_to(out, "{}{}: {}", first ? "" : ", ", node_id, res);
      first = false;
    }
    return fmt::format_to(out, "}}");
  }
};

}  // namespace fmt
