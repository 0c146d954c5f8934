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

#include "Allocation.h"
#include "ResourceGroup.h"

namespace gsched {

// Per-node allocations of a whole cluster. Acquire and Release apply to
// every listed node or to none of them.
template <ResourceUnit R>
class AllocationGroup {
 public:
  using UnitType = R;
  using AllocationType = Allocation<R>;
  using GroupType = ResourceGroup<R>;
  using AllocationMap = typename ResourceGroup<Allocation<R>>::MapType;
  using const_iterator = typename AllocationMap::const_iterator;

  AllocationGroup() = default;
  explicit AllocationGroup(ResourceGroup<Allocation<R>> allocations)
      : allocations_(std::move(allocations)) {}

  static AllocationGroup Empty() { return AllocationGroup{}; }

  static GschedExpected<AllocationGroup> Create(AllocationMap allocations) {
    auto group = ResourceGroup<Allocation<R>>::Create(std::move(allocations));
    if (!group) return std::unexpected(std::move(group).error());
    return AllocationGroup(std::move(group).value());
  }

  // Every node starts with all of its resource released.
  static AllocationGroup FromTotal(const GroupType& total) {
    AllocationMap allocations;
    for (const auto& [node_id, res] : total)
      allocations.emplace(node_id, Allocation<R>(res));
    return AllocationGroup(
        ResourceGroup<Allocation<R>>(std::move(allocations)));
  }

  // Grpc conversion
  template <typename Message>
    requires std::same_as<Message, GrpcMessageOf_t<AllocationGroup>>
  static GschedExpected<AllocationGroup> FromGrpc(const Message& rhs) {
    auto group = ResourceGroup<Allocation<R>>::FromGrpc(rhs);
    if (!group) return std::unexpected(std::move(group).error());
    return AllocationGroup(std::move(group).value());
  }

  template <typename Message>
    requires std::same_as<Message, GrpcMessageOf_t<AllocationGroup>>
  explicit operator Message() const {
    return static_cast<Message>(allocations_);
  }

  const Allocation<R>& at(const NodeId& node_id) const {
    return allocations_.at(node_id);
  }
  bool contains(const NodeId& node_id) const {
    return allocations_.contains(node_id);
  }
  size_t size() const { return allocations_.size(); }
  const_iterator begin() const { return allocations_.begin(); }
  const_iterator end() const { return allocations_.end(); }

  const ResourceGroup<Allocation<R>>& Allocations() const {
    return allocations_;
  }

  GroupType Total() const {
    return Project_([](const Allocation<R>& a) { return a.Total(); });
  }

  // Nodes with nothing acquired are left out.
  GroupType Acquired() const {
    return Project_([](const Allocation<R>& a) { return a.Acquired(); });
  }

  // Nodes with nothing released are left out.
  GroupType Released() const {
    return Project_([](const Allocation<R>& a) { return a.Released(); });
  }

  GschedExpected<AllocationGroup> Acquire(const GroupType& group) const {
    return Apply_(group, "acquired",
                  [](const Allocation<R>& a, const R& block) {
                    return a.Acquire(block);
                  });
  }

  GschedExpected<AllocationGroup> Release(const GroupType& group) const {
    return Apply_(group, "released",
                  [](const Allocation<R>& a, const R& block) {
                    return a.Release(block);
                  });
  }

  GschedExpected<AllocationGroup> Add(const AllocationGroup& rhs) const {
    auto sum = allocations_.Add(rhs.allocations_);
    if (!sum) return std::unexpected(std::move(sum).error());
    return AllocationGroup(std::move(sum).value());
  }

  GschedExpected<AllocationGroup> Subtract(const AllocationGroup& rhs) const {
    auto diff = allocations_.Subtract(rhs.allocations_);
    if (!diff) return std::unexpected(std::move(diff).error());
    return AllocationGroup(std::move(diff).value());
  }

  auto AsLogical() const
    requires PhysicalResourceUnit<R>
  {
    return AllocationGroup<LogicalTypeOf_t<R>>(allocations_.AsLogical());
  }

  AllocationGroup Intersection(const AllocationGroup& rhs) const
    requires PhysicalResourceUnit<R>
  {
    return AllocationGroup(allocations_.Intersection(rhs.allocations_));
  }

  bool IsZero() const { return allocations_.IsZero(); }
  explicit operator bool() const { return !IsZero(); }

  friend bool operator==(const AllocationGroup& lhs,
                         const AllocationGroup& rhs) {
    return lhs.allocations_ == rhs.allocations_;
  }
  friend bool operator<(const AllocationGroup& lhs,
                        const AllocationGroup& rhs) {
    return lhs.allocations_ < rhs.allocations_;
  }
  friend bool operator>(const AllocationGroup& lhs,
                        const AllocationGroup& rhs) {
    return lhs.allocations_ > rhs.allocations_;
  }
  friend bool operator<=(const AllocationGroup& lhs,
                         const AllocationGroup& rhs) {
    return lhs.allocations_ <= rhs.allocations_;
  }
  friend bool operator>=(const AllocationGroup& lhs,
                         const AllocationGroup& rhs) {
    return lhs.allocations_ >= rhs.allocations_;
  }

 private:
  template <typename Projection>
  GroupType Project_(Projection projection) const {
    typename GroupType::MapType result;
    for (const auto& [node_id, alloc] : allocations_) {
      R res = projection(alloc);
      if (!res.IsZero()) result.emplace(node_id, std::move(res));
    }
    return GroupType(std::move(result));
  }

  // Builds the updated map on the side so that a failure on any node
  // leaves this group untouched.
  template <typename Op>
  GschedExpected<AllocationGroup> Apply_(const GroupType& group,
                                         std::string_view action,
                                         Op op) const {
    if (!allocations_.ContainsNodesOf(group))
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INVALID_KEY_SET,
          "Resource on nodes [{}] cannot be {}: not part of the cluster [{}]",
          fmt::join(group.NodeIds(), ","), action,
          fmt::join(allocations_.NodeIds(), ",")));

    AllocationMap updated = allocations_.Resources();
    for (const auto& [node_id, block] : group) {
      auto it = updated.find(node_id);
      auto next = op(it->second, block);
      if (!next)
        return std::unexpected(WrapRichErr(
            std::move(next).error(), fmt::format("node '{}'", node_id)));
      it->second = std::move(next).value();
    }
    return AllocationGroup(
        ResourceGroup<Allocation<R>>(std::move(updated)));
  }

  template <ResourceUnit U>
  friend class AllocationGroup;

  ResourceGroup<Allocation<R>> allocations_;
};

template <typename R>
  requires PhysicalResourceUnit<R>
struct LogicalTypeOf<AllocationGroup<R>> {
  using type = AllocationGroup<LogicalTypeOf_t<R>>;
};

template <>
struct GrpcMessageOf<AllocationGroup<Logical>> {
  using type = grpc::LogicalAllocationCluster;
};

template <>
struct GrpcMessageOf<AllocationGroup<Physical>> {
  using type = grpc::PhysicalAllocationCluster;
};

}  // namespace gsched

namespace fmt {

// Printed by the formatter below instead of as a plain range.
template <typename R, typename Char>
struct is_range<gsched::AllocationGroup<R>, Char> : std::false_type {};

template <typename R>
struct formatter<gsched::AllocationGroup<R>>
    : formatter<gsched::ResourceGroup<gsched::Allocation<R>>> {
  template <typename FormatContext>
  auto format(const gsched::AllocationGroup<R>& v, FormatContext& ctx) const {
    return formatter<gsched::ResourceGroup<gsched::Allocation<R>>>::format(
        v.Allocations(), ctx);
  }
};

}  // namespace fmt
