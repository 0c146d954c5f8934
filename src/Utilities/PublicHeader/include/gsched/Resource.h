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
#include <spdlog/fmt/ranges.h>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <ranges>
#include <set>
#include <string>
#include <utility>

#include "PublicHeader.h"
#include "protos/ResourceModel.pb.h"

namespace gsched {

/* ----------- Resource unit concepts and traits */

template <typename T>
concept ResourceUnit = std::regular<T> && requires(const T& a, const T& b) {
  { T::Empty() } -> std::same_as<T>;
  { a.Add(b) } -> std::same_as<GschedExpected<T>>;
  { a.Subtract(b) } -> std::same_as<GschedExpected<T>>;
  { a.IsZero() } -> std::convertible_to<bool>;
  { a < b } -> std::convertible_to<bool>;
  { a > b } -> std::convertible_to<bool>;
  { a <= b } -> std::convertible_to<bool>;
};

// Maps a physical resource type to the logical type it collapses into.
// Only physical types specialize it.
template <typename T>
struct LogicalTypeOf {};

template <typename T>
using LogicalTypeOf_t = typename LogicalTypeOf<T>::type;

template <typename T>
concept PhysicalResourceUnit =
    ResourceUnit<T> && requires(const T& a, const T& b) {
      typename LogicalTypeOf<T>::type;
      { a.AsLogical() } -> std::same_as<LogicalTypeOf_t<T>>;
      { a.Intersection(b) } -> std::same_as<T>;
    };

// Maps a resource type to the protobuf message it is exchanged as.
template <typename T>
struct GrpcMessageOf {};

template <typename T>
using GrpcMessageOf_t = typename GrpcMessageOf<T>::type;

/* ----------- Logical */

// A bare GPU count. Knows nothing about which devices are meant.
class Logical {
 public:
  Logical() = default;
  explicit Logical(uint32_t num_gpu) : num_gpu_(num_gpu) {}

  static Logical Empty() { return Logical{}; }

  // Rejects negative or overflowing counts.
  static GschedExpected<Logical> FromCount(int64_t num_gpu);

  // Grpc conversion
  static GschedExpected<Logical> FromGrpc(const grpc::Logical& rhs);
  explicit operator grpc::Logical() const;

  uint32_t NumGpu() const { return num_gpu_; }

  GschedExpected<Logical> Add(const Logical& rhs) const;
  GschedExpected<Logical> Subtract(const Logical& rhs) const;

  bool IsZero() const { return num_gpu_ == 0; }
  explicit operator bool() const { return !IsZero(); }

 private:
  uint32_t num_gpu_{0};
};

bool operator==(const Logical& lhs, const Logical& rhs);
bool operator<(const Logical& lhs, const Logical& rhs);
bool operator>(const Logical& lhs, const Logical& rhs);
bool operator<=(const Logical& lhs, const Logical& rhs);
bool operator>=(const Logical& lhs, const Logical& rhs);

/* ----------- Physical */

// A set of concrete GPU device indices on one node. Ordering is set
// inclusion, so two disjoint sets are neither smaller nor greater.
class Physical {
 public:
  using IndexSet = std::set<gpu_index_t>;

  Physical() = default;
  explicit Physical(IndexSet gpu_indices)
      : gpu_indices_(std::move(gpu_indices)) {}
  Physical(std::initializer_list<gpu_index_t> gpu_indices)
      : gpu_indices_(gpu_indices) {}

  static Physical Empty() { return Physical{}; }

  // Duplicates collapse. Negative or oversized indices are rejected.
  template <std::ranges::input_range Range>
    requires std::integral<std::ranges::range_value_t<Range>>
  static GschedExpected<Physical> FromIndices(const Range& indices) {
    IndexSet index_set;
    for (const auto& index : indices) {
      if (std::cmp_less(index, 0) ||
          std::cmp_greater(index, std::numeric_limits<gpu_index_t>::max()))
        return std::unexpected(
            FormatRichErr(GschedErrCode::ERR_INVALID_CONSTRUCTION,
                          "Illegal GPU index {}", index));
      index_set.emplace(static_cast<gpu_index_t>(index));
    }
    return Physical(std::move(index_set));
  }

  // Grpc conversion
  static GschedExpected<Physical> FromGrpc(const grpc::Physical& rhs);
  explicit operator grpc::Physical() const;

  const IndexSet& GpuIndices() const { return gpu_indices_; }
  size_t size() const { return gpu_indices_.size(); }
  bool contains(gpu_index_t index) const {
    return gpu_indices_.contains(index);
  }

  // Fails with ERR_RESOURCE_CONFLICT when the two sets overlap.
  GschedExpected<Physical> Add(const Physical& rhs) const;
  // Fails with ERR_INSUFFICIENT_RESOURCE unless rhs is a subset of this.
  GschedExpected<Physical> Subtract(const Physical& rhs) const;

  Logical AsLogical() const;
  Physical Intersection(const Physical& rhs) const;
  bool IsSubset(const Physical& rhs) const;

  bool IsZero() const { return gpu_indices_.empty(); }
  explicit operator bool() const { return !IsZero(); }

 private:
  IndexSet gpu_indices_;
};

bool operator==(const Physical& lhs, const Physical& rhs);
bool operator<(const Physical& lhs, const Physical& rhs);
bool operator>(const Physical& lhs, const Physical& rhs);
bool operator<=(const Physical& lhs, const Physical& rhs);
bool operator>=(const Physical& lhs, const Physical& rhs);

template <>
struct LogicalTypeOf<Physical> {
  using type = Logical;
};

template <>
struct GrpcMessageOf<Logical> {
  using type = grpc::Logical;
};

template <>
struct GrpcMessageOf<Physical> {
  using type = grpc::Physical;
};

/* ----------- Folding */

// Folds a sequence of resources starting from the empty value. The first
// failing step aborts the fold.
template <std::ranges::input_range Range>
  requires ResourceUnit<std::ranges::range_value_t<Range>>
GschedExpected<std::ranges::range_value_t<Range>> Sum(
    const Range& resources) {
  using R = std::ranges::range_value_t<Range>;

  R result = R::Empty();
  for (const auto& res : resources) {
    auto sum = result.Add(res);
    if (!sum) return std::unexpected(std::move(sum).error());
    result = std::move(sum).value();
  }
  return result;
}

}  // namespace gsched

// Custom type formatting
namespace fmt {

template <>
struct formatter<gsched::Logical> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const gsched::Logical& v, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "Logical({})", v.NumGpu());
  }
};

template <>
struct formatter<gsched::Physical> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const gsched::Physical& v, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "Physical{{{}}}",
                          fmt::join(v.GpuIndices(), ","));
  }
};

}  // namespace fmt
