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

#include <concepts>
#include <utility>

#include "Logger.h"
#include "Resource.h"

namespace gsched {

// A resource held by some owner, split into the part handed out
// (acquired) and the part still available (released).
// released <= total always holds.
template <ResourceUnit R>
class Allocation {
 public:
  using UnitType = R;

  Allocation() = default;

  // Nothing handed out yet.
  explicit Allocation(R total) : total_(total), released_(std::move(total)) {}

  static Allocation Empty() { return Allocation{}; }

  static GschedExpected<Allocation> Create(R total, R released) {
    if (!(released <= total))
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INSUFFICIENT_RESOURCE,
          "Released resource {} exceeds total {}", released, total));

    return Allocation(std::move(total), std::move(released));
  }

  // Grpc conversion
  template <typename Message>
    requires std::same_as<Message, GrpcMessageOf_t<Allocation>>
  static GschedExpected<Allocation> FromGrpc(const Message& rhs) {
    auto total = R::FromGrpc(rhs.total());
    if (!total) return std::unexpected(WrapRichErr(total.error(), "total"));

    auto released = R::FromGrpc(rhs.released());
    if (!released)
      return std::unexpected(WrapRichErr(released.error(), "released"));

    return Create(std::move(total).value(), std::move(released).value());
  }

  template <typename Message>
    requires std::same_as<Message, GrpcMessageOf_t<Allocation>>
  explicit operator Message() const {
    Message val;
    *val.mutable_total() = static_cast<GrpcMessageOf_t<R>>(total_);
    *val.mutable_released() = static_cast<GrpcMessageOf_t<R>>(released_);
    return val;
  }

  const R& Total() const { return total_; }
  const R& Released() const { return released_; }

  R Acquired() const {
    auto acquired = total_.Subtract(released_);
    GSCHED_ASSERT_MSG(acquired.has_value(),
                      "released resource must be part of total");
    return std::move(acquired).value();
  }

  // Hands out `block` from the released part.
  GschedExpected<Allocation> Acquire(const R& block) const {
    auto released = released_.Subtract(block);
    if (!released)
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INSUFFICIENT_RESOURCE,
          "Cannot acquire {} from released {}", block, released_));

    return Allocation(total_, std::move(released).value());
  }

  // Puts `block` back into the released part.
  GschedExpected<Allocation> Release(const R& block) const {
    auto released = released_.Add(block);
    if (!released) return std::unexpected(std::move(released).error());

    if (!(released.value() <= total_))
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INSUFFICIENT_RESOURCE,
          "Releasing {} would exceed total {}", block, total_));

    return Allocation(total_, std::move(released).value());
  }

  GschedExpected<Allocation> Add(const Allocation& rhs) const {
    auto total = total_.Add(rhs.total_);
    if (!total) return std::unexpected(std::move(total).error());

    auto released = released_.Add(rhs.released_);
    if (!released) return std::unexpected(std::move(released).error());

    return Create(std::move(total).value(), std::move(released).value());
  }

  GschedExpected<Allocation> Subtract(const Allocation& rhs) const {
    auto total = total_.Subtract(rhs.total_);
    if (!total) return std::unexpected(std::move(total).error());

    auto released = released_.Subtract(rhs.released_);
    if (!released) return std::unexpected(std::move(released).error());

    return Create(std::move(total).value(), std::move(released).value());
  }

  auto AsLogical() const
    requires PhysicalResourceUnit<R>
  {
    return Allocation<LogicalTypeOf_t<R>>(total_.AsLogical(),
                                          released_.AsLogical());
  }

  Allocation Intersection(const Allocation& rhs) const
    requires PhysicalResourceUnit<R>
  {
    return Allocation(total_.Intersection(rhs.total_),
                      released_.Intersection(rhs.released_));
  }

  bool IsZero() const { return total_.IsZero(); }
  explicit operator bool() const { return !IsZero(); }

  friend bool operator==(const Allocation& lhs, const Allocation& rhs) {
    return lhs.total_ == rhs.total_ && lhs.released_ == rhs.released_;
  }

  // Compares totals first and falls back to the released parts when the
  // totals are equal.
  friend bool operator<(const Allocation& lhs, const Allocation& rhs) {
    if (!(lhs.total_ == rhs.total_)) return lhs.total_ < rhs.total_;
    return lhs.released_ < rhs.released_;
  }

  friend bool operator>(const Allocation& lhs, const Allocation& rhs) {
    return rhs < lhs;
  }

  friend bool operator<=(const Allocation& lhs, const Allocation& rhs) {
    return lhs < rhs || lhs == rhs;
  }

  friend bool operator>=(const Allocation& lhs, const Allocation& rhs) {
    return lhs > rhs || lhs == rhs;
  }

 private:
  template <ResourceUnit U>
  friend class Allocation;

  Allocation(R total, R released)
      : total_(std::move(total)), released_(std::move(released)) {}

  R total_;
  R released_;
};

template <typename R>
  requires PhysicalResourceUnit<R>
struct LogicalTypeOf<Allocation<R>> {
  using type = Allocation<LogicalTypeOf_t<R>>;
};

template <>
struct GrpcMessageOf<Allocation<Logical>> {
  using type = grpc::LogicalAllocation;
};

template <>
struct GrpcMessageOf<Allocation<Physical>> {
  using type = grpc::PhysicalAllocation;
};

}  // namespace gsched

namespace fmt {

template <typename R>
struct formatter<gsched::Allocation<R>> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const gsched::Allocation<R>& v, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "(total={}, released={})", v.Total(),
                          v.Released());
  }
};

}  // namespace fmt
