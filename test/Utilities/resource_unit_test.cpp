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

#include <gtest/gtest.h>

#include <vector>

#include "gsched/Resource.h"

using namespace gsched;

TEST(LOGICAL, from_count) {
  auto two = Logical::FromCount(2);
  ASSERT_TRUE(two.has_value());
  ASSERT_EQ(two->NumGpu(), 2U);

  auto zero = Logical::FromCount(0);
  ASSERT_TRUE(zero.has_value());
  ASSERT_TRUE(zero->IsZero());
  ASSERT_FALSE(static_cast<bool>(zero.value()));
  ASSERT_EQ(zero.value(), Logical::Empty());
}

TEST(LOGICAL, negative_count_rejected) {
  auto res = Logical::FromCount(-1);
  ASSERT_FALSE(res.has_value());
  ASSERT_EQ(res.error().code(), GschedErrCode::ERR_INVALID_CONSTRUCTION);

  res = Logical::FromCount(int64_t{1} << 40);
  ASSERT_FALSE(res.has_value());
  ASSERT_EQ(res.error().code(), GschedErrCode::ERR_INVALID_CONSTRUCTION);
}

TEST(LOGICAL, add_subtract) {
  auto sum = Logical(3).Add(Logical(2));
  ASSERT_TRUE(sum.has_value());
  ASSERT_EQ(sum.value(), Logical(5));

  auto diff = Logical(3).Subtract(Logical(2));
  ASSERT_TRUE(diff.has_value());
  ASSERT_EQ(diff.value(), Logical(1));

  auto underflow = Logical(2).Subtract(Logical(3));
  ASSERT_FALSE(underflow.has_value());
  ASSERT_EQ(underflow.error().code(), GschedErrCode::ERR_INSUFFICIENT_RESOURCE);
}

TEST(LOGICAL, ordering) {
  ASSERT_LT(Logical(1), Logical(2));
  ASSERT_GT(Logical(3), Logical(2));
  ASSERT_LE(Logical(2), Logical(2));
  ASSERT_GE(Logical(2), Logical(2));
  ASSERT_PRED2([](const auto& lhs, const auto& rhs) { return !(lhs < rhs); },
               Logical(2), Logical(2));
}

TEST(PHYSICAL, duplicates_collapse) {
  std::vector<int64_t> indices{3, 1, 3, 0, 1};
  auto res = Physical::FromIndices(indices);
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res.value(), Physical({0, 1, 3}));
  ASSERT_EQ(res->size(), 3U);
}

TEST(PHYSICAL, negative_index_rejected) {
  std::vector<int64_t> indices{0, -2};
  auto res = Physical::FromIndices(indices);
  ASSERT_FALSE(res.has_value());
  ASSERT_EQ(res.error().code(), GschedErrCode::ERR_INVALID_CONSTRUCTION);
}

TEST(PHYSICAL, add_disjoint) {
  auto sum = Physical({0, 1}).Add(Physical({2}));
  ASSERT_TRUE(sum.has_value());
  ASSERT_EQ(sum.value(), Physical({0, 1, 2}));
}

TEST(PHYSICAL, add_overlap_conflicts) {
  auto sum = Physical({0, 1}).Add(Physical({1, 2}));
  ASSERT_FALSE(sum.has_value());
  ASSERT_EQ(sum.error().code(), GschedErrCode::ERR_RESOURCE_CONFLICT);
}

TEST(PHYSICAL, subtract) {
  auto diff = Physical({0, 1, 2}).Subtract(Physical({1}));
  ASSERT_TRUE(diff.has_value());
  ASSERT_EQ(diff.value(), Physical({0, 2}));

  auto missing = Physical({0, 1}).Subtract(Physical({1, 5}));
  ASSERT_FALSE(missing.has_value());
  ASSERT_EQ(missing.error().code(), GschedErrCode::ERR_INSUFFICIENT_RESOURCE);
}

TEST(PHYSICAL, set_ordering) {
  ASSERT_LT(Physical({0}), Physical({0, 1}));
  ASSERT_GT(Physical({0, 1, 2}), Physical({1, 2}));
  ASSERT_LE(Physical({0, 1}), Physical({0, 1}));

  // Disjoint sets are not comparable.
  Physical lhs{0, 2};
  Physical rhs{1, 3};
  ASSERT_FALSE(lhs < rhs);
  ASSERT_FALSE(lhs > rhs);
  ASSERT_FALSE(lhs <= rhs);
  ASSERT_FALSE(lhs == rhs);
}

TEST(PHYSICAL, as_logical_and_intersection) {
  ASSERT_EQ(Physical({4, 5, 7}).AsLogical(), Logical(3));
  ASSERT_EQ(Physical::Empty().AsLogical(), Logical::Empty());

  ASSERT_EQ(Physical({0, 1, 2}).Intersection(Physical({1, 2, 3})),
            Physical({1, 2}));
  ASSERT_TRUE(Physical({0}).Intersection(Physical({1})).IsZero());
}

TEST(RESOURCE_SUM, fold_from_empty) {
  std::vector<Logical> logicals{Logical(1), Logical(2), Logical(4)};
  auto total = Sum(logicals);
  ASSERT_TRUE(total.has_value());
  ASSERT_EQ(total.value(), Logical(7));

  std::vector<Physical> empty;
  auto nothing = Sum(empty);
  ASSERT_TRUE(nothing.has_value());
  ASSERT_TRUE(nothing->IsZero());

  std::vector<Physical> overlapping{Physical({0}), Physical({1}),
                                    Physical({0})};
  auto conflict = Sum(overlapping);
  ASSERT_FALSE(conflict.has_value());
  ASSERT_EQ(conflict.error().code(), GschedErrCode::ERR_RESOURCE_CONFLICT);
}

TEST(RESOURCE_UNIT, concepts) {
  static_assert(ResourceUnit<Logical>);
  static_assert(ResourceUnit<Physical>);
  static_assert(PhysicalResourceUnit<Physical>);
  static_assert(!PhysicalResourceUnit<Logical>);
}
