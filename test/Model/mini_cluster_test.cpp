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

#include "gsched/MiniCluster.h"

#include <gtest/gtest.h>

using namespace gsched;

TEST(RESOURCE_SPEC, defaults) {
  auto spec = ResourceSpec::Create(Logical(1));
  ASSERT_TRUE(spec.has_value());
  EXPECT_EQ(spec->AmResource(), Logical(1));
  EXPECT_EQ(spec->MinResource(), Logical(1));
  EXPECT_EQ(spec->MaxResource(), Logical(1));

  auto grown = ResourceSpec::Create(Logical(1), Logical(2));
  ASSERT_TRUE(grown.has_value());
  EXPECT_EQ(grown->MaxResource(), Logical(2));

  auto explicit_spec = ResourceSpec::Create(Logical(0), Logical(2), Logical(8));
  ASSERT_TRUE(explicit_spec.has_value());
  EXPECT_EQ(explicit_spec->MinResource(), Logical(2));
  EXPECT_EQ(explicit_spec->MaxResource(), Logical(8));
}

TEST(RESOURCE_SPEC, validation) {
  auto max_below_min = ResourceSpec::Create(Logical(1), Logical(4), Logical(2));
  ASSERT_FALSE(max_below_min.has_value());
  EXPECT_EQ(max_below_min.error().code(), GschedErrCode::ERR_INVALID_PARAM);

  auto am_above_min = ResourceSpec::Create(Logical(3), Logical(2), Logical(4));
  ASSERT_FALSE(am_above_min.has_value());
  EXPECT_EQ(am_above_min.error().code(), GschedErrCode::ERR_INVALID_PARAM);

  auto empty = ResourceSpec::Create(Logical(0));
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code(), GschedErrCode::ERR_INVALID_PARAM);
}

class MiniClusterTest : public ::testing::Test {
 protected:
  MiniClusterTest()
      : job_("mc-1", "llama-finetune",
             ResourceSpec::Create(Logical(1), Logical(2), Logical(4))
                 .value()) {}

  static PhysicalCluster MakeCluster(
      std::initializer_list<std::pair<const NodeId, Physical>> entries) {
    return PhysicalCluster::Create(PhysicalCluster::MapType(entries.begin(), entries.end())).value();
  }

  MiniCluster job_;
};

TEST_F(MiniClusterTest, starts_queued) {
  EXPECT_EQ(job_.ClusterId(), "mc-1");
  EXPECT_EQ(job_.Name(), "llama-finetune");
  EXPECT_EQ(job_.State(), MiniClusterState::QUEUED);
  EXPECT_TRUE(job_.AcquiredResource().IsZero());
}

TEST_F(MiniClusterTest, transitions) {
  EXPECT_FALSE(job_.TransitionTo(MiniClusterState::PAUSED).has_value());
  EXPECT_EQ(job_.State(), MiniClusterState::QUEUED);

  ASSERT_TRUE(job_.TransitionTo(MiniClusterState::RUNNING).has_value());
  ASSERT_TRUE(job_.TransitionTo(MiniClusterState::PAUSED).has_value());
  ASSERT_TRUE(job_.TransitionTo(MiniClusterState::RUNNING).has_value());
  ASSERT_TRUE(job_.TransitionTo(MiniClusterState::INVALID).has_value());

  EXPECT_TRUE(job_.History().IsTerminated());
  EXPECT_EQ(job_.History().size(), 5);

  auto again = job_.TransitionTo(MiniClusterState::RUNNING);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code(), GschedErrCode::ERR_INVALID_STATE_TRANSITION);

  job_.ResetState();
  EXPECT_EQ(job_.State(), MiniClusterState::QUEUED);
  EXPECT_EQ(job_.History().size(), 1);
}

TEST_F(MiniClusterTest, requeue_from_running) {
  ASSERT_TRUE(job_.TransitionTo(MiniClusterState::RUNNING).has_value());
  ASSERT_TRUE(job_.TransitionTo(MiniClusterState::QUEUED).has_value());
  EXPECT_FALSE(job_.History().IsTerminated());
}

TEST_F(MiniClusterTest, claim_and_return) {
  ASSERT_TRUE(job_.Claim(MakeCluster({{"cn01", Physical({0, 1})}})));
  ASSERT_TRUE(job_.Claim(MakeCluster({{"cn02", Physical({3})}})));
  EXPECT_EQ(job_.AcquiredResource(),
            MakeCluster({{"cn01", Physical({0, 1})}, {"cn02", Physical({3})}}));

  auto twice = job_.Claim(MakeCluster({{"cn01", Physical({1})}}));
  ASSERT_FALSE(twice.has_value());
  EXPECT_EQ(twice.error().code(), GschedErrCode::ERR_RESOURCE_CONFLICT);

  ASSERT_TRUE(job_.Return(MakeCluster({{"cn01", Physical({0})}})));
  EXPECT_EQ(job_.AcquiredResource(),
            MakeCluster({{"cn01", Physical({1})}, {"cn02", Physical({3})}}));

  auto not_held = job_.Return(MakeCluster({{"cn03", Physical({0})}}));
  ASSERT_FALSE(not_held.has_value());
  EXPECT_EQ(not_held.error().code(), GschedErrCode::ERR_INVALID_KEY_SET);

  PhysicalCluster returned = job_.ReturnAll();
  EXPECT_EQ(returned,
            MakeCluster({{"cn01", Physical({1})}, {"cn02", Physical({3})}}));
  EXPECT_TRUE(job_.AcquiredResource().IsZero());
}

TEST_F(MiniClusterTest, claim_beyond_maximum) {
  ASSERT_TRUE(job_.Claim(MakeCluster({{"cn01", Physical({0, 1, 2})}})));

  auto over = job_.Claim(MakeCluster({{"cn02", Physical({0, 1})}}));
  ASSERT_FALSE(over.has_value());
  EXPECT_EQ(over.error().code(), GschedErrCode::ERR_INVALID_PARAM);
  EXPECT_EQ(job_.AcquiredResource(),
            MakeCluster({{"cn01", Physical({0, 1, 2})}}));

  ASSERT_TRUE(job_.Claim(MakeCluster({{"cn02", Physical({0})}})));
}
