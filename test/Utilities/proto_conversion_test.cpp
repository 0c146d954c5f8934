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

#include "gsched/Container.h"
#include "gsched/MiniCluster.h"
#include "gsched/ResourceModel.h"

using namespace gsched;

TEST(PROTO_CONVERSION, physical_allocation_cluster) {
  auto total = PhysicalCluster::Create({{"node1", Physical({0, 1, 2})},
                                        {"node2", Physical({5})}})
                   .value();
  auto cluster = PhysicalAllocationCluster::FromTotal(total)
                     .Acquire(PhysicalCluster::FromNode("node1", Physical({1})))
                     .value();

  auto msg = static_cast<grpc::PhysicalAllocationCluster>(cluster);
  ASSERT_EQ(msg.resources_size(), 2);
  const auto& node1 = msg.resources().at("node1");
  ASSERT_EQ(node1.total().gpu_indices_size(), 3);
  ASSERT_EQ(node1.released().gpu_indices_size(), 2);

  auto decoded = PhysicalAllocationCluster::FromGrpc(msg);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded.value(), cluster);
}

TEST(PROTO_CONVERSION, negative_values_rejected) {
  grpc::Logical logical;
  logical.set_num_gpu(-3);
  auto res = Logical::FromGrpc(logical);
  ASSERT_FALSE(res.has_value());
  ASSERT_EQ(res.error().code(), GschedErrCode::ERR_INVALID_CONSTRUCTION);

  grpc::PhysicalCluster cluster;
  (*cluster.mutable_resources())["node1"].add_gpu_indices(-1);
  auto decoded = PhysicalCluster::FromGrpc(cluster);
  ASSERT_FALSE(decoded.has_value());
  ASSERT_EQ(decoded.error().code(), GschedErrCode::ERR_INVALID_CONSTRUCTION);
}

TEST(PROTO_CONVERSION, empty_node_rejected) {
  grpc::LogicalCluster cluster;
  (*cluster.mutable_resources())["node1"].set_num_gpu(0);
  auto decoded = LogicalCluster::FromGrpc(cluster);
  ASSERT_FALSE(decoded.has_value());
  ASSERT_EQ(decoded.error().code(), GschedErrCode::ERR_INVALID_CONSTRUCTION);
}

TEST(PROTO_CONVERSION, broken_allocation_rejected) {
  grpc::LogicalAllocation alloc;
  alloc.mutable_total()->set_num_gpu(1);
  alloc.mutable_released()->set_num_gpu(2);
  auto decoded = LogicalAllocation::FromGrpc(alloc);
  ASSERT_FALSE(decoded.has_value());
  ASSERT_EQ(decoded.error().code(), GschedErrCode::ERR_INSUFFICIENT_RESOURCE);
}

TEST(PROTO_CONVERSION, state_history) {
  auto history = ContainerStateHistory::FromInit(10.0)
                     .Transition(ContainerState::READY, 11.0)
                     .value();

  auto msg = static_cast<grpc::StateHistory>(history);
  ASSERT_EQ(msg.states_size(), 2);
  ASSERT_EQ(msg.states(1), 2U);

  auto decoded = ContainerStateHistory::FromGrpc(msg);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded.value(), history);

  // DOWN -> RUNNING is not allowed.
  msg.set_states(1, ToUnderlying(ContainerState::RUNNING));
  auto broken = ContainerStateHistory::FromGrpc(msg);
  ASSERT_FALSE(broken.has_value());
  ASSERT_EQ(broken.error().code(),
            GschedErrCode::ERR_INVALID_STATE_TRANSITION);

  // READY -> RUNNING is allowed but a container starts DOWN.
  msg.set_states(0, ToUnderlying(ContainerState::READY));
  auto late_start = ContainerStateHistory::FromGrpc(msg);
  ASSERT_FALSE(late_start.has_value());
  ASSERT_EQ(late_start.error().code(), GschedErrCode::ERR_INVALID_PARAM);
}

TEST(PROTO_CONVERSION, container_allocation) {
  ContainerAllocation alloc("node1", Physical({0, 3}));
  auto msg = static_cast<grpc::ContainerAllocation>(alloc);
  ASSERT_EQ(msg.node_name(), "node1");

  auto decoded = ContainerAllocation::FromGrpc(msg);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded.value(), alloc);
}

TEST(PROTO_CONVERSION, resource_spec_defaults) {
  grpc::ResourceSpec msg;
  msg.mutable_am_resource()->set_num_gpu(2);

  auto spec = ResourceSpec::FromGrpc(msg);
  ASSERT_TRUE(spec.has_value());
  ASSERT_EQ(spec->MinResource(), Logical(2));
  ASSERT_EQ(spec->MaxResource(), Logical(2));

  auto round_trip =
      ResourceSpec::FromGrpc(static_cast<grpc::ResourceSpec>(spec.value()));
  ASSERT_TRUE(round_trip.has_value());
  ASSERT_EQ(round_trip.value(), spec.value());

  msg.mutable_max_resource()->set_num_gpu(1);
  auto invalid = ResourceSpec::FromGrpc(msg);
  ASSERT_FALSE(invalid.has_value());
  ASSERT_EQ(invalid.error().code(), GschedErrCode::ERR_INVALID_PARAM);
}
