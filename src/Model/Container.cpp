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

#include "gsched/Container.h"

#include <absl/strings/str_join.h>

namespace gsched {

GschedExpected<ContainerAllocation> ContainerAllocation::FromGrpc(
    const grpc::ContainerAllocation& rhs) {
  if (rhs.node_name().empty())
    return std::unexpected(
        FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                      "Container allocation has no node name"));

  auto spec = Physical::FromGrpc(rhs.resource_spec());
  if (!spec)
    return std::unexpected(WrapRichErr(
        std::move(spec).error(),
        fmt::format("allocation on node '{}'", rhs.node_name())));

  return ContainerAllocation(rhs.node_name(), std::move(spec).value());
}

ContainerAllocation::operator grpc::ContainerAllocation() const {
  grpc::ContainerAllocation val;
  val.set_node_name(node_name);
  *val.mutable_resource_spec() = static_cast<grpc::Physical>(resource_spec);
  return val;
}

std::string ContainerAllocation::BuildGpuString() const {
  return absl::StrJoin(resource_spec.GpuIndices(), ",");
}

PhysicalCluster ContainerAllocation::ToPhysicalCluster() const {
  return PhysicalCluster::FromNode(node_name, resource_spec);
}

bool operator==(const ContainerAllocation& lhs,
                const ContainerAllocation& rhs) {
  return lhs.node_name == rhs.node_name &&
         lhs.resource_spec == rhs.resource_spec;
}

GschedExpected<PhysicalCluster> TotalPhysicalResource(
    const std::vector<ContainerAllocation>& allocations) {
  std::vector<PhysicalCluster> clusters;
  clusters.reserve(allocations.size());
  for (const auto& allocation : allocations)
    clusters.emplace_back(allocation.ToPhysicalCluster());

  return Sum(clusters);
}

Container::Container(std::string container_id, ContainerAllocation allocation)
    : Container(std::move(container_id), std::move(allocation),
                ContainerStateHistory::FromInit()) {}

Container::Container(std::string container_id, ContainerAllocation allocation,
                     ContainerStateHistory history)
    : container_id_(std::move(container_id)),
      allocation_(std::move(allocation)),
      history_(std::move(history)) {}

GschedExpected<void> Container::TransitionTo(ContainerState next) {
  auto history = history_.Transition(next);
  if (!history)
    return std::unexpected(WrapRichErr(
        std::move(history).error(),
        fmt::format("container '{}'", container_id_)));

  history_ = std::move(history).value();
  return {};
}

void Container::ResetState() { history_ = history_.Reset(); }

}  // namespace gsched
