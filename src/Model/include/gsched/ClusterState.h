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

#include "gsched/MiniCluster.h"
#include "gsched/ResourceModel.h"

namespace gsched {

// GPU bookkeeping of the whole cluster: which GPUs exist on which node
// and which of them are handed out to mini clusters.
class ClusterState {
 public:
  ClusterState() = default;
  explicit ClusterState(PhysicalAllocationCluster resource)
      : resource_(std::move(resource)) {}

  const PhysicalAllocationCluster& Resource() const { return resource_; }

  PhysicalCluster Free() const { return resource_.Released(); }
  PhysicalCluster InUse() const { return resource_.Acquired(); }

  // Hands `request` to `job`. Neither the cluster nor the job changes
  // unless both steps succeed.
  GschedExpected<void> Schedule(MiniCluster* job,
                                const PhysicalCluster& request);

  // Takes back everything `job` holds.
  GschedExpected<void> Reclaim(MiniCluster* job);

 private:
  PhysicalAllocationCluster resource_;
};

}  // namespace gsched
