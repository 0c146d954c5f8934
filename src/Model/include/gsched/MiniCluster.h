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

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gsched/ResourceModel.h"
#include "gsched/State.h"

namespace gsched {

enum class MiniClusterState : uint32_t {
  QUEUED = 1U << 0,
  RUNNING = 1U << 1,
  PAUSED = 1U << 2,
  ERROR = 1U << 3,
  INVALID = 1U << 4,
  DONE = 1U << 5,

  TERMINATED = INVALID | DONE | ERROR,
};

template <>
inline constexpr bool kEnableFlagOperators<MiniClusterState> = true;

template <>
struct StateTraits<MiniClusterState> {
  static constexpr MiniClusterState kInitState = MiniClusterState::QUEUED;

  static constexpr std::array<std::pair<MiniClusterState, std::string_view>,
                              6>
      kStates{{
          {MiniClusterState::QUEUED, "QUEUED"},
          {MiniClusterState::RUNNING, "RUNNING"},
          {MiniClusterState::PAUSED, "PAUSED"},
          {MiniClusterState::ERROR, "ERROR"},
          {MiniClusterState::INVALID, "INVALID"},
          {MiniClusterState::DONE, "DONE"},
      }};

  static constexpr std::array<std::pair<MiniClusterState, MiniClusterState>,
                              3>
      kTransitions{{
          {MiniClusterState::QUEUED,
           MiniClusterState::RUNNING | MiniClusterState::ERROR},
          {MiniClusterState::RUNNING, MiniClusterState::QUEUED |
                                          MiniClusterState::PAUSED |
                                          MiniClusterState::TERMINATED},
          {MiniClusterState::PAUSED,
           MiniClusterState::RUNNING | MiniClusterState::ERROR},
      }};
};

using MiniClusterStateHistory = StateHistory<MiniClusterState>;

// GPU demand of a mini cluster: what its application master needs, what
// the job needs to start, and how far it may grow.
// am <= min <= max and max is never empty.
class ResourceSpec {
 public:
  // min defaults to am and max defaults to min.
  static GschedExpected<ResourceSpec> Create(
      Logical am_resource, std::optional<Logical> min_resource = std::nullopt,
      std::optional<Logical> max_resource = std::nullopt);

  // Grpc conversion
  static GschedExpected<ResourceSpec> FromGrpc(const grpc::ResourceSpec& rhs);
  explicit operator grpc::ResourceSpec() const;

  const Logical& AmResource() const { return am_resource_; }
  const Logical& MinResource() const { return min_resource_; }
  const Logical& MaxResource() const { return max_resource_; }

  friend bool operator==(const ResourceSpec& lhs,
                         const ResourceSpec& rhs) = default;

 private:
  ResourceSpec(Logical am_resource, Logical min_resource,
               Logical max_resource)
      : am_resource_(am_resource),
        min_resource_(min_resource),
        max_resource_(max_resource) {}

  Logical am_resource_;
  Logical min_resource_;
  Logical max_resource_;
};

class MiniCluster {
 public:
  MiniCluster(std::string cluster_id, std::string name, ResourceSpec spec);
  MiniCluster(std::string cluster_id, std::string name, ResourceSpec spec,
              PhysicalCluster acquired, MiniClusterStateHistory history);

  const std::string& ClusterId() const { return cluster_id_; }
  const std::string& Name() const { return name_; }
  const ResourceSpec& Spec() const { return spec_; }
  const PhysicalCluster& AcquiredResource() const { return acquired_; }

  MiniClusterState State() const { return history_.Curr(); }
  const MiniClusterStateHistory& History() const { return history_; }

  // The held history is kept on failure.
  GschedExpected<void> TransitionTo(MiniClusterState next);
  void ResetState();

  // Adds GPUs to the ones held by this cluster. Rejects GPUs it already
  // holds and growth beyond the maximum of its spec.
  GschedExpected<void> Claim(const PhysicalCluster& resource);

  // Gives back part of the held GPUs.
  GschedExpected<void> Return(const PhysicalCluster& resource);

  // Gives back everything and reports what was held.
  PhysicalCluster ReturnAll();

 private:
  std::string cluster_id_;
  std::string name_;
  ResourceSpec spec_;
  PhysicalCluster acquired_;
  MiniClusterStateHistory history_;
};

}  // namespace gsched

namespace fmt {

template <>
struct formatter<gsched::MiniClusterState> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(gsched::MiniClusterState s, FormatContext& ctx) const {
    return formatter<std::string_view>::format(gsched::StateName(s), ctx);
  }
};

}  // namespace fmt
