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
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gsched/ResourceModel.h"
#include "gsched/State.h"

namespace gsched {

enum class ContainerState : uint32_t {
  DOWN = 1U << 0,
  READY = 1U << 1,
  RUNNING = 1U << 2,
  DONE = 1U << 3,
  ERROR = 1U << 4,
  INVALID = 1U << 5,

  FAILURE = INVALID | ERROR,
  TERMINATED = FAILURE | DONE,
};

template <>
inline constexpr bool kEnableFlagOperators<ContainerState> = true;

template <>
struct StateTraits<ContainerState> {
  static constexpr ContainerState kInitState = ContainerState::DOWN;

  static constexpr std::array<std::pair<ContainerState, std::string_view>, 6>
      kStates{{
          {ContainerState::DOWN, "DOWN"},
          {ContainerState::READY, "READY"},
          {ContainerState::RUNNING, "RUNNING"},
          {ContainerState::DONE, "DONE"},
          {ContainerState::ERROR, "ERROR"},
          {ContainerState::INVALID, "INVALID"},
      }};

  static constexpr std::array<std::pair<ContainerState, ContainerState>, 3>
      kTransitions{{
          {ContainerState::DOWN, ContainerState::READY | ContainerState::ERROR},
          {ContainerState::READY,
           ContainerState::RUNNING | ContainerState::FAILURE},
          {ContainerState::RUNNING,
           ContainerState::DONE | ContainerState::ERROR},
      }};
};

using ContainerStateHistory = StateHistory<ContainerState>;

// GPUs of one node handed to a container.
struct ContainerAllocation {
  std::string node_name;
  Physical resource_spec;

  ContainerAllocation() = default;
  ContainerAllocation(std::string node_name, Physical resource_spec)
      : node_name(std::move(node_name)),
        resource_spec(std::move(resource_spec)) {}

  // Grpc conversion
  static GschedExpected<ContainerAllocation> FromGrpc(
      const grpc::ContainerAllocation& rhs);
  explicit operator grpc::ContainerAllocation() const;

  // Value of CUDA_VISIBLE_DEVICES, e.g. "0,1,3". Empty without GPUs.
  std::string BuildGpuString() const;

  PhysicalCluster ToPhysicalCluster() const;
};

bool operator==(const ContainerAllocation& lhs,
                const ContainerAllocation& rhs);

// Fails if two allocations hand out the same GPU of a node.
GschedExpected<PhysicalCluster> TotalPhysicalResource(
    const std::vector<ContainerAllocation>& allocations);

class Container {
 public:
  Container(std::string container_id, ContainerAllocation allocation);
  Container(std::string container_id, ContainerAllocation allocation,
            ContainerStateHistory history);

  const std::string& ContainerId() const { return container_id_; }
  const ContainerAllocation& GetAllocation() const { return allocation_; }

  ContainerState State() const { return history_.Curr(); }
  const ContainerStateHistory& History() const { return history_; }

  // The held history is kept on failure.
  GschedExpected<void> TransitionTo(ContainerState next);
  void ResetState();

 private:
  std::string container_id_;
  ContainerAllocation allocation_;
  ContainerStateHistory history_;
};

}  // namespace gsched

namespace fmt {

template <>
struct formatter<gsched::ContainerState> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(gsched::ContainerState s, FormatContext& ctx) const {
    return formatter<std::string_view>::format(gsched::StateName(s), ctx);
  }
};

}  // namespace fmt
