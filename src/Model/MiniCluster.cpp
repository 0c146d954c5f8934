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

namespace gsched {

GschedExpected<ResourceSpec> ResourceSpec::Create(
    Logical am_resource, std::optional<Logical> min_resource,
    std::optional<Logical> max_resource) {
  Logical min_res = min_resource.value_or(am_resource);
  Logical max_res = max_resource.value_or(min_res);

  if (max_res < min_res)
    return std::unexpected(FormatRichErr(
        GschedErrCode::ERR_INVALID_PARAM,
        "Maximum resource {} is smaller than minimum resource {}", max_res,
        min_res));

  if (!(am_resource <= min_res))
    return std::unexpected(FormatRichErr(
        GschedErrCode::ERR_INVALID_PARAM,
        "Application master resource {} exceeds minimum resource {}",
        am_resource, min_res));

  if (max_res.IsZero())
    return std::unexpected(FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                                         "Maximum resource is empty"));

  return ResourceSpec(am_resource, min_res, max_res);
}

GschedExpected<ResourceSpec> ResourceSpec::FromGrpc(
    const grpc::ResourceSpec& rhs) {
  auto am = Logical::FromGrpc(rhs.am_resource());
  if (!am) return std::unexpected(WrapRichErr(am.error(), "am_resource"));

  std::optional<Logical> min_res;
  if (rhs.has_min_resource()) {
    auto res = Logical::FromGrpc(rhs.min_resource());
    if (!res) return std::unexpected(WrapRichErr(res.error(), "min_resource"));
    min_res = res.value();
  }

  std::optional<Logical> max_res;
  if (rhs.has_max_resource()) {
    auto res = Logical::FromGrpc(rhs.max_resource());
    if (!res) return std::unexpected(WrapRichErr(res.error(), "max_resource"));
    max_res = res.value();
  }

  return Create(am.value(), min_res, max_res);
}

ResourceSpec::operator grpc::ResourceSpec() const {
  grpc::ResourceSpec val;
  *val.mutable_am_resource() = static_cast<grpc::Logical>(am_resource_);
  *val.mutable_min_resource() = static_cast<grpc::Logical>(min_resource_);
  *val.mutable_max_resource() = static_cast<grpc::Logical>(max_resource_);
  return val;
}

MiniCluster::MiniCluster(std::string cluster_id, std::string name,
                         ResourceSpec spec)
    : MiniCluster(std::move(cluster_id), std::move(name), std::move(spec),
                  PhysicalCluster::Empty(),
                  MiniClusterStateHistory::FromInit()) {}

MiniCluster::MiniCluster(std::string cluster_id, std::string name,
                         ResourceSpec spec, PhysicalCluster acquired,
                         MiniClusterStateHistory history)
    : cluster_id_(std::move(cluster_id)),
      name_(std::move(name)),
      spec_(std::move(spec)),
      acquired_(std::move(acquired)),
      history_(std::move(history)) {}

GschedExpected<void> MiniCluster::TransitionTo(MiniClusterState next) {
  auto history = history_.Transition(next);
  if (!history)
    return std::unexpected(
        WrapRichErr(std::move(history).error(),
                    fmt::format("mini cluster '{}'", cluster_id_)));

  history_ = std::move(history).value();
  return {};
}

void MiniCluster::ResetState() { history_ = history_.Reset(); }

GschedExpected<void> MiniCluster::Claim(const PhysicalCluster& resource) {
  auto acquired = acquired_.Add(resource);
  if (!acquired)
    return std::unexpected(
        WrapRichErr(std::move(acquired).error(),
                    fmt::format("mini cluster '{}'", cluster_id_)));

  auto num_gpu = acquired.value().AsLogical().Reduce();
  if (!num_gpu) return std::unexpected(std::move(num_gpu).error());
  if (num_gpu.value() > spec_.MaxResource())
    return std::unexpected(FormatRichErr(
        GschedErrCode::ERR_INVALID_PARAM,
        "Mini cluster '{}' would hold {} which exceeds its maximum {}",
        cluster_id_, num_gpu.value(), spec_.MaxResource()));

  acquired_ = std::move(acquired).value();
  return {};
}

GschedExpected<void> MiniCluster::Return(const PhysicalCluster& resource) {
  auto acquired = acquired_.Subtract(resource);
  if (!acquired)
    return std::unexpected(
        WrapRichErr(std::move(acquired).error(),
                    fmt::format("mini cluster '{}'", cluster_id_)));

  acquired_ = std::move(acquired).value();
  return {};
}

PhysicalCluster MiniCluster::ReturnAll() {
  return std::exchange(acquired_, PhysicalCluster::Empty());
}

}  // namespace gsched
