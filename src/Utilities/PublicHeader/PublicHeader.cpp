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

#include "gsched/PublicHeader.h"

#include <algorithm>
#include <iterator>

#include "gsched/Resource.h"

namespace gsched {

GschedRichError WrapRichErr(GschedRichError err, std::string_view context) {
  err.set_description(fmt::format("{}: {}", context, err.description()));
  return err;
}

/* ----------- Logical */

GschedExpected<Logical> Logical::FromCount(int64_t num_gpu) {
  if (num_gpu < 0)
    return std::unexpected(
        FormatRichErr(GschedErrCode::ERR_INVALID_CONSTRUCTION,
                      "GPU count must be non-negative, got {}", num_gpu));
  if (num_gpu > std::numeric_limits<uint32_t>::max())
    return std::unexpected(FormatRichErr(
        GschedErrCode::ERR_INVALID_CONSTRUCTION, "GPU count {} is too large",
        num_gpu));

  return Logical(static_cast<uint32_t>(num_gpu));
}

GschedExpected<Logical> Logical::FromGrpc(const grpc::Logical& rhs) {
  return FromCount(rhs.num_gpu());
}

Logical::operator grpc::Logical() const {
  grpc::Logical val;
  val.set_num_gpu(num_gpu_);
  return val;
}

GschedExpected<Logical> Logical::Add(const Logical& rhs) const {
  return FromCount(static_cast<int64_t>(num_gpu_) + rhs.num_gpu_);
}

GschedExpected<Logical> Logical::Subtract(const Logical& rhs) const {
  if (rhs.num_gpu_ > num_gpu_)
    return std::unexpected(
        FormatRichErr(GschedErrCode::ERR_INSUFFICIENT_RESOURCE,
                      "Cannot subtract {} GPU(s) from {} GPU(s)",
                      rhs.num_gpu_, num_gpu_));

  return Logical(num_gpu_ - rhs.num_gpu_);
}

bool operator==(const Logical& lhs, const Logical& rhs) {
  return lhs.NumGpu() == rhs.NumGpu();
}

bool operator<(const Logical& lhs, const Logical& rhs) {
  return lhs.NumGpu() < rhs.NumGpu();
}

bool operator>(const Logical& lhs, const Logical& rhs) { return rhs < lhs; }

bool operator<=(const Logical& lhs, const Logical& rhs) {
  return lhs < rhs || lhs == rhs;
}

bool operator>=(const Logical& lhs, const Logical& rhs) {
  return lhs > rhs || lhs == rhs;
}

/* ----------- Physical */

GschedExpected<Physical> Physical::FromGrpc(const grpc::Physical& rhs) {
  return FromIndices(rhs.gpu_indices());
}

Physical::operator grpc::Physical() const {
  grpc::Physical val;
  for (const auto& index : gpu_indices_) val.add_gpu_indices(index);
  return val;
}

GschedExpected<Physical> Physical::Add(const Physical& rhs) const {
  Physical common = Intersection(rhs);
  if (!common.IsZero())
    return std::unexpected(
        FormatRichErr(GschedErrCode::ERR_RESOURCE_CONFLICT,
                      "GPU(s) {} are already present in {}", common, *this));

  IndexSet result = gpu_indices_;
  result.insert(rhs.gpu_indices_.begin(), rhs.gpu_indices_.end());
  return Physical(std::move(result));
}

GschedExpected<Physical> Physical::Subtract(const Physical& rhs) const {
  if (!rhs.IsSubset(*this))
    return std::unexpected(
        FormatRichErr(GschedErrCode::ERR_INSUFFICIENT_RESOURCE,
                      "{} is not contained in {}", rhs, *this));

  IndexSet result;
  std::ranges::set_difference(gpu_indices_, rhs.gpu_indices_,
                              std::inserter(result, result.end()));
  return Physical(std::move(result));
}

Logical Physical::AsLogical() const {
  return Logical(static_cast<uint32_t>(gpu_indices_.size()));
}

Physical Physical::Intersection(const Physical& rhs) const {
  IndexSet result;
  std::ranges::set_intersection(gpu_indices_, rhs.gpu_indices_,
                                std::inserter(result, result.end()));
  return Physical(std::move(result));
}

bool Physical::IsSubset(const Physical& rhs) const {
  return std::ranges::includes(rhs.gpu_indices_, gpu_indices_);
}

bool operator==(const Physical& lhs, const Physical& rhs) {
  return lhs.GpuIndices() == rhs.GpuIndices();
}

bool operator<(const Physical& lhs, const Physical& rhs) {
  return lhs.size() < rhs.size() && lhs.IsSubset(rhs);
}

bool operator>(const Physical& lhs, const Physical& rhs) { return rhs < lhs; }

bool operator<=(const Physical& lhs, const Physical& rhs) {
  return lhs.IsSubset(rhs);
}

bool operator>=(const Physical& lhs, const Physical& rhs) {
  return rhs.IsSubset(lhs);
}

}  // namespace gsched
