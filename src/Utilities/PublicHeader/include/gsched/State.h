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

#include <absl/container/flat_hash_map.h>
#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <concepts>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "PublicHeader.h"
#include "String.h"
#include "protos/ResourceModel.pb.h"

namespace gsched {

/* ----------- Flag enums */

// Opt-in switch for bitwise operators on a scoped enum.
template <typename S>
inline constexpr bool kEnableFlagOperators = false;

template <typename S>
concept FlagEnum = std::is_enum_v<S> &&
                   std::is_unsigned_v<std::underlying_type_t<S>> &&
                   kEnableFlagOperators<S>;

template <FlagEnum S>
constexpr std::underlying_type_t<S> ToUnderlying(S s) {
  return static_cast<std::underlying_type_t<S>>(s);
}

template <FlagEnum S>
constexpr S operator|(S lhs, S rhs) {
  return static_cast<S>(ToUnderlying(lhs) | ToUnderlying(rhs));
}

template <FlagEnum S>
constexpr S operator&(S lhs, S rhs) {
  return static_cast<S>(ToUnderlying(lhs) & ToUnderlying(rhs));
}

template <FlagEnum S>
constexpr bool HasAnyFlag(S value, S mask) {
  return (ToUnderlying(value) & ToUnderlying(mask)) != 0;
}

/* ----------- State machine description */

// Specialized by every state enum. Must provide
//   kInitState:   the state a fresh history starts in,
//   kStates:      array of {single flag, display name},
//   kTransitions: array of {state, mask of allowed next states}.
// A state without a row in kTransitions is terminal.
template <typename S>
struct StateTraits;

template <typename S>
concept StateMachineEnum = FlagEnum<S> && requires {
  { StateTraits<S>::kInitState } -> std::convertible_to<S>;
  StateTraits<S>::kStates;
  StateTraits<S>::kTransitions;
};

template <StateMachineEnum S>
class TransitionTable {
 public:
  using underlying_t = std::underlying_type_t<S>;

  static const TransitionTable& Instance() {
    static const TransitionTable kTable;
    return kTable;
  }

  std::optional<S> AllowedNext(S from) const {
    auto it = matrix_.find(ToUnderlying(from));
    if (it == matrix_.end()) return std::nullopt;
    return static_cast<S>(it->second);
  }

  bool IsTerminal(S s) const { return !matrix_.contains(ToUnderlying(s)); }

 private:
  TransitionTable() {
    for (const auto& [from, allowed] : StateTraits<S>::kTransitions)
      matrix_.emplace(ToUnderlying(from), ToUnderlying(allowed));
  }

  absl::flat_hash_map<underlying_t, underlying_t> matrix_;
};

// "RUNNING", or "READY|ERROR" for a combined mask.
template <StateMachineEnum S>
std::string StateName(S s) {
  std::vector<std::string_view> names;
  for (const auto& [flag, name] : StateTraits<S>::kStates) {
    if (flag == s) return std::string(name);
    if (HasAnyFlag(s, flag)) names.emplace_back(name);
  }
  if (names.empty()) return fmt::format("UNKNOWN({})", ToUnderlying(s));
  return fmt::format("{}", fmt::join(names, "|"));
}

// Accepts any non-zero combination of declared flags.
template <StateMachineEnum S>
GschedExpected<S> StateFromUnderlying(uint64_t raw) {
  uint64_t known = 0;
  for (const auto& [flag, _] : StateTraits<S>::kStates)
    known |= ToUnderlying(flag);

  if (raw == 0 || (raw & ~known) != 0)
    return std::unexpected(FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                                         "Unknown state value {}", raw));
  return static_cast<S>(raw);
}

template <StateMachineEnum S>
GschedExpected<void> ValidateTransition(S curr, S next) {
  auto allowed = TransitionTable<S>::Instance().AllowedNext(curr);
  if (!allowed.has_value() || !HasAnyFlag(allowed.value(), next)) {
    GschedRichError err = FormatRichErr(
        GschedErrCode::ERR_INVALID_STATE_TRANSITION,
        "Invalid state transition from {} to {}", StateName(curr),
        StateName(next));
    err.set_from_state(ToUnderlying(curr));
    err.set_to_state(ToUnderlying(next));
    return std::unexpected(std::move(err));
  }
  return {};
}

template <StateMachineEnum S>
bool IsTerminal(S s) {
  return TransitionTable<S>::Instance().IsTerminal(s);
}

inline double CurrentUnixTime() {
  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/* ----------- State history */

// Append-only record of the states an entity went through. Transition
// returns a new history; the receiver is never modified.
template <StateMachineEnum S>
class StateHistory {
 public:
  using Entry = std::pair<S, double>;

  static StateHistory FromInit() { return FromInit(CurrentUnixTime()); }

  static StateHistory FromInit(double timestamp) {
    return StateHistory({timestamp}, {StateTraits<S>::kInitState});
  }

  // Rebuilds a history from stored columns. It must start in the initial
  // state, every step must be an allowed transition and time must not run
  // backwards.
  static GschedExpected<StateHistory> FromRaw(std::vector<double> timestamps,
                                              std::vector<S> states) {
    if (timestamps.size() != states.size())
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INVALID_PARAM,
          "State history has {} timestamps but {} states", timestamps.size(),
          states.size()));
    if (states.empty())
      return std::unexpected(FormatRichErr(GschedErrCode::ERR_INVALID_PARAM,
                                           "State history is empty"));
    if (states.front() != StateTraits<S>::kInitState)
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INVALID_PARAM,
          "State history starts in {} instead of {}",
          StateName(states.front()), StateName(StateTraits<S>::kInitState)));

    for (size_t i = 1; i < states.size(); i++) {
      auto valid = ValidateTransition(states[i - 1], states[i]);
      if (!valid) return std::unexpected(std::move(valid).error());

      if (timestamps[i] < timestamps[i - 1])
        return std::unexpected(FormatRichErr(
            GschedErrCode::ERR_INVALID_PARAM,
            "State history timestamp {} goes backwards at position {}",
            timestamps[i], i));
    }

    return StateHistory(std::move(timestamps), std::move(states));
  }

  // Grpc conversion
  static GschedExpected<StateHistory> FromGrpc(const grpc::StateHistory& rhs) {
    std::vector<double> timestamps(rhs.timestamps().begin(),
                                   rhs.timestamps().end());
    std::vector<S> states;
    states.reserve(rhs.states_size());
    for (const auto& raw : rhs.states()) {
      auto state = StateFromUnderlying<S>(raw);
      if (!state) return std::unexpected(std::move(state).error());
      states.emplace_back(state.value());
    }
    return FromRaw(std::move(timestamps), std::move(states));
  }

  explicit operator grpc::StateHistory() const {
    grpc::StateHistory val;
    for (const auto& ts : timestamps_) val.add_timestamps(ts);
    for (const auto& s : states_) val.add_states(ToUnderlying(s));
    return val;
  }

  // Stamped with the current time. A clock that went backwards is clamped
  // to the last stamp.
  GschedExpected<StateHistory> Transition(S next) const {
    return Transition(next, std::max(CurrentUnixTime(), timestamps_.back()));
  }

  GschedExpected<StateHistory> Transition(S next, double timestamp) const {
    auto valid = ValidateTransition(Curr(), next);
    if (!valid) return std::unexpected(std::move(valid).error());

    if (timestamp < timestamps_.back())
      return std::unexpected(FormatRichErr(
          GschedErrCode::ERR_INVALID_PARAM,
          "Transition timestamp {} is earlier than the last one {}", timestamp,
          timestamps_.back()));

    StateHistory next_history = *this;
    next_history.timestamps_.emplace_back(timestamp);
    next_history.states_.emplace_back(next);
    return next_history;
  }

  // Back to a single initial entry stamped now.
  StateHistory Reset() const { return FromInit(); }

  S Curr() const { return states_.back(); }
  double Timestamp() const { return timestamps_.back(); }
  double Created() const { return timestamps_.front(); }
  double Elapsed(double now) const { return now - Created(); }
  bool IsTerminated() const { return IsTerminal(Curr()); }

  size_t size() const { return states_.size(); }

  Entry operator[](size_t pos) const {
    return {states_[pos], timestamps_[pos]};
  }

  Entry at(size_t pos) const {
    return {states_.at(pos), timestamps_.at(pos)};
  }

  // Entries in [first, last). Out-of-range bounds are clamped.
  std::vector<Entry> Slice(size_t first, size_t last) const {
    std::vector<Entry> entries;
    last = std::min(last, states_.size());
    for (size_t i = first; i < last; i++)
      entries.emplace_back(states_[i], timestamps_[i]);
    return entries;
  }

  std::vector<Entry> Entries() const { return Slice(0, size()); }

  const std::vector<double>& Timestamps() const { return timestamps_; }
  const std::vector<S>& States() const { return states_; }

  friend bool operator==(const StateHistory& lhs, const StateHistory& rhs) {
    return lhs.timestamps_ == rhs.timestamps_ && lhs.states_ == rhs.states_;
  }

 private:
  StateHistory(std::vector<double> timestamps, std::vector<S> states)
      : timestamps_(std::move(timestamps)), states_(std::move(states)) {}

  std::vector<double> timestamps_;
  std::vector<S> states_;
};

// [(state name, RFC3339 time), ...] for display.
template <StateMachineEnum S>
std::vector<std::pair<std::string, std::string>> ReadableStateHistory(
    const StateHistory<S>& history) {
  std::vector<std::pair<std::string, std::string>> readable;
  readable.reserve(history.size());
  for (const auto& [state, ts] : history.Entries())
    readable.emplace_back(StateName(state), util::ReadableUnixTime(ts));
  return readable;
}

}  // namespace gsched
