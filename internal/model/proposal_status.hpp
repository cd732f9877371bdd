#pragma once

#include <cstdint>
#include <string_view>

namespace sportsledger::model {

enum class ProposalStatus : std::uint8_t {
  kPending     = 0,
  kAccepted    = 1,
  kRejected    = 2,
  kImplemented = 3,
};

inline constexpr ProposalStatus kProposalStatuses[] = {ProposalStatus::kPending, ProposalStatus::kAccepted,
                                                       ProposalStatus::kRejected, ProposalStatus::kImplemented};

constexpr bool IsTerminal(ProposalStatus status) {
  return status == ProposalStatus::kRejected || status == ProposalStatus::kImplemented;
}

/*
  Forward-only status machine:

    pending  -> accepted | rejected | implemented
    accepted -> implemented

  Staying in place is not a transition.
*/
constexpr bool CanTransition(ProposalStatus from, ProposalStatus to) {
  if (from == to) {
    return false;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (from == ProposalStatus::kPending) {
    return true;
  }
  return to == ProposalStatus::kImplemented;
}

std::string_view ToString(ProposalStatus status);

// Throws std::invalid_argument for unknown names.
ProposalStatus ParseProposalStatus(std::string_view text);

} // namespace sportsledger::model
