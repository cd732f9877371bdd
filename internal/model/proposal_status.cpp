#include "internal/model/proposal_status.hpp"

#include <stdexcept>
#include <string>

namespace sportsledger::model {

std::string_view ToString(ProposalStatus status) {
  switch (status) {
    case ProposalStatus::kPending:
      return "pending";
    case ProposalStatus::kAccepted:
      return "accepted";
    case ProposalStatus::kRejected:
      return "rejected";
    case ProposalStatus::kImplemented:
      return "implemented";
  }
  return "unknown";
}

ProposalStatus ParseProposalStatus(std::string_view text) {
  if (text == "pending") return ProposalStatus::kPending;
  if (text == "accepted") return ProposalStatus::kAccepted;
  if (text == "rejected") return ProposalStatus::kRejected;
  if (text == "implemented") return ProposalStatus::kImplemented;
  throw std::invalid_argument("unknown proposal status: " + std::string(text));
}

} // namespace sportsledger::model
