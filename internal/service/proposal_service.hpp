#pragma once

#include <string>
#include <vector>

#include "internal/model/records.hpp"
#include "service_context.hpp"

namespace sportsledger::service {

/*
  Evidence-linked improvement proposals. Proposal text is written
  elsewhere; the ledger only records it against the evaluations it cites
  and tracks its forward-only status.
*/
class ProposalService {
 public:
  explicit ProposalService(ServiceContext ctx);

  model::ImprovementProposal Propose(const std::string& payload_json);

  model::ImprovementProposal Record(model::ImprovementProposal proposal);

  model::ImprovementProposal Transition(const std::string& proposal_id, model::ProposalStatus status);

  std::vector<model::ImprovementProposal> List();

 private:
  ServiceContext ctx_;
};

} // namespace sportsledger::service
