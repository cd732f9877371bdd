#include "proposal_service.hpp"

#include "internal/ingest/payload_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/immutable_store.hpp"

namespace sportsledger::service {

using observability::IntField;
using observability::StringField;

ProposalService::ProposalService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

model::ImprovementProposal ProposalService::Propose(const std::string& payload_json) {
  return Record(ingest::ParseProposalPayload(payload_json));
}

model::ImprovementProposal ProposalService::Record(model::ImprovementProposal proposal) {
  auto stored = ctx_.store->Insert(std::move(proposal));
  SPORTSLEDGER_LOG_INFO("Proposal recorded", {StringField("proposal_id", stored.proposal_id),
                                              IntField("evidence", static_cast<int64_t>(stored.based_on_evaluation_ids.size()))});
  return stored;
}

model::ImprovementProposal ProposalService::Transition(const std::string& proposal_id, model::ProposalStatus status) {
  return ctx_.store->UpdateProposalStatus(proposal_id, status);
}

std::vector<model::ImprovementProposal> ProposalService::List() {
  return ctx_.store->ListProposals();
}

} // namespace sportsledger::service
