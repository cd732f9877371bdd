#include "internal/model/record_hash.hpp"

#include "internal/hashing/canonical_json.hpp"
#include "internal/util/json.hpp"

namespace sportsledger::model {
namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

Value& Field(Struct& fields, const char* name) {
  return (*fields.mutable_fields())[name];
}

Value OptionalString(const std::optional<std::string>& value) {
  return value ? util::StringValue(*value) : util::NullValue();
}

Value OptionalNumber(const std::optional<double>& value) {
  return value ? util::NumberValue(*value) : util::NullValue();
}

Value StringList(const std::vector<std::string>& values) {
  Value out;
  auto* list = out.mutable_list_value();
  for (const auto& value : values) {
    *list->add_values() = util::StringValue(value);
  }
  return out;
}

Value StructValue(const Struct& value) {
  Value out;
  *out.mutable_struct_value() = value;
  return out;
}

Value ListOf(const ListValue& value) {
  Value out;
  *out.mutable_list_value() = value;
  return out;
}

} // namespace

Struct HashFields(const Snapshot& snapshot) {
  Struct fields;
  Field(fields, "game_id")           = util::StringValue(snapshot.game_id);
  Field(fields, "collected_at")      = util::StringValue(util::FormatTimestamp(snapshot.collected_at));
  Field(fields, "schema_version")    = util::StringValue(snapshot.schema_version);
  Field(fields, "source_versions")   = StructValue(util::ToStruct(snapshot.source_versions));
  Field(fields, "raw_payloads")      = StructValue(snapshot.raw_payloads);
  Field(fields, "normalized_fields") = StructValue(snapshot.normalized_fields);
  return fields;
}

Struct HashFields(const Analysis& analysis) {
  Struct fields;
  Field(fields, "analysis_version")    = util::StringValue(analysis.analysis_version);
  Field(fields, "code_version")        = util::StringValue(analysis.code_version);
  Field(fields, "model_version")       = OptionalString(analysis.model_version);
  Field(fields, "parent_analysis_id")  = OptionalString(analysis.parent_analysis_id);
  Field(fields, "input_snapshot_ids")  = StringList(analysis.input_snapshot_ids);
  Field(fields, "derived_features")    = StructValue(analysis.derived_features);
  Field(fields, "conclusions")         = StructValue(analysis.conclusions);
  Field(fields, "recommended_actions") = ListOf(analysis.recommended_actions);
  return fields;
}

Struct HashFields(const Outcome& outcome) {
  Struct score;
  Field(score, "home") = util::NumberValue(static_cast<double>(outcome.final_score.home));
  Field(score, "away") = util::NumberValue(static_cast<double>(outcome.final_score.away));

  Struct fields;
  Field(fields, "game_id")               = util::StringValue(outcome.game_id);
  Field(fields, "occurred_at")           = util::StringValue(util::FormatTimestamp(outcome.occurred_at));
  Field(fields, "final_score")           = StructValue(score);
  Field(fields, "winner")                = OptionalString(outcome.winner);
  Field(fields, "stats_summary")         = StructValue(outcome.stats_summary);
  Field(fields, "source")                = util::StringValue(outcome.source);
  Field(fields, "revision")              = util::NumberValue(static_cast<double>(outcome.revision));
  Field(fields, "supersedes_outcome_id") = OptionalString(outcome.supersedes_outcome_id);
  return fields;
}

Struct HashFields(const Evaluation& evaluation) {
  Struct metrics;
  Field(metrics, "brier_score")   = OptionalNumber(evaluation.metrics.brier_score);
  Field(metrics, "log_loss")      = OptionalNumber(evaluation.metrics.log_loss);
  Field(metrics, "roi")           = OptionalNumber(evaluation.metrics.roi);
  Field(metrics, "edge_realized") = util::StringValue(std::string(ToString(evaluation.metrics.edge_realized)));

  Struct fields;
  Field(fields, "analysis_id") = util::StringValue(evaluation.analysis_id);
  Field(fields, "outcome_id")  = util::StringValue(evaluation.outcome_id);
  Field(fields, "game_id")     = util::StringValue(evaluation.game_id);
  Field(fields, "metrics")     = StructValue(metrics);
  Field(fields, "notes")       = StructValue(evaluation.notes);
  return fields;
}

Struct HashFields(const ImprovementProposal& proposal) {
  Struct fields;
  Field(fields, "based_on_evaluation_ids")    = StringList(proposal.based_on_evaluation_ids);
  Field(fields, "proposal_text")              = util::StringValue(proposal.proposal_text);
  Field(fields, "suggested_schema_additions") = ListOf(proposal.suggested_schema_additions);
  Field(fields, "suggested_modules")          = ListOf(proposal.suggested_modules);
  Field(fields, "expected_impact")            = util::StringValue(proposal.expected_impact);
  Field(fields, "status")                     = util::StringValue(std::string(ToString(proposal.status)));
  return fields;
}

template <typename Record>
std::string ComputeHash(const Record& record) {
  return hashing::ContentHash(HashFields(record));
}

template std::string ComputeHash<Snapshot>(const Snapshot&);
template std::string ComputeHash<Analysis>(const Analysis&);
template std::string ComputeHash<Outcome>(const Outcome&);
template std::string ComputeHash<Evaluation>(const Evaluation&);
template std::string ComputeHash<ImprovementProposal>(const ImprovementProposal&);

} // namespace sportsledger::model
