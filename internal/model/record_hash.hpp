#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "internal/model/records.hpp"

namespace sportsledger::model {

/*
  Hash field sets.

  Each record is hashed over its content fields. Excluded: the record's own
  id, its hash, and stamps the store assigns at creation
  (Analysis::created_at, Evaluation::scored_at,
  ImprovementProposal::created_at), so re-running the same derivation is
  recognised as the same fact. Snapshot::collected_at and
  Outcome::occurred_at are content. ImprovementProposal::status is hashed.
*/

google::protobuf::Struct HashFields(const Snapshot& snapshot);
google::protobuf::Struct HashFields(const Analysis& analysis);
google::protobuf::Struct HashFields(const Outcome& outcome);
google::protobuf::Struct HashFields(const Evaluation& evaluation);
google::protobuf::Struct HashFields(const ImprovementProposal& proposal);

template <typename Record>
std::string ComputeHash(const Record& record);

} // namespace sportsledger::model
