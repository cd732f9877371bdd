#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/records.hpp"

namespace sportsledger::integrity {

struct Mismatch {
  model::EntityType entity_type;
  std::string       id;
  std::string       expected; // stored hash
  std::string       actual;   // recomputed from stored content, or "<undecodable: ...>"
};

struct VerificationReport {
  std::map<model::EntityType, std::size_t> checked;
  std::vector<Mismatch>                    mismatches;

  bool clean() const {
    return mismatches.empty();
  }

  std::size_t total_checked() const;
};

/*
  Read-only walk over every stored record.

  Row keys are listed first and each row is then decoded on its own, so a
  row whose stored content no longer parses is reported as a mismatch and
  the walk goes on. Records are read straight from the repository (the
  store's verifying reads would stop at the first bad row). Nothing is
  ever written or repaired.
*/
class IntegrityVerifier {
 public:
  explicit IntegrityVerifier(std::shared_ptr<db::Repository> repository);

  VerificationReport Run() const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace sportsledger::integrity
