#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace sportsledger::service {

struct UnitFailure {
  std::string unit;
  std::string error;
};

struct BatchReport {
  std::vector<std::string> succeeded;
  std::vector<std::string> skipped;
  std::vector<UnitFailure> failed;

  bool ok() const {
    return failed.empty();
  }

  google::protobuf::Struct ToStruct() const;
};

enum class UnitStatus { kDone, kSkipped };

using UnitTask = std::function<UnitStatus(const std::string& unit)>;

/*
  Runs independent units (one game, one analysis) on a pool of workers.

  A unit that throws is recorded in the report with its error and the
  batch carries on; nothing a failed unit did is rolled back elsewhere.
  Report lists keep the order of the input units.
*/
class BatchRunner {
 public:
  explicit BatchRunner(std::size_t workers);

  BatchReport Run(const std::string& batch, const std::vector<std::string>& units, const UnitTask& task) const;

 private:
  std::size_t workers_;
};

} // namespace sportsledger::service
