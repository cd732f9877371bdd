#include "batch_runner.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"
#include "work_queue.hpp"

namespace sportsledger::service {
namespace {

using observability::IntField;
using observability::StringField;

struct UnitOutcome {
  std::optional<UnitStatus>  status;
  std::optional<std::string> error;
};

google::protobuf::Value StringList(const std::vector<std::string>& values) {
  google::protobuf::Value out;
  auto*                   list = out.mutable_list_value();
  for (const auto& value : values) {
    list->add_values()->set_string_value(value);
  }
  return out;
}

} // namespace

google::protobuf::Struct BatchReport::ToStruct() const {
  google::protobuf::Struct out;
  auto&                    f = *out.mutable_fields();
  f["succeeded"]             = StringList(succeeded);
  f["skipped"]               = StringList(skipped);

  google::protobuf::Value failures;
  auto*                   list = failures.mutable_list_value();
  for (const auto& failure : failed) {
    auto& entry      = *list->add_values()->mutable_struct_value()->mutable_fields();
    entry["unit"]    = util::StringValue(failure.unit);
    entry["error"]   = util::StringValue(failure.error);
  }
  f["failed"] = std::move(failures);
  return out;
}

BatchRunner::BatchRunner(std::size_t workers) : workers_(std::max<std::size_t>(workers, 1)) {
}

BatchReport BatchRunner::Run(const std::string& batch, const std::vector<std::string>& units, const UnitTask& task) const {
  if (!task) {
    throw std::invalid_argument("batch task must be callable");
  }

  std::vector<UnitOutcome> outcomes(units.size());
  WorkQueue                queue;
  for (std::size_t i = 0; i < units.size(); ++i) {
    queue.Enqueue(i);
  }
  queue.Close();

  // each slot is written by exactly one worker
  auto work = [&] {
    while (auto index = queue.Dequeue()) {
      auto& slot = outcomes[*index];
      try {
        slot.status = task(units[*index]);
      } catch (const std::exception& e) {
        SPORTSLEDGER_LOG_ERROR("Batch unit failed",
                               {StringField("batch", batch), StringField("unit", units[*index]), StringField("error", e.what())});
        slot.error = e.what();
      }
    }
  };

  const auto               count = std::min(workers_, std::max<std::size_t>(units.size(), 1));
  std::vector<std::thread> threads;
  threads.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    threads.emplace_back(work);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  BatchReport report;
  for (std::size_t i = 0; i < units.size(); ++i) {
    if (outcomes[i].error) {
      report.failed.push_back({units[i], *outcomes[i].error});
    } else if (outcomes[i].status == UnitStatus::kSkipped) {
      report.skipped.push_back(units[i]);
    } else {
      report.succeeded.push_back(units[i]);
    }
  }

  SPORTSLEDGER_LOG_INFO("Batch finished", {StringField("batch", batch), IntField("succeeded", static_cast<int64_t>(report.succeeded.size())),
                                           IntField("skipped", static_cast<int64_t>(report.skipped.size())),
                                           IntField("failed", static_cast<int64_t>(report.failed.size()))});
  return report;
}

} // namespace sportsledger::service
