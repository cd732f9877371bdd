#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/records.hpp"

namespace sportsledger::delta {

enum class ChangeKind { kUnchanged, kAdded, kRemoved, kChanged };

std::string_view ToString(ChangeKind kind);

struct FieldDiff {
  std::string                            path;
  ChangeKind                             kind = ChangeKind::kUnchanged;
  std::optional<google::protobuf::Value> old_value;
  std::optional<google::protobuf::Value> new_value;
};

// Orders flattened paths byte-wise, except that list indices compare as
// numbers ("books[2]" before "books[10]").
struct PathLess {
  bool operator()(const std::string& a, const std::string& b) const;
};

using PathMap = std::map<std::string, const google::protobuf::Value*, PathLess>;

/*
  Field-level diff of two snapshots of one game.

  Only normalized_fields are compared; provider payloads are not stable
  enough to diff. Nested objects and lists are flattened to leaf paths
  ("sportsbook.best_home_odds", "books[2].price"); an empty object or list
  is a leaf of its own. Separator characters and backslashes inside an
  object key get a leading backslash, so {"a.b": 1} flattens to "a\.b" and
  never meets {"a": {"b": 1}}.

  The diff is a view: iteration computes one FieldDiff per step in PathLess
  order over the union of both snapshots' paths, and may be repeated any
  number of times. The snapshots must outlive the view.
*/
class SnapshotDelta {
 public:
  // Throws std::invalid_argument when the snapshots are for different games.
  SnapshotDelta(const model::Snapshot& older, const model::Snapshot& newer);

  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = FieldDiff;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const FieldDiff*;
    using reference         = const FieldDiff&;

    iterator() = default;

    reference operator*() const {
      return current_;
    }
    pointer operator->() const {
      return &current_;
    }

    iterator& operator++();
    iterator  operator++(int) {
      auto copy = *this;
      ++*this;
      return copy;
    }

    bool operator==(const iterator& other) const {
      return owner_ == other.owner_ && older_ == other.older_ && newer_ == other.newer_;
    }
    bool operator!=(const iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class SnapshotDelta;
    using Cursor = PathMap::const_iterator;

    iterator(const SnapshotDelta* owner, Cursor older, Cursor newer);
    void Load();

    const SnapshotDelta* owner_ = nullptr;
    Cursor               older_;
    Cursor               newer_;
    FieldDiff            current_;
  };

  iterator begin() const;
  iterator end() const;

  // Materializes the entries whose kind is not kUnchanged.
  std::vector<FieldDiff> ChangedOnly() const;

  // newer.collected_at - older.collected_at.
  double time_delta_seconds() const {
    return time_delta_seconds_;
  }

  const std::string& game_id() const {
    return game_id_;
  }

 private:
  std::string game_id_;
  double      time_delta_seconds_ = 0.0;

  // leaf path -> value inside the snapshot's normalized_fields
  PathMap older_;
  PathMap newer_;
};

} // namespace sportsledger::delta
