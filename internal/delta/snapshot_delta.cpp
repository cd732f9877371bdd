#include "internal/delta/snapshot_delta.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <tuple>

#include "internal/hashing/canonical_json.hpp"

namespace sportsledger::delta {
namespace {

using google::protobuf::Value;
using Paths = PathMap;

std::string EscapeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (const char c : key) {
    if (c == '.' || c == '[' || c == ']' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

void Flatten(const Value& value, const std::string& path, Paths& out);

void FlattenStruct(const google::protobuf::Struct& object, const std::string& prefix, Paths& out) {
  for (const auto& [key, child] : object.fields()) {
    Flatten(child, prefix.empty() ? EscapeKey(key) : prefix + "." + EscapeKey(key), out);
  }
}

// One unit of a path: a plain byte, an escaped byte or a whole list index.
struct PathToken {
  unsigned char lead  = 0;
  unsigned char ch    = 0;
  std::size_t   index = 0;

  bool operator<(const PathToken& other) const {
    return std::tie(lead, ch, index) < std::tie(other.lead, other.ch, other.index);
  }
};

std::vector<PathToken> Tokenize(const std::string& path) {
  std::vector<PathToken> out;
  out.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    const auto c = static_cast<unsigned char>(path[i]);
    if (c == '\\' && i + 1 < path.size()) {
      out.push_back({c, static_cast<unsigned char>(path[++i]), 0});
      continue;
    }
    const auto close = c == '[' ? path.find(']', i) : std::string::npos;
    if (close == std::string::npos) {
      out.push_back({c, 0, 0});
      continue;
    }
    std::size_t index = 0;
    for (std::size_t k = i + 1; k < close; ++k) {
      index = index * 10 + static_cast<std::size_t>(path[k] - '0');
    }
    out.push_back({c, 0, index});
    i = close;
  }
  return out;
}

void Flatten(const Value& value, const std::string& path, Paths& out) {
  if (value.kind_case() == Value::kStructValue && value.struct_value().fields_size() > 0) {
    FlattenStruct(value.struct_value(), path, out);
    return;
  }
  if (value.kind_case() == Value::kListValue && value.list_value().values_size() > 0) {
    const auto& list = value.list_value();
    for (int i = 0; i < list.values_size(); ++i) {
      Flatten(list.values(i), path + "[" + std::to_string(i) + "]", out);
    }
    return;
  }
  out.emplace(path, &value);
}

bool SameValue(const Value& a, const Value& b) {
  return hashing::CanonicalJson(a) == hashing::CanonicalJson(b);
}

} // namespace

bool PathLess::operator()(const std::string& a, const std::string& b) const {
  const auto left  = Tokenize(a);
  const auto right = Tokenize(b);
  return std::lexicographical_compare(left.begin(), left.end(), right.begin(), right.end());
}

std::string_view ToString(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kUnchanged:
      return "unchanged";
    case ChangeKind::kAdded:
      return "added";
    case ChangeKind::kRemoved:
      return "removed";
    case ChangeKind::kChanged:
      return "changed";
  }
  return "unknown";
}

SnapshotDelta::SnapshotDelta(const model::Snapshot& older, const model::Snapshot& newer) : game_id_(older.game_id) {
  if (older.game_id != newer.game_id) {
    throw std::invalid_argument("cannot diff snapshots of different games: " + older.game_id + " vs " + newer.game_id);
  }
  time_delta_seconds_ = util::SecondsBetween(older.collected_at, newer.collected_at);
  FlattenStruct(older.normalized_fields, "", older_);
  FlattenStruct(newer.normalized_fields, "", newer_);
}

SnapshotDelta::iterator SnapshotDelta::begin() const {
  return iterator(this, older_.begin(), newer_.begin());
}

SnapshotDelta::iterator SnapshotDelta::end() const {
  return iterator(this, older_.end(), newer_.end());
}

std::vector<FieldDiff> SnapshotDelta::ChangedOnly() const {
  std::vector<FieldDiff> out;
  for (const auto& diff : *this) {
    if (diff.kind != ChangeKind::kUnchanged) {
      out.push_back(diff);
    }
  }
  return out;
}

SnapshotDelta::iterator::iterator(const SnapshotDelta* owner, Cursor older, Cursor newer)
    : owner_(owner), older_(older), newer_(newer) {
  Load();
}

// Merge step over the two sorted path maps.
void SnapshotDelta::iterator::Load() {
  const bool older_done = older_ == owner_->older_.end();
  const bool newer_done = newer_ == owner_->newer_.end();
  current_              = FieldDiff{};
  if (older_done && newer_done) {
    return;
  }

  const PathLess less;
  if (newer_done || (!older_done && less(older_->first, newer_->first))) {
    current_.path      = older_->first;
    current_.kind      = ChangeKind::kRemoved;
    current_.old_value = *older_->second;
  } else if (older_done || less(newer_->first, older_->first)) {
    current_.path      = newer_->first;
    current_.kind      = ChangeKind::kAdded;
    current_.new_value = *newer_->second;
  } else {
    current_.path      = older_->first;
    current_.kind      = SameValue(*older_->second, *newer_->second) ? ChangeKind::kUnchanged : ChangeKind::kChanged;
    current_.old_value = *older_->second;
    current_.new_value = *newer_->second;
  }
}

SnapshotDelta::iterator& SnapshotDelta::iterator::operator++() {
  switch (current_.kind) {
    case ChangeKind::kRemoved:
      ++older_;
      break;
    case ChangeKind::kAdded:
      ++newer_;
      break;
    case ChangeKind::kUnchanged:
    case ChangeKind::kChanged:
      ++older_;
      ++newer_;
      break;
  }
  Load();
  return *this;
}

} // namespace sportsledger::delta
