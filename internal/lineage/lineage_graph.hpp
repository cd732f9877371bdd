#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace sportsledger::lineage {

/*
  Analysis lineage.

  Analyses form a forest: each node names at most one parent, and a parent
  must already exist (with an earlier or equal creation time) when a child
  is added. Nodes are addressed by id; edges are id lookups, never
  pointers.
*/

struct LineageNode {
  std::string                id;
  std::optional<std::string> parent_id;
  util::TimePoint            created_at{};
};

using NodeResolver = std::function<std::optional<LineageNode>(const std::string& id)>;

/*
  Follows parent pointers from id to its root and returns the chain
  root-first. Throws util::NotFoundError when an id on the chain cannot be
  resolved and util::IntegrityError when an id repeats (a cycle can only
  come from corrupted storage).
*/
std::vector<LineageNode> TraceLineage(const std::string& id, const NodeResolver& resolve);

class LineageGraph {
 public:
  // Throws util::ReferentialError if the parent is missing or younger.
  // Re-adding an identical node is a no-op.
  void Add(const LineageNode& node);

  bool Contains(const std::string& id) const;

  // Throws util::NotFoundError.
  const LineageNode& Get(const std::string& id) const;

  // Root-first chain ending at id.
  std::vector<LineageNode> PathToRoot(const std::string& id) const;

  std::vector<std::string> Children(const std::string& id) const;

  std::vector<std::string> Roots() const;

  // Breadth-first descendants of id; max_depth 0 means unlimited.
  std::vector<std::string> Descendants(const std::string& id, std::size_t max_depth = 0) const;

  std::size_t size() const {
    return nodes_.size();
  }

 private:
  std::unordered_map<std::string, LineageNode>              nodes_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
  std::vector<std::string>                                  roots_;
};

} // namespace sportsledger::lineage
