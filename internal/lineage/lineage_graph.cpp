#include "internal/lineage/lineage_graph.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace sportsledger::lineage {

std::vector<LineageNode> TraceLineage(const std::string& id, const NodeResolver& resolve) {
  std::vector<LineageNode>        path;
  std::unordered_set<std::string> visited;
  std::optional<std::string>      cursor = id;

  while (cursor) {
    if (!visited.insert(*cursor).second) {
      throw util::IntegrityError("lineage cycle detected at analysis " + *cursor);
    }
    auto node = resolve(*cursor);
    if (!node) {
      throw util::NotFoundError("analysis", *cursor);
    }
    cursor = node->parent_id;
    path.push_back(std::move(*node));
  }

  std::reverse(path.begin(), path.end());
  return path;
}

void LineageGraph::Add(const LineageNode& node) {
  if (node.id.empty()) {
    throw std::invalid_argument("lineage node id must not be empty");
  }

  if (auto it = nodes_.find(node.id); it != nodes_.end()) {
    if (it->second.parent_id == node.parent_id && it->second.created_at == node.created_at) {
      return;
    }
    throw util::UniquenessError("analysis", node.id);
  }

  if (node.parent_id) {
    auto parent = nodes_.find(*node.parent_id);
    if (parent == nodes_.end()) {
      throw util::ReferentialError("analysis", node.id, "parent " + *node.parent_id + " does not exist");
    }
    if (parent->second.created_at > node.created_at) {
      throw util::ReferentialError("analysis", node.id, "parent " + *node.parent_id + " was created after its child");
    }
    children_[*node.parent_id].push_back(node.id);
  } else {
    roots_.push_back(node.id);
  }

  nodes_.emplace(node.id, node);
}

bool LineageGraph::Contains(const std::string& id) const {
  return nodes_.contains(id);
}

const LineageNode& LineageGraph::Get(const std::string& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw util::NotFoundError("analysis", id);
  }
  return it->second;
}

std::vector<LineageNode> LineageGraph::PathToRoot(const std::string& id) const {
  return TraceLineage(id, [this](const std::string& node_id) -> std::optional<LineageNode> {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
  });
}

std::vector<std::string> LineageGraph::Children(const std::string& id) const {
  auto it = children_.find(id);
  if (it == children_.end()) return {};
  return it->second;
}

std::vector<std::string> LineageGraph::Roots() const {
  return roots_;
}

std::vector<std::string> LineageGraph::Descendants(const std::string& id, std::size_t max_depth) const {
  if (!Contains(id)) {
    throw util::NotFoundError("analysis", id);
  }

  std::vector<std::string>                          result;
  std::unordered_set<std::string>                   visited{id};
  std::deque<std::pair<std::string, std::size_t>>   queue;
  queue.emplace_back(id, 0);

  while (!queue.empty()) {
    auto [current, depth] = queue.front();
    queue.pop_front();

    if (max_depth != 0 && depth >= max_depth) continue;

    for (const auto& child : Children(current)) {
      if (!visited.insert(child).second) continue;
      result.push_back(child);
      queue.emplace_back(child, depth + 1);
    }
  }
  return result;
}

} // namespace sportsledger::lineage
