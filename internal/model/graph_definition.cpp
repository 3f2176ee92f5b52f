#include "graph_definition.hpp"

#include <functional>
#include <queue>
#include <utility>

namespace stagegraph::model {

GraphDefinition::GraphDefinition(DefinitionSource source, DefinitionHeader header, std::vector<StageNode> nodes, std::vector<Edge> edges,
                                 std::vector<std::string> root_ids, std::vector<std::string> terminal_ids)
    : source_(source),
      header_(std::move(header)),
      nodes_(std::move(nodes)),
      edges_(std::move(edges)),
      root_ids_(std::move(root_ids)),
      terminal_ids_(std::move(terminal_ids)) {
  index_.reserve(nodes_.size());
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    index_.emplace(nodes_[i].id, i);
  }
}

const StageNode* GraphDefinition::Find(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &nodes_[it->second];
}

bool GraphDefinition::Contains(const std::string& id) const {
  return index_.count(id) > 0;
}

std::vector<std::string> GraphDefinition::ChildrenOf(const std::string& id) const {
  std::vector<std::string> children;
  for (const auto& edge : edges_) {
    if (edge.from == id) {
      children.push_back(edge.to);
    }
  }
  return children;
}

std::vector<std::string> GraphDefinition::TopologicalOrder() const {
  std::vector<std::size_t> in_degree(nodes_.size(), 0);
  for (const auto& edge : edges_) {
    auto to = index_.find(edge.to);
    if (to != index_.end() && index_.count(edge.from)) {
      ++in_degree[to->second];
    }
  }

  // Min-heap on declaration position keeps the order deterministic.
  std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) ready.push(i);
  }

  std::vector<std::string> order;
  order.reserve(nodes_.size());
  while (!ready.empty()) {
    const auto current = ready.top();
    ready.pop();
    order.push_back(nodes_[current].id);

    for (const auto& edge : edges_) {
      if (edge.from != nodes_[current].id) continue;
      auto to = index_.find(edge.to);
      if (to == index_.end()) continue;
      if (--in_degree[to->second] == 0) ready.push(to->second);
    }
  }
  return order;
}

const std::string& GraphDefinition::Name() const {
  return std::visit([](const auto& h) -> const std::string& { return h.name; }, header_);
}

const std::string& GraphDefinition::Version() const {
  return std::visit([](const auto& h) -> const std::string& { return h.version; }, header_);
}

} // namespace stagegraph::model
