#pragma once

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "internal/model/stage_node.hpp"

namespace stagegraph::model {

enum class DefinitionSource {
  kManifest,
  kScript,
};

struct ManifestHeader {
  std::string name;
  std::string description;
  std::string category;
  std::string persona;
  std::string version = "1.0.0";
  bool        locked  = false;
  std::string authors;
};

struct ScriptHeader {
  std::string name;
  std::string description;
  std::string manifest;
  std::string version = "1.0.0";
  std::string authors;
};

using DefinitionHeader = std::variant<ManifestHeader, ScriptHeader>;

/*
  Parent -> child, the direction artifacts flow.
*/
struct Edge {
  std::string from;
  std::string to;
};

/*
  Parsed manifest or script.

  Immutable once constructed: the parsers are the only producers and
  every consumer gets const access. Node order is declaration order.
*/
class GraphDefinition {
 public:
  GraphDefinition(DefinitionSource source, DefinitionHeader header, std::vector<StageNode> nodes, std::vector<Edge> edges,
                  std::vector<std::string> root_ids, std::vector<std::string> terminal_ids);

  DefinitionSource        source() const { return source_; }
  const DefinitionHeader& header() const { return header_; }

  const std::vector<StageNode>&   nodes() const { return nodes_; }
  const std::vector<Edge>&        edges() const { return edges_; }
  const std::vector<std::string>& root_ids() const { return root_ids_; }
  const std::vector<std::string>& terminal_ids() const { return terminal_ids_; }

  std::size_t size() const { return nodes_.size(); }

  // nullptr when absent.
  const StageNode* Find(const std::string& id) const;
  bool             Contains(const std::string& id) const;

  std::vector<std::string> ChildrenOf(const std::string& id) const;

  // Kahn's algorithm; ties resolved in declaration order. Nodes on a
  // cycle are left out.
  std::vector<std::string> TopologicalOrder() const;

  // Header name/version regardless of source.
  const std::string& Name() const;
  const std::string& Version() const;

 private:
  DefinitionSource         source_;
  DefinitionHeader         header_;
  std::vector<StageNode>   nodes_;
  std::vector<Edge>        edges_;
  std::vector<std::string> root_ids_;
  std::vector<std::string> terminal_ids_;

  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace stagegraph::model
