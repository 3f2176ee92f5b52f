#pragma once

#include <string>

#include "internal/model/graph_definition.hpp"

namespace stagegraph::parser {

/*
  Applies a script overlay to a manifest.

      name: Quick run
      manifest: fedml.manifest.yaml   # required
      stages:
        - id: search
          skip: true
        - id: harmonize
          parameters: { threshold: 0.9 }

  Topology is inherited unchanged. Nodes are copied before they are
  changed, so the manifest definition is never touched. Overrides apply
  in declaration order; for repeated ids the later entry wins.

  Throws util::ParseError for a malformed document and
  util::TopologyError naming every override id absent from the manifest.
*/
model::GraphDefinition ParseScript(const std::string& yaml_text, const model::GraphDefinition& manifest);

} // namespace stagegraph::parser
