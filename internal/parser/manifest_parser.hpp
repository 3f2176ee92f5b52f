#pragma once

#include <string>

#include "internal/model/graph_definition.hpp"

namespace stagegraph::parser {

/*
  Parses a manifest document into a GraphDefinition.

  The whole document is checked first; every schema violation is
  reported in a single util::ParseError tagged with its field path.
  Structural problems (duplicate ids, dangling parents, cycles, no
  root) are reported the same way once the nodes are built.

  Document shape:

      name: Federated training        # required
      persona: fedml                  # required
      description / category / version / authors: strings
      locked: bool
      stages:                         # required, non-empty
        - id: search                  # required
          produces: [search.json]     # required, non-empty
          previous: null | id | [ids]
          optional / structural: bool
          name / phase / instruction / narrative: strings
          handler: lowercase identifier
          commands / blueprint: [strings]
          parameters: { ... }
          skip_warning: { short, reason, max_warnings }
*/
model::GraphDefinition ParseManifest(const std::string& yaml_text);

} // namespace stagegraph::parser
