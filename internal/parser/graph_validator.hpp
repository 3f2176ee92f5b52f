#pragma once

#include <vector>

#include "internal/model/graph_definition.hpp"
#include "internal/util/errors.hpp"

namespace stagegraph::parser {

/*
  Structural checks over a built graph:

    - stage ids are unique
    - every `previous` entry names an existing stage
    - `previous` is never an empty list
    - at least one root exists
    - no cycles (Kahn's algorithm)

  Issue paths use the stage's declaration index ("stages.3.previous").
  An empty result means the graph is valid.
*/
std::vector<util::FieldIssue> ValidateGraph(const model::GraphDefinition& definition);

} // namespace stagegraph::parser
