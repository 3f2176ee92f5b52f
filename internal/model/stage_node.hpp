#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stagegraph::model {

/*
  Warning shown when a user tries to move past an optional stage
  without running it. The stage may be skipped after max_warnings
  warnings have been shown.
*/
struct SkipWarning {
  std::string short_text;
  std::string reason;
  int         max_warnings = 2;
};

struct ExecuteDirective {};

/*
  Set by a script override. The stage materializes a skip sentinel
  instead of a real artifact.
*/
struct SkipMarker {
  std::string reason;
};

using StageDirective = std::variant<ExecuteDirective, SkipMarker>;

/*
  One stage of a workflow.

  Parents are declared backwards through `previous`. Forward edges are
  never stored here; GraphDefinition derives them.

    previous == nullopt   root
    previous == {a, b}    join, `a` is the primary (nesting) parent
*/
struct StageNode {
  std::string                             id;
  std::string                             name;
  std::optional<std::string>              phase;
  std::optional<std::vector<std::string>> previous;

  bool optional   = false;
  bool structural = false;

  std::vector<std::string> produces;
  google::protobuf::Struct parameters;
  StageDirective           directive = ExecuteDirective{};

  std::string                instruction;
  std::vector<std::string>   commands;
  std::optional<std::string> handler;
  std::optional<SkipWarning> skip_warning;
  std::optional<std::string> narrative;
  std::vector<std::string>   blueprint;

  bool IsRoot() const {
    return !previous.has_value();
  }

  bool IsSkipped() const {
    return std::holds_alternative<SkipMarker>(directive);
  }

  // Non-root optional and structural stages do not appear in session paths.
  bool IsPathTransparent() const {
    return structural || (optional && previous.has_value() && !previous->empty());
  }

  const std::vector<std::string>& Parents() const {
    static const std::vector<std::string> kNone;
    return previous ? *previous : kNone;
  }
};

} // namespace stagegraph::model
