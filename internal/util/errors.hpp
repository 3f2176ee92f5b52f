#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stagegraph::util {

/*
  Central error types.

  Parse and topology errors are terminal for the call that raised them;
  nothing is partially applied. Store errors come from an artifact backend.
*/

struct FieldIssue {
  std::string path;    // "stages.2.produces", "(document)" for the whole text
  std::string message;
};

class ParseError : public std::runtime_error {
 public:
  ParseError(const std::string& what, std::vector<FieldIssue> issues) : std::runtime_error(Format(what, issues)), issues_(std::move(issues)) {
  }

  const std::vector<FieldIssue>& issues() const {
    return issues_;
  }

 private:
  static std::string Format(const std::string& what, const std::vector<FieldIssue>& issues) {
    std::string out = what;
    for (std::size_t i = 0; i < issues.size(); ++i) {
      out += i == 0 ? ": " : "; ";
      out += "[" + issues[i].path + "] " + issues[i].message;
    }
    return out;
  }

  std::vector<FieldIssue> issues_;
};

class TopologyError : public std::runtime_error {
 public:
  TopologyError(const std::string& msg, std::vector<std::string> stage_ids) : std::runtime_error(msg), stage_ids_(std::move(stage_ids)) {
  }

  const std::vector<std::string>& stage_ids() const {
    return stage_ids_;
  }

 private:
  std::vector<std::string> stage_ids_;
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace stagegraph::util
