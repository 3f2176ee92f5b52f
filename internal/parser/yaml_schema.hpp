#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace stagegraph::parser {

/*
  Field-level schema checks over a YAML tree.

  Every reader records a violation in the IssueList instead of
  throwing, so one parse reports every problem of a document at once.
  Readers return nullopt when the field is absent or invalid.
*/

class IssueList {
 public:
  void Add(std::string path, std::string message);

  bool empty() const {
    return issues_.empty();
  }

  const std::vector<util::FieldIssue>& issues() const {
    return issues_;
  }

  [[noreturn]] void Throw(const std::string& what) const;

 private:
  std::vector<util::FieldIssue> issues_;
};

std::string FieldPath(const std::string& base, const std::string& key);
std::string FieldPath(const std::string& base, std::size_t index);

// Throws ParseError at "(document)" when the text is not YAML or not a mapping.
YAML::Node LoadDocument(const std::string& text, const std::string& what);

std::optional<std::string> ReadString(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues);
std::optional<std::string> ReadRequiredString(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues);
std::optional<bool>        ReadBool(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues);
std::optional<int>         ReadNonNegativeInt(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues);

std::optional<std::vector<std::string>> ReadStringList(const YAML::Node& parent, const std::string& key, const std::string& base,
                                                       IssueList& issues);

/*
  Stage ids and artifact names become directory and file names in the
  session tree. Records an issue unless `value` is one plain path
  segment: no separators, no leading '.' (hidden by the disk store),
  and no "_BRANCH_" marker.
*/
void CheckPathSegment(const std::string& value, const std::string& path, IssueList& issues);

// Absent or null yields nullopt without an issue; anything but a mapping is an issue.
std::optional<YAML::Node> ReadMapping(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues);

} // namespace stagegraph::parser
