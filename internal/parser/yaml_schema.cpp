#include "yaml_schema.hpp"

#include <utility>

namespace stagegraph::parser {

namespace {

bool IsAbsent(const YAML::Node& node) {
  return !node.IsDefined() || node.IsNull();
}

} // namespace

void IssueList::Add(std::string path, std::string message) {
  issues_.push_back({std::move(path), std::move(message)});
}

void IssueList::Throw(const std::string& what) const {
  throw util::ParseError(what, issues_);
}

std::string FieldPath(const std::string& base, const std::string& key) {
  return base.empty() ? key : base + "." + key;
}

std::string FieldPath(const std::string& base, std::size_t index) {
  return FieldPath(base, std::to_string(index));
}

YAML::Node LoadDocument(const std::string& text, const std::string& what) {
  YAML::Node doc;
  try {
    doc = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::ParseError("Invalid " + what, {{"(document)", e.what()}});
  }

  if (!doc.IsMap()) {
    throw util::ParseError("Invalid " + what, {{"(document)", what + " must be a YAML mapping"}});
  }
  return doc;
}

std::optional<std::string> ReadString(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues) {
  const YAML::Node node = parent[key];
  if (IsAbsent(node)) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    issues.Add(FieldPath(base, key), "expected a string");
    return std::nullopt;
  }
  return node.Scalar();
}

std::optional<std::string> ReadRequiredString(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues) {
  const auto path = FieldPath(base, key);
  if (IsAbsent(parent[key])) {
    issues.Add(path, key + " is required");
    return std::nullopt;
  }

  auto value = ReadString(parent, key, base, issues);
  if (value && value->empty()) {
    issues.Add(path, key + " must not be empty");
    return std::nullopt;
  }
  return value;
}

void CheckPathSegment(const std::string& value, const std::string& path, IssueList& issues) {
  if (value.empty()) {
    issues.Add(path, "must not be empty");
  } else if (value[0] == '.') {
    issues.Add(path, "must not start with '.'");
  } else if (value.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
    issues.Add(path, "must be a single path segment");
  } else if (value.find("_BRANCH_") != std::string::npos) {
    issues.Add(path, "must not contain '_BRANCH_'");
  }
}

std::optional<bool> ReadBool(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues) {
  const YAML::Node node = parent[key];
  if (IsAbsent(node)) {
    return std::nullopt;
  }

  bool value = false;
  if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
    issues.Add(FieldPath(base, key), "expected a boolean");
    return std::nullopt;
  }
  return value;
}

std::optional<int> ReadNonNegativeInt(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues) {
  const YAML::Node node = parent[key];
  if (IsAbsent(node)) {
    return std::nullopt;
  }

  int value = 0;
  if (!node.IsScalar() || !YAML::convert<int>::decode(node, value)) {
    issues.Add(FieldPath(base, key), "expected an integer");
    return std::nullopt;
  }
  if (value < 0) {
    issues.Add(FieldPath(base, key), "must not be negative");
    return std::nullopt;
  }
  return value;
}

std::optional<std::vector<std::string>> ReadStringList(const YAML::Node& parent, const std::string& key, const std::string& base,
                                                       IssueList& issues) {
  const YAML::Node node = parent[key];
  if (IsAbsent(node)) {
    return std::nullopt;
  }

  const auto path = FieldPath(base, key);
  if (!node.IsSequence()) {
    issues.Add(path, "expected a list of strings");
    return std::nullopt;
  }

  std::vector<std::string> values;
  values.reserve(node.size());
  bool ok = true;
  for (std::size_t i = 0; i < node.size(); ++i) {
    if (!node[i].IsScalar()) {
      issues.Add(FieldPath(path, i), "expected a string");
      ok = false;
      continue;
    }
    values.push_back(node[i].Scalar());
  }
  if (!ok) {
    return std::nullopt;
  }
  return values;
}

std::optional<YAML::Node> ReadMapping(const YAML::Node& parent, const std::string& key, const std::string& base, IssueList& issues) {
  const YAML::Node node = parent[key];
  if (IsAbsent(node)) {
    return std::nullopt;
  }
  if (!node.IsMap()) {
    issues.Add(FieldPath(base, key), "expected a mapping");
    return std::nullopt;
  }
  return node;
}

} // namespace stagegraph::parser
