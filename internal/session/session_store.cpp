#include "session_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/paths/session_paths.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace stagegraph::session {

using stagegraph::paths::JoinPath;

namespace {

constexpr char kMetadataFile[] = "session.json";

SessionMetadata DecodeMetadata(const std::string& json, const std::string& path) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  SessionMetadata metadata;
  auto status = google::protobuf::util::JsonStringToMessage(json, &metadata, options);
  if (!status.ok()) {
    throw util::ParseError("Invalid session metadata", {{path, status.ToString()}});
  }
  if (metadata.id().empty()) {
    throw util::ParseError("Invalid session metadata", {{path + ":id", "is required"}});
  }
  return metadata;
}

std::string EncodeMetadata(const SessionMetadata& metadata) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(metadata, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode session metadata: " + status.ToString());
  }
  return json;
}

} // namespace

SessionStore::SessionStore(storage::ArtifactStorePtr store, std::string base_path) : store_(std::move(store)), base_path_(std::move(base_path)) {
}

std::string SessionStore::PersonaPath(const std::string& persona) const {
  if (persona.empty() || persona.find('/') != std::string::npos) {
    throw util::InvalidState("invalid persona '" + persona + "'");
  }
  return JoinPath(base_path_, persona);
}

Session SessionStore::Create(const std::string& persona, const std::string& manifest_version) {
  const auto now = util::ToIso8601(util::Now());

  Session session;
  session.metadata.set_id(util::GenerateSessionId());
  session.metadata.set_persona(persona);
  session.metadata.set_manifest_version(manifest_version);
  session.metadata.set_created(now);
  session.metadata.set_last_active(now);
  session.root_path = JoinPath(PersonaPath(persona), session.metadata.id());

  const auto path = JoinPath(session.root_path, kMetadataFile);
  if (store_->CreateAtomically(path, EncodeMetadata(session.metadata)) != storage::CreateResult::kCreated) {
    throw util::StoreError("session already exists: " + path);
  }

  STAGEGRAPH_LOG_INFO("Created session", {observability::StringField("persona", persona),
                                          observability::StringField("session", session.metadata.id())});
  return session;
}

std::optional<Session> SessionStore::Resume(const std::string& persona, const std::string& session_id) const {
  const auto root = JoinPath(PersonaPath(persona), session_id);
  const auto path = JoinPath(root, kMetadataFile);

  auto bytes = store_->Read(path);
  if (!bytes) return std::nullopt;

  return Session{DecodeMetadata(*bytes, path), root};
}

std::vector<Session> SessionStore::List(const std::string& persona) const {
  const auto persona_path = PersonaPath(persona);

  std::vector<Session> sessions;
  for (const auto& entry : store_->ListChildren(persona_path)) {
    if (!entry.is_directory) continue;

    const auto root = JoinPath(persona_path, entry.name);
    const auto path = JoinPath(root, kMetadataFile);
    auto       bytes = store_->Read(path);
    if (!bytes) continue;

    try {
      sessions.push_back({DecodeMetadata(*bytes, path), root});
    } catch (const util::ParseError& e) {
      STAGEGRAPH_LOG_WARN("Skipping unreadable session", {observability::StringField("path", path), observability::StringField("error", e.what())});
    }
  }

  std::sort(sessions.begin(), sessions.end(), [](const Session& a, const Session& b) {
    return a.metadata.last_active() > b.metadata.last_active();
  });
  return sessions;
}

} // namespace stagegraph::session
