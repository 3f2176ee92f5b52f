#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/storage/artifact_store.hpp"
#include "stagegraph/session/v1/session.pb.h"

namespace stagegraph::session {

using stagegraph::session::v1::SessionMetadata;

struct Session {
  SessionMetadata metadata;
  std::string     root_path;  // <base>/<persona>/<id>
};

/*
  Session trees on an artifact store:

      <base>/<persona>/<session-id>/session.json
      <base>/<persona>/<session-id>/<stage nesting>/...

  session.json is written once with create-or-fail.
*/
class SessionStore {
 public:
  SessionStore(storage::ArtifactStorePtr store, std::string base_path);

  Session Create(const std::string& persona, const std::string& manifest_version);

  // nullopt when there is no such session. Throws util::ParseError for
  // an unreadable session.json.
  std::optional<Session> Resume(const std::string& persona, const std::string& session_id) const;

  // Most recently active first. Entries without a readable session.json
  // are skipped.
  std::vector<Session> List(const std::string& persona) const;

  const storage::ArtifactStorePtr& store() const { return store_; }

 private:
  std::string PersonaPath(const std::string& persona) const;

  storage::ArtifactStorePtr store_;
  std::string               base_path_;
};

} // namespace stagegraph::session
