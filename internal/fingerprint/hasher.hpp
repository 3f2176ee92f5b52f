#pragma once

#include <google/protobuf/struct.pb.h>

#include <map>
#include <string>

#include "stagegraph/artifact/v1/envelope.pb.h"

namespace stagegraph::fingerprint {

// parent stage id -> parent fingerprint, kept sorted by id
using ParentFingerprints = std::map<std::string, std::string>;

/*
  Deterministic JSON text for hashing.

  Object keys are emitted in byte order, no whitespace, numbers with
  round-trip precision. Equal values always produce equal text no matter
  how the underlying maps were populated.
*/
std::string CanonicalJson(const google::protobuf::Value& value);
std::string CanonicalJson(const google::protobuf::Struct& value);

/*
  SHA-256 over

      content '\0' {"id1":"fp1","id2":"fp2",...}

  The parent map is written as canonical JSON (sorted by id, quoted and
  escaped), so ids holding ':' or ',' cannot collide. Lowercase hex.
*/
std::string Compute(const std::string& canonical_content, const ParentFingerprints& parents);

std::string Compute(const google::protobuf::Struct& content, const ParentFingerprints& parents);

ParentFingerprints ParentsOf(const stagegraph::artifact::v1::ArtifactEnvelope& envelope);

// Recomputes the envelope fingerprint and compares it with the stored one.
bool Verify(const stagegraph::artifact::v1::ArtifactEnvelope& envelope);

} // namespace stagegraph::fingerprint
