#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "stagegraph/artifact/v1/envelope.pb.h"

namespace stagegraph::provenance {

using stagegraph::artifact::v1::ArtifactEnvelope;

/*
  JSON form of an envelope:

      {
        "stage": "gather",
        "timestamp": "2026-10-19T08:15:02.041337Z",
        "parameters_used": {...},
        "content": {...},
        "_fingerprint": "9f86d0...",
        "_parent_fingerprints": {"search": "2c26b4..."}
      }

  Every field is written, including empty ones.
*/
std::string EncodeEnvelope(const ArtifactEnvelope& envelope);

/*
  Throws util::ParseError when the text is not an envelope: invalid JSON,
  a field of the wrong shape, or a missing stage, timestamp, content or
  fingerprint. Unknown extra fields are tolerated.
*/
ArtifactEnvelope DecodeEnvelope(const std::string& json);

google::protobuf::Struct SentinelContent(const std::string& reason);

// True for skip sentinels: content.skipped == true.
bool IsSentinel(const ArtifactEnvelope& envelope);

} // namespace stagegraph::provenance
