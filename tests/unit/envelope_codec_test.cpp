#include "internal/provenance/envelope_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/fingerprint/hasher.hpp"
#include "internal/util/errors.hpp"
#include "stagegraph/v1.hpp"

namespace {

using stagegraph::v1::ArtifactEnvelope;
using stagegraph::provenance::DecodeEnvelope;
using stagegraph::provenance::EncodeEnvelope;
using stagegraph::provenance::IsSentinel;
using stagegraph::provenance::SentinelContent;
using stagegraph::util::ParseError;

ArtifactEnvelope MakeEnvelope() {
  ArtifactEnvelope envelope;
  envelope.set_stage("gather");
  envelope.set_timestamp("2026-10-19T08:15:02.041337Z");
  (*envelope.mutable_parameters_used()->mutable_fields())["limit"].set_number_value(5);
  (*envelope.mutable_content()->mutable_fields())["rows"].set_number_value(10);
  (*envelope.mutable_parent_fingerprints())["search"] = "fp-search";
  envelope.set_fingerprint(stagegraph::fingerprint::Compute(envelope.content(), {{"search", "fp-search"}}));
  return envelope;
}

void TestEncodedJsonUsesEnvelopeFieldNames() {
  const auto json = EncodeEnvelope(MakeEnvelope());

  for (const char* field : {"\"stage\"", "\"timestamp\"", "\"parameters_used\"", "\"content\"", "\"_fingerprint\"", "\"_parent_fingerprints\""}) {
    assert(json.find(field) != std::string::npos);
  }
  assert(json.find("parametersUsed") == std::string::npos);
  assert(json.find("parentFingerprints") == std::string::npos);
}

void TestEmptyFieldsAreStillWritten() {
  ArtifactEnvelope root;
  root.set_stage("search");
  root.set_timestamp("2026-10-19T08:15:02.000000Z");
  root.set_fingerprint("fp");

  const auto json = EncodeEnvelope(root);
  assert(json.find("\"_parent_fingerprints\"") != std::string::npos);
  assert(json.find("\"parameters_used\"") != std::string::npos);
  assert(json.find("\"content\"") != std::string::npos);
}

void TestDecodeRestoresEnvelope() {
  const auto original = MakeEnvelope();
  const auto decoded  = DecodeEnvelope(EncodeEnvelope(original));

  assert(decoded.stage() == "gather");
  assert(decoded.timestamp() == original.timestamp());
  assert(decoded.fingerprint() == original.fingerprint());
  assert(decoded.parent_fingerprints().at("search") == "fp-search");
  assert(stagegraph::fingerprint::Verify(decoded));
}

void TestDecodeToleratesUnknownFields() {
  const auto decoded = DecodeEnvelope(R"({"stage":"a","timestamp":"t","parameters_used":{},"content":{"x":1},
                                          "_fingerprint":"f","_parent_fingerprints":{},"materialized":["out.csv"]})");
  assert(decoded.stage() == "a");
}

void TestCorruptEnvelopesAreRejected() {
  bool threw = false;
  try {
    (void)DecodeEnvelope("{not json");
  } catch (const ParseError& e) {
    threw = true;
    assert(e.issues()[0].path == "(document)");
  }
  assert(threw);

  threw = false;
  try {
    (void)DecodeEnvelope(R"({"stage":"a","content":{}})");
  } catch (const ParseError& e) {
    threw = true;
    assert(e.issues().size() == 2);
    assert(e.issues()[0].path == "timestamp");
    assert(e.issues()[1].path == "_fingerprint");
  }
  assert(threw);

  threw = false;
  try {
    (void)DecodeEnvelope(R"({"stage":"a","timestamp":"t","_fingerprint":"f","content":"oops"})");
  } catch (const ParseError&) {
    threw = true;
  }
  assert(threw);
}

void TestSentinelDetection() {
  ArtifactEnvelope sentinel;
  *sentinel.mutable_content() = SentinelContent("not needed");
  assert(IsSentinel(sentinel));
  assert(sentinel.content().fields().at("reason").string_value() == "not needed");

  assert(!IsSentinel(MakeEnvelope()));

  ArtifactEnvelope string_flag;
  (*string_flag.mutable_content()->mutable_fields())["skipped"].set_string_value("true");
  assert(!IsSentinel(string_flag));
}

} // namespace

int main() {
  TestEncodedJsonUsesEnvelopeFieldNames();
  TestEmptyFieldsAreStillWritten();
  TestDecodeRestoresEnvelope();
  TestDecodeToleratesUnknownFields();
  TestCorruptEnvelopesAreRejected();
  TestSentinelDetection();

  std::cout << "stagegraph_unit_envelope_codec: pass\n";
  return 0;
}
