#include "hasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <vector>

namespace stagegraph::fingerprint {

namespace {

void AppendQuoted(const std::string& text, std::string& out) {
  static constexpr char kHex[] = "0123456789abcdef";

  out.push_back('"');
  for (const unsigned char c : text) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          out += "\\u00";
          out.push_back(kHex[c >> 4]);
          out.push_back(kHex[c & 0x0F]);
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

void AppendNumber(double number, std::string& out) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", number);
  out += buf;
}

void AppendValue(const google::protobuf::Value& value, std::string& out);

void AppendStruct(const google::protobuf::Struct& value, std::string& out) {
  std::vector<const std::string*> keys;
  keys.reserve(value.fields_size());
  for (const auto& [key, unused] : value.fields()) {
    keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i) out.push_back(',');
    AppendQuoted(*keys[i], out);
    out.push_back(':');
    AppendValue(value.fields().at(*keys[i]), out);
  }
  out.push_back('}');
}

void AppendValue(const google::protobuf::Value& value, std::string& out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      return;
    case google::protobuf::Value::kNumberValue:
      AppendNumber(value.number_value(), out);
      return;
    case google::protobuf::Value::kStringValue:
      AppendQuoted(value.string_value(), out);
      return;
    case google::protobuf::Value::kStructValue:
      AppendStruct(value.struct_value(), out);
      return;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      const auto& items = value.list_value().values();
      for (int i = 0; i < items.size(); ++i) {
        if (i) out.push_back(',');
        AppendValue(items.Get(i), out);
      }
      out.push_back(']');
      return;
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
    default:
      out += "null";
      return;
  }
}

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string Sha256Hex(const std::string& input) {
  std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    throw std::runtime_error("sha256: digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

} // namespace

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendValue(value, out);
  return out;
}

std::string CanonicalJson(const google::protobuf::Struct& value) {
  std::string out;
  AppendStruct(value, out);
  return out;
}

std::string Compute(const std::string& canonical_content, const ParentFingerprints& parents) {
  std::string input = canonical_content;
  input.push_back('\0');

  input.push_back('{');
  bool first = true;
  for (const auto& [id, fp] : parents) {
    if (!first) input.push_back(',');
    first = false;
    AppendQuoted(id, input);
    input.push_back(':');
    AppendQuoted(fp, input);
  }
  input.push_back('}');

  return Sha256Hex(input);
}

std::string Compute(const google::protobuf::Struct& content, const ParentFingerprints& parents) {
  return Compute(CanonicalJson(content), parents);
}

ParentFingerprints ParentsOf(const stagegraph::artifact::v1::ArtifactEnvelope& envelope) {
  return ParentFingerprints(envelope.parent_fingerprints().begin(), envelope.parent_fingerprints().end());
}

bool Verify(const stagegraph::artifact::v1::ArtifactEnvelope& envelope) {
  return !envelope.fingerprint().empty() && Compute(envelope.content(), ParentsOf(envelope)) == envelope.fingerprint();
}

} // namespace stagegraph::fingerprint
