#include "internal/hashing/canonical_json.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

namespace sportsledger::hashing {
namespace {

void AppendValue(const google::protobuf::Value& value, std::string* out);

void AppendString(std::string_view text, std::string* out) {
  static constexpr char kHex[] = "0123456789abcdef";

  out->push_back('"');
  for (const char c : text) {
    const auto byte = static_cast<unsigned char>(c);
    switch (c) {
      case '"':
        out->append("\\\"");
        break;
      case '\\':
        out->append("\\\\");
        break;
      case '\b':
        out->append("\\b");
        break;
      case '\f':
        out->append("\\f");
        break;
      case '\n':
        out->append("\\n");
        break;
      case '\r':
        out->append("\\r");
        break;
      case '\t':
        out->append("\\t");
        break;
      default:
        if (byte < 0x20) {
          out->append("\\u00");
          out->push_back(kHex[byte >> 4]);
          out->push_back(kHex[byte & 0x0F]);
        } else {
          out->push_back(c);
        }
    }
  }
  out->push_back('"');
}

void AppendNumber(double number, std::string* out) {
  if (!std::isfinite(number)) {
    throw std::invalid_argument("canonical json: non-finite number");
  }
  if (number == 0.0) {
    out->push_back('0');
    return;
  }

  char buffer[32];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number);
  if (ec != std::errc()) {
    throw std::invalid_argument("canonical json: number formatting failed");
  }
  out->append(buffer, end);
}

void AppendStruct(const google::protobuf::Struct& value, std::string* out) {
  std::vector<const std::string*> keys;
  keys.reserve(value.fields().size());
  for (const auto& [key, _] : value.fields()) {
    keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out->push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out->push_back(',');
    first = false;
    AppendString(*key, out);
    out->push_back(':');
    AppendValue(value.fields().at(*key), out);
  }
  out->push_back('}');
}

void AppendList(const google::protobuf::ListValue& value, std::string* out) {
  out->push_back('[');
  for (int i = 0; i < value.values_size(); ++i) {
    if (i > 0) out->push_back(',');
    AppendValue(value.values(i), out);
  }
  out->push_back(']');
}

void AppendValue(const google::protobuf::Value& value, std::string* out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out->append("null");
      break;
    case google::protobuf::Value::kNumberValue:
      AppendNumber(value.number_value(), out);
      break;
    case google::protobuf::Value::kStringValue:
      AppendString(value.string_value(), out);
      break;
    case google::protobuf::Value::kBoolValue:
      out->append(value.bool_value() ? "true" : "false");
      break;
    case google::protobuf::Value::kStructValue:
      AppendStruct(value.struct_value(), out);
      break;
    case google::protobuf::Value::kListValue:
      AppendList(value.list_value(), out);
      break;
  }
}

} // namespace

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendValue(value, &out);
  return out;
}

std::string CanonicalJson(const google::protobuf::Struct& value) {
  std::string out;
  AppendStruct(value, &out);
  return out;
}

std::string CanonicalJson(const google::protobuf::ListValue& value) {
  std::string out;
  AppendList(value, &out);
  return out;
}

std::string Sha256Hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("sha256: digest computation failed");
  }

  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

std::string ContentHash(const google::protobuf::Struct& fields) {
  return Sha256Hex(CanonicalJson(fields));
}

} // namespace sportsledger::hashing
