#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

namespace sportsledger::hashing {

/*
  Canonical JSON serialization and content hashing.

  Canonical form:
    - object keys sorted by UTF-8 byte order
    - no insignificant whitespace
    - numbers in shortest round-trip decimal form, -0 written as 0
    - strings escaped with \" \\ \b \f \n \r \t and \u00XX for other
      control characters; all other bytes copied verbatim

  The same logical value always produces the same bytes regardless of
  map insertion order, so the digest is a stable content fingerprint.
  Non-finite numbers cannot be represented and throw std::invalid_argument.
*/

std::string CanonicalJson(const google::protobuf::Value& value);
std::string CanonicalJson(const google::protobuf::Struct& value);
std::string CanonicalJson(const google::protobuf::ListValue& value);

// SHA-256 digest as 64 lowercase hex characters.
std::string Sha256Hex(std::string_view bytes);

// Sha256Hex(CanonicalJson(fields)).
std::string ContentHash(const google::protobuf::Struct& fields);

} // namespace sportsledger::hashing
