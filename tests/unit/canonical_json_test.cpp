#include "internal/hashing/canonical_json.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/util/json.hpp"

namespace {

using sportsledger::hashing::CanonicalJson;
using sportsledger::hashing::ContentHash;
using sportsledger::hashing::Sha256Hex;

namespace util = sportsledger::util;

void TestKeysAreSortedAndWhitespaceDropped() {
  auto a = util::ParseStruct(R"({ "b": 1, "a": { "z": true, "y": null }, "c": [ 1, "x" ] })");
  assert(CanonicalJson(a) == R"({"a":{"y":null,"z":true},"b":1,"c":[1,"x"]})");
}

void TestInsertionOrderDoesNotChangeHash() {
  google::protobuf::Struct first;
  (*first.mutable_fields())["home"] = util::StringValue("Lakers");
  (*first.mutable_fields())["away"] = util::StringValue("Celtics");
  (*first.mutable_fields())["odds"] = util::NumberValue(-150);

  google::protobuf::Struct second;
  (*second.mutable_fields())["odds"] = util::NumberValue(-150);
  (*second.mutable_fields())["away"] = util::StringValue("Celtics");
  (*second.mutable_fields())["home"] = util::StringValue("Lakers");

  assert(CanonicalJson(first) == CanonicalJson(second));
  assert(ContentHash(first) == ContentHash(second));

  (*second.mutable_fields())["odds"] = util::NumberValue(-155);
  assert(ContentHash(first) != ContentHash(second));
}

void TestNumbersUseShortestForm() {
  assert(CanonicalJson(util::NumberValue(1.0)) == "1");
  assert(CanonicalJson(util::NumberValue(0.57)) == "0.57");
  assert(CanonicalJson(util::NumberValue(-150)) == "-150");
  assert(CanonicalJson(util::NumberValue(-0.0)) == "0");
}

void TestStringEscaping() {
  assert(CanonicalJson(util::StringValue("a\"b\\c\n")) == R"("a\"b\\c\n")");
  assert(CanonicalJson(util::StringValue(std::string("\x01", 1))) == R"("\u0001")");
  assert(CanonicalJson(util::StringValue("☃")) == "\"☃\"");
}

void TestNonFiniteNumbersAreRejected() {
  bool threw = false;
  try {
    (void)CanonicalJson(util::NumberValue(std::numeric_limits<double>::quiet_NaN()));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "NaN has no canonical form.");
}

void TestSha256KnownVectors() {
  assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(ContentHash(google::protobuf::Struct()) == Sha256Hex("{}"));
}

} // namespace

int main() {
  TestKeysAreSortedAndWhitespaceDropped();
  TestInsertionOrderDoesNotChangeHash();
  TestNumbersUseShortestForm();
  TestStringEscaping();
  TestNonFiniteNumbersAreRejected();
  TestSha256KnownVectors();

  std::cout << "sportsledger_unit_canonical_json: pass\n";
  return 0;
}
