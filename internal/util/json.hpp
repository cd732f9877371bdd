#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <map>
#include <optional>
#include <string>

namespace sportsledger::util {

/*
  JSON text <-> protobuf message helpers built on protobuf's json_util.

  Used for free-form record content (Struct / ListValue) persisted as
  text and for payload files read from disk. Failures throw
  std::runtime_error.
*/

std::string ToJson(const google::protobuf::Message& message);

void FromJson(const std::string& json, google::protobuf::Message* message);

google::protobuf::Struct    ParseStruct(const std::string& json);
google::protobuf::ListValue ParseList(const std::string& json);

std::string ReadFile(const std::string& path);

google::protobuf::Struct           ToStruct(const std::map<std::string, std::string>& values);
std::map<std::string, std::string> ToStringMap(const google::protobuf::Struct& values);

// Convenience builders for Value.
google::protobuf::Value NumberValue(double value);
google::protobuf::Value StringValue(const std::string& value);
google::protobuf::Value BoolValue(bool value);
google::protobuf::Value NullValue();

// Typed lookups into a Struct. Absent keys and values of another kind
// yield nullopt / nullptr.
std::optional<double>           GetNumber(const google::protobuf::Struct& object, const std::string& key);
std::optional<std::string>      GetString(const google::protobuf::Struct& object, const std::string& key);
std::optional<bool>             GetBool(const google::protobuf::Struct& object, const std::string& key);
const google::protobuf::Struct* GetStruct(const google::protobuf::Struct& object, const std::string& key);
const google::protobuf::ListValue* GetList(const google::protobuf::Struct& object, const std::string& key);

} // namespace sportsledger::util
