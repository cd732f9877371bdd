#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sportsledger::util {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid JSON: " + std::string(status.message()));
  }
}

google::protobuf::Struct ParseStruct(const std::string& json) {
  google::protobuf::Struct out;
  FromJson(json, &out);
  return out;
}

google::protobuf::ListValue ParseList(const std::string& json) {
  google::protobuf::ListValue out;
  FromJson(json, &out);
  return out;
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

google::protobuf::Struct ToStruct(const std::map<std::string, std::string>& values) {
  google::protobuf::Struct out;
  for (const auto& [key, value] : values) {
    (*out.mutable_fields())[key].set_string_value(value);
  }
  return out;
}

std::map<std::string, std::string> ToStringMap(const google::protobuf::Struct& values) {
  std::map<std::string, std::string> out;
  for (const auto& [key, value] : values.fields()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw std::runtime_error("expected string value for key " + key);
    }
    out[key] = value.string_value();
  }
  return out;
}

google::protobuf::Value NumberValue(double value) {
  google::protobuf::Value out;
  out.set_number_value(value);
  return out;
}

google::protobuf::Value StringValue(const std::string& value) {
  google::protobuf::Value out;
  out.set_string_value(value);
  return out;
}

google::protobuf::Value BoolValue(bool value) {
  google::protobuf::Value out;
  out.set_bool_value(value);
  return out;
}

google::protobuf::Value NullValue() {
  google::protobuf::Value out;
  out.set_null_value(google::protobuf::NULL_VALUE);
  return out;
}

namespace {

const google::protobuf::Value* Find(const google::protobuf::Struct& object, const std::string& key, google::protobuf::Value::KindCase kind) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != kind) {
    return nullptr;
  }
  return &it->second;
}

} // namespace

std::optional<double> GetNumber(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key, google::protobuf::Value::kNumberValue);
  if (!value) return std::nullopt;
  return value->number_value();
}

std::optional<std::string> GetString(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key, google::protobuf::Value::kStringValue);
  if (!value) return std::nullopt;
  return value->string_value();
}

std::optional<bool> GetBool(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key, google::protobuf::Value::kBoolValue);
  if (!value) return std::nullopt;
  return value->bool_value();
}

const google::protobuf::Struct* GetStruct(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key, google::protobuf::Value::kStructValue);
  return value ? &value->struct_value() : nullptr;
}

const google::protobuf::ListValue* GetList(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Find(object, key, google::protobuf::Value::kListValue);
  return value ? &value->list_value() : nullptr;
}

} // namespace sportsledger::util
