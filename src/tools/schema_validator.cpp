#include "drover/tools/schema_validator.hpp"

#include "drover/common/fs.hpp"
#include "drover/common/json_util.hpp"

#include <cmath>

namespace drover::tools {

namespace {

bool matches_type(const std::string &type, const std::string &raw) {
  const auto kind = common::json_kind(raw);
  if (type == "string") {
    return kind == common::JsonKind::String;
  }
  if (type == "number") {
    return kind == common::JsonKind::Number;
  }
  if (type == "integer") {
    const auto number = common::json_as_number(raw);
    return kind == common::JsonKind::Number && number.has_value() &&
           std::floor(*number) == *number;
  }
  if (type == "boolean") {
    return kind == common::JsonKind::Boolean;
  }
  if (type == "object") {
    return kind == common::JsonKind::Object;
  }
  if (type == "array") {
    return kind == common::JsonKind::Array;
  }
  if (type == "null") {
    return kind == common::JsonKind::Null;
  }
  return true;
}

common::Status check_property(const std::string &name, const std::string &raw,
                              const std::string &property_schema) {
  if (const std::string type = common::json_get_string(property_schema, "type"); !type.empty()) {
    if (!matches_type(type, raw)) {
      return common::Status::error("params/" + name + " must be " + type);
    }
  }
  if (auto allowed = common::json_field(property_schema, "enum"); allowed.has_value()) {
    bool found = false;
    for (const auto &option : common::json_array_items(*allowed)) {
      const auto option_number = common::json_as_number(option);
      if (common::trim(option) == common::trim(raw) ||
          (option_number.has_value() && option_number == common::json_as_number(raw))) {
        found = true;
        break;
      }
    }
    if (!found) {
      return common::Status::error("params/" + name + " must be one of " + *allowed);
    }
  }
  return common::Status::success();
}

} // namespace

common::Status validate_args(const ToolArgs &args, std::string_view schema_json) {
  if (common::json_kind(schema_json) != common::JsonKind::Object) {
    return common::Status::error("Tool declares an invalid parameter schema");
  }

  if (auto required = common::json_field(schema_json, "required"); required.has_value()) {
    for (const auto &item : common::json_array_items(*required)) {
      const auto name = common::json_as_string(item);
      if (name.has_value() && !args.contains(*name)) {
        return common::Status::error("params must have required property '" + *name + "'");
      }
    }
  }

  const auto properties = common::json_field(schema_json, "properties");
  const auto additional = common::json_field(schema_json, "additionalProperties");
  const bool closed = additional.has_value() && common::trim(*additional) == "false";
  for (const auto &[name, raw] : args) {
    std::optional<std::string> property;
    if (properties.has_value()) {
      property = common::json_field(*properties, name);
    }
    if (!property.has_value()) {
      if (closed) {
        return common::Status::error("params must NOT have additional property '" + name + "'");
      }
      continue;
    }
    auto status = check_property(name, raw, *property);
    if (!status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

} // namespace drover::tools
