#include "tool/schema.hpp"

#include <algorithm>

namespace ctxmgr::tool {

namespace {

std::string format_error(const std::string &path, const std::string &reason) {
  if (path.empty()) {
    return "Invalid input: " + reason;
  }
  return "Invalid input at '" + path + "': " + reason;
}

std::string child_path(const std::string &parent, const std::string &key) {
  return parent.empty() ? key : parent + "." + key;
}

std::string expected(const std::string &type, const json &received) {
  return "expected " + type + ", received " + received.type_name();
}

}  // namespace

SchemaError::SchemaError(std::string path, std::string reason)
    : std::runtime_error(format_error(path, reason)), path_(std::move(path)), reason_(std::move(reason)) {}

std::string to_string(SchemaKind kind) {
  switch (kind) {
    case SchemaKind::Object:
      return "object";
    case SchemaKind::String:
      return "string";
    case SchemaKind::Number:
      return "number";
    case SchemaKind::Boolean:
      return "boolean";
    case SchemaKind::Array:
      return "array";
  }
  return "unknown";
}

// ============================================================
// Builders
// ============================================================

Schema Schema::object(std::vector<Property> properties) {
  Schema s(SchemaKind::Object);
  s.properties_ = std::move(properties);
  return s;
}

Schema Schema::string() {
  return Schema(SchemaKind::String);
}

Schema Schema::number() {
  return Schema(SchemaKind::Number);
}

Schema Schema::boolean() {
  return Schema(SchemaKind::Boolean);
}

Schema Schema::array(Schema items) {
  Schema s(SchemaKind::Array);
  s.items_ = std::make_shared<const Schema>(std::move(items));
  return s;
}

Schema Schema::describe(std::string description) const {
  Schema copy = *this;
  copy.description_ = std::move(description);
  return copy;
}

Schema Schema::optional() const {
  Schema copy = *this;
  copy.optional_ = true;
  return copy;
}

Schema Schema::one_of(std::vector<std::string> values) const {
  Schema copy = *this;
  copy.enum_values_ = std::move(values);
  return copy;
}

// ============================================================
// Validation
// ============================================================

json Schema::validate(const json &input) const {
  return validate_at(input, "");
}

json Schema::validate_at(const json &input, const std::string &path) const {
  switch (kind_) {
    case SchemaKind::Object: {
      if (!input.is_object()) {
        throw SchemaError(path, expected("object", input));
      }
      json out = json::object();
      for (const auto &[key, prop] : properties_) {
        auto it = input.find(key);
        if (it == input.end() || it->is_null()) {
          if (prop.is_optional()) continue;
          throw SchemaError(child_path(path, key), "Required");
        }
        out[key] = prop.validate_at(*it, child_path(path, key));
      }
      return out;
    }

    case SchemaKind::String: {
      if (!input.is_string()) {
        throw SchemaError(path, expected("string", input));
      }
      if (!enum_values_.empty()) {
        const auto &value = input.get_ref<const std::string &>();
        if (std::find(enum_values_.begin(), enum_values_.end(), value) == enum_values_.end()) {
          std::string options;
          for (const auto &v : enum_values_) {
            if (!options.empty()) options += " | ";
            options += "'" + v + "'";
          }
          throw SchemaError(path, "Invalid enum value. Expected " + options + ", received '" + value + "'");
        }
      }
      return input;
    }

    case SchemaKind::Number:
      if (!input.is_number()) {
        throw SchemaError(path, expected("number", input));
      }
      return input;

    case SchemaKind::Boolean:
      if (!input.is_boolean()) {
        throw SchemaError(path, expected("boolean", input));
      }
      return input;

    case SchemaKind::Array: {
      if (!input.is_array()) {
        throw SchemaError(path, expected("array", input));
      }
      json out = json::array();
      for (size_t i = 0; i < input.size(); ++i) {
        out.push_back(items_->validate_at(input[i], path + "[" + std::to_string(i) + "]"));
      }
      return out;
    }
  }
  throw SchemaError(path, "unsupported schema kind");
}

// ============================================================
// JSON Schema conversion
// ============================================================

json Schema::to_json_schema() const {
  json j;
  j["type"] = to_string(kind_);

  switch (kind_) {
    case SchemaKind::Object: {
      json props = json::object();
      json required = json::array();
      for (const auto &[key, prop] : properties_) {
        props[key] = prop.to_json_schema();
        if (!prop.is_optional()) {
          required.push_back(key);
        }
      }
      j["properties"] = std::move(props);
      if (!required.empty()) {
        j["required"] = std::move(required);
      }
      break;
    }
    case SchemaKind::String:
      if (!enum_values_.empty()) {
        j["enum"] = enum_values_;
      }
      break;
    case SchemaKind::Number:
    case SchemaKind::Boolean:
      break;
    case SchemaKind::Array:
      j["items"] = items_->to_json_schema();
      break;
  }

  if (!description_.empty()) {
    j["description"] = description_;
  }
  return j;
}

}  // namespace ctxmgr::tool
