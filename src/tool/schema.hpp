#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ctxmgr::tool {

using json = nlohmann::json;

// Thrown by Schema::validate; path is empty for the root value
class SchemaError : public std::runtime_error {
 public:
  SchemaError(std::string path, std::string reason);

  const std::string &path() const {
    return path_;
  }
  const std::string &reason() const {
    return reason_;
  }

 private:
  std::string path_;
  std::string reason_;
};

enum class SchemaKind { Object, String, Number, Boolean, Array };

std::string to_string(SchemaKind kind);

// Input schema of a tool. A closed set of node kinds that can both validate
// arbitrary JSON and describe itself as JSON Schema for tools/list.
//
//   auto schema = Schema::object({
//       {"file", Schema::string().one_of({"TODO.md", "TODO-NEXT.md"}).optional()},
//       {"content", Schema::string().describe("New content")},
//   });
class Schema {
 public:
  using Property = std::pair<std::string, Schema>;

  static Schema object(std::vector<Property> properties = {});
  static Schema string();
  static Schema number();
  static Schema boolean();
  static Schema array(Schema items);

  // Modifiers return a modified copy
  Schema describe(std::string description) const;
  Schema optional() const;
  Schema one_of(std::vector<std::string> values) const;

  SchemaKind kind() const {
    return kind_;
  }
  bool is_optional() const {
    return optional_;
  }
  const std::string &description() const {
    return description_;
  }
  const std::vector<Property> &properties() const {
    return properties_;
  }
  const std::vector<std::string> &enum_values() const {
    return enum_values_;
  }
  const Schema *items() const {
    return items_.get();
  }

  // Returns the validated value. Unknown object keys are dropped, optional
  // keys that are absent or null are omitted. Throws SchemaError.
  json validate(const json &input) const;

  // JSON Schema description: {type, properties, required?, ...}
  json to_json_schema() const;

 private:
  explicit Schema(SchemaKind kind) : kind_(kind) {}

  json validate_at(const json &input, const std::string &path) const;

  SchemaKind kind_;
  bool optional_ = false;
  std::string description_;
  std::vector<Property> properties_;          // Object
  std::vector<std::string> enum_values_;      // String
  std::shared_ptr<const Schema> items_;       // Array
};

}  // namespace ctxmgr::tool
