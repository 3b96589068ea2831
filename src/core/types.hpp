#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ctxmgr {

using json = nlohmann::json;

// Generic value-or-error carrier for helpers that report failure without throwing
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(std::string err) {
    Result r;
    r.error = std::move(err);
    return r;
  }
};

// Outcome of a tool invocation, in the shape returned by tools/call
struct ToolResult {
  std::vector<json> content;  // Content blocks, normally {"type":"text","text":...}
  bool is_error = false;
  json extra = json::object();  // Other envelope fields (e.g. _meta), passed through verbatim

  static ToolResult success(std::string text) {
    ToolResult r;
    r.content.push_back(text_block(std::move(text)));
    return r;
  }

  static ToolResult error(std::string text) {
    ToolResult r;
    r.content.push_back(text_block(std::move(text)));
    r.is_error = true;
    return r;
  }

  // An object whose "content" is an array
  static bool is_envelope(const json &value) {
    return value.is_object() && value.contains("content") && value["content"].is_array();
  }

  // Accepts a {content: [...], isError?, ...} envelope produced by a handler.
  // Callers check is_envelope() first.
  static ToolResult from_json(const json &envelope) {
    ToolResult r;
    for (const auto &[key, value] : envelope.items()) {
      if (key == "content") {
        r.content = value.get<std::vector<json>>();
      } else if (key == "isError" && value.is_boolean()) {
        r.is_error = value.get<bool>();
      } else {
        r.extra[key] = value;
      }
    }
    return r;
  }

  static json text_block(std::string text) {
    return json{{"type", "text"}, {"text", std::move(text)}};
  }

  json to_json() const {
    json j = extra;
    j["content"] = content;
    if (is_error) {
      j["isError"] = true;
    }
    return j;
  }

  // Concatenated text of all text blocks
  std::string text() const {
    std::string out;
    for (const auto &block : content) {
      if (!block.is_object()) continue;
      auto type = block.find("type");
      auto body = block.find("text");
      if (type == block.end() || *type != "text" || body == block.end() || !body->is_string()) continue;
      if (!out.empty()) out += "\n";
      out += body->get<std::string>();
    }
    return out;
  }
};

}  // namespace ctxmgr
