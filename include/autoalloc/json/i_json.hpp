#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "autoalloc/api/export.hpp"
#include "autoalloc/api/status.hpp"

namespace autoalloc {
namespace json {

using Json = nlohmann::json;

class AUTOALLOC_API JsonCodec {
 public:
  // Parse JSON text into a DOM object.
  // Returns kInvalidArgument when text is not valid JSON.
  static api::Result<Json> Parse(const std::string& text);

  // Load and parse a JSON file from disk.
  // Returns kNotFound when file does not exist.
  static api::Result<Json> LoadFile(const std::string& path);

  // Load a JSON file and return the object stored under `section`.
  // A file without that key yields an empty object, so callers fall back to defaults.
  static api::Result<Json> LoadSection(const std::string& path, const std::string& section);

  // Serialize JSON to UTF-8 string for logging/debugging.
  static std::string Dump(const Json& value, int indent = 2);
};

}  // namespace json
}  // namespace autoalloc
