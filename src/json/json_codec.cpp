#include "autoalloc/json/i_json.hpp"

#include <fstream>
#include <sstream>

namespace autoalloc {
namespace json {

#define AA_STATUS(code, message) api::Status::FromModule((code), (message), api::ErrorModule::kJson)

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const std::exception& ex) {
    return api::Result<Json>(api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                                     std::string("json parse failed: ") + ex.what(),
                                                     api::ErrorModule::kJson, 0x0001));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(AA_STATUS(api::StatusCode::kNotFound, "json file not found: " + path));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

api::Result<Json> JsonCodec::LoadSection(const std::string& path, const std::string& section) {
  api::Result<Json> loaded = LoadFile(path);
  if (!loaded.ok()) {
    return loaded;
  }
  const Json& root = loaded.value();
  if (!root.is_object()) {
    return api::Result<Json>(AA_STATUS(api::StatusCode::kInvalidArgument, "root JSON must be object"));
  }
  if (!root.contains(section)) {
    return api::Result<Json>(Json::object());
  }
  if (!root[section].is_object()) {
    return api::Result<Json>(
        AA_STATUS(api::StatusCode::kInvalidArgument, section + " must be JSON object"));
  }
  return api::Result<Json>(root[section]);
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  try {
    return value.dump(indent);
  } catch (const std::exception&) {
    return std::string();
  }
}

#undef AA_STATUS

}  // namespace json
}  // namespace autoalloc
