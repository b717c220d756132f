#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace uplink::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, UploaderConfig& cfg, std::string& err);

} // namespace uplink::config::detail
