#pragma once

#include "packguard/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace packguard::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, PackguardConfigFromFile& cfg, std::string& err);

} // namespace packguard::config::detail
