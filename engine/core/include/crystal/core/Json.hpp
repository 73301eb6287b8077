#pragma once

#include <nlohmann/json.hpp>

namespace crystal::core {

using Json = nlohmann::json;

}  // namespace crystal::core
