#pragma once

#include <nlohmann/json.hpp>

namespace slide::core {

using Json = nlohmann::json;

}  // namespace slide::core
