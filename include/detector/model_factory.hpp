#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "recognizer/recognizer_registry.hpp"

#include <vector>

namespace textscrub {

/**
 * @brief Instantiate the [[models]] entries of a config as named delegates
 *
 * Known kinds: "name_heuristic".
 */
[[nodiscard]] Result<ModelDelegates> create_model_delegates(const std::vector<ModelConfig>& models);

} // namespace textscrub
