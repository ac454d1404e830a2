#include "detector/model_factory.hpp"
#include "detector/name_heuristic_detector.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace textscrub {

Result<ModelDelegates> create_model_delegates(const std::vector<ModelConfig>& models) {
    ModelDelegates delegates;

    for (const auto& model : models) {
        if (delegates.contains(model.name)) {
            return Result<ModelDelegates>::error(ErrorCategory::CONFIGURATION_ERROR,
                std::format("Model '{}' defined more than once", model.name));
        }

        if (utils::to_lower(model.kind) == "name_heuristic") {
            NameHeuristicDetector::Config cfg;
            cfg.name = model.name;
            cfg.entity_type = model.entity_type;
            cfg.score = model.score;
            cfg.given_names = model.given_names;
            if (!model.honorifics.empty()) {
                cfg.honorifics = model.honorifics;
            }
            delegates.emplace(model.name, std::make_shared<NameHeuristicDetector>(std::move(cfg)));
            utils::log::debug(std::format("Model '{}' ({}): {} given names",
                model.name, model.kind, model.given_names.size()));
            continue;
        }

        return Result<ModelDelegates>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Model '{}': unknown kind '{}'", model.name, model.kind));
    }

    return Result<ModelDelegates>::ok(std::move(delegates));
}

} // namespace textscrub
