#include "config/config_loader.hpp"
#include "classifier/risk_tier_classifier.hpp"
#include "core/utils.hpp"
#include "recognizer/recognizer.hpp"
#include "recognizer/validators.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace textscrub {

// Default scores per recognizer kind when [[recognizers]] omits "score"
static constexpr double kDefaultPatternScore  = 0.8;
static constexpr double kDefaultDenyListScore = 0.7;
static constexpr double kDefaultModelScore    = 0.85;

// ============================================================================
// TOML Helpers
// ============================================================================

namespace {

/**
 * @brief Replaces every ${NAME} in the string values of a parsed config with
 * the environment value (empty when unset).
 *
 * "pattern" values are regex source and stay literal.
 */
void expand_env_in_place(toml::node& node) {
    if (auto* str = node.as_string()) {
        std::string& raw = str->get();
        size_t open = raw.find("${");
        while (open != std::string::npos) {
            const size_t close = raw.find('}', open + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed ${{...}} in config value '{}'", raw));
            }
            const std::string name = raw.substr(open + 2, close - open - 2);
            const char* value = std::getenv(name.c_str());
            const std::string_view replacement = value ? value : "";
            raw.replace(open, close + 1 - open, replacement);
            open = raw.find("${", open + replacement.size());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) {
            if (key.str() == "pattern") continue;
            expand_env_in_place(child);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) {
            expand_env_in_place(child);
        }
    }
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

double default_score_for(RecognizerKind kind) {
    switch (kind) {
        case RecognizerKind::PATTERN:   return kDefaultPatternScore;
        case RecognizerKind::DENY_LIST: return kDefaultDenyListScore;
        case RecognizerKind::MODEL:     return kDefaultModelScore;
    }
    return kDefaultPatternScore;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<RecognizerKind> ConfigLoader::parse_kind(std::string_view kind) {
    const std::string lower = utils::to_lower(kind);

    static const std::unordered_map<std::string, RecognizerKind> lookup = {
        {"pattern",   RecognizerKind::PATTERN},
        {"regex",     RecognizerKind::PATTERN},
        {"deny_list", RecognizerKind::DENY_LIST},
        {"denylist",  RecognizerKind::DENY_LIST},
        {"model",     RecognizerKind::MODEL},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<DetectionFailurePolicy> ConfigLoader::parse_failure_policy(std::string_view policy) {
    const std::string lower = utils::to_lower(policy);
    if (lower == "fail")    return DetectionFailurePolicy::FAIL;
    if (lower == "partial") return DetectionFailurePolicy::PARTIAL;
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

DetectionConfig ConfigLoader::extract_detection(const toml::table& root,
                                                std::vector<std::string>& errors) {
    DetectionConfig cfg;
    const auto* detection = root["detection"].as_table();
    if (!detection) return cfg;
    const auto& d = *detection;

    cfg.default_language = d["default_language"].value_or(cfg.default_language);
    cfg.score_threshold = d["score_threshold"].value_or(cfg.score_threshold);
    cfg.context_window_words = static_cast<size_t>(
        d["context_window_words"].value_or(static_cast<int64_t>(cfg.context_window_words)));
    cfg.context_boost = d["context_boost"].value_or(cfg.context_boost);
    cfg.min_score_with_context = d["min_score_with_context"].value_or(cfg.min_score_with_context);

    if (auto policy_str = d["on_failure"].value<std::string>()) {
        if (auto policy = parse_failure_policy(*policy_str)) {
            cfg.on_failure = *policy;
        } else {
            errors.push_back(std::format(
                "detection.on_failure must be \"fail\" or \"partial\", got '{}'", *policy_str));
        }
    }
    return cfg;
}

std::vector<ModelConfig> ConfigLoader::extract_models(const toml::table& root) {
    std::vector<ModelConfig> result;
    const auto* arr = root["models"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* node = elem.as_table();
        if (!node) continue;
        const auto& m = *node;

        ModelConfig model;
        model.name = m["name"].value_or(""s);
        model.kind = m["kind"].value_or(model.kind);
        model.entity_type = m["entity_type"].value_or(model.entity_type);
        model.score = m["score"].value_or(model.score);
        model.given_names = toml_string_array(m, "given_names");
        model.honorifics = toml_string_array(m, "honorifics");
        result.emplace_back(std::move(model));
    }
    return result;
}

std::vector<RecognizerSpec> ConfigLoader::extract_recognizers(const toml::table& root,
                                                              std::vector<std::string>& errors) {
    std::vector<RecognizerSpec> result;
    const auto* arr = root["recognizers"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* node = (*arr)[i].as_table();
        if (!node) continue;
        const auto& r = *node;

        RecognizerSpec spec;
        spec.name = r["name"].value_or(std::format("recognizers[{}]", i));
        spec.entity_type = r["entity_type"].value_or(""s);

        const std::string kind_str = r["kind"].value_or("pattern"s);
        if (auto kind = parse_kind(kind_str)) {
            spec.kind = *kind;
        } else {
            errors.push_back(std::format("Recognizer '{}': unknown kind '{}'", spec.name, kind_str));
        }

        const std::string tier_str = r["min_tier"].value_or(""s);
        if (auto tier = parse_risk_tier(tier_str)) {
            spec.min_tier = *tier;
        } else {
            errors.push_back(std::format(
                "Recognizer '{}': min_tier must be C1, C2, C3 or C4, got '{}'", spec.name, tier_str));
        }

        spec.pattern = r["pattern"].value_or(""s);
        spec.deny_list = toml_string_array(r, "deny_list");
        spec.model_ref = r["model"].value_or(""s);
        spec.default_score = r["score"].value_or(default_score_for(spec.kind));
        spec.context_keywords = toml_string_array(r, "context");
        spec.language = r["language"].value_or(""s);

        const std::string validator_str = r["validator"].value_or("none"s);
        if (auto validator = validators::parse_validator(validator_str)) {
            spec.validator = *validator;
        } else {
            errors.push_back(std::format(
                "Recognizer '{}': unknown validator '{}'", spec.name, validator_str));
        }

        result.emplace_back(std::move(spec));
    }
    return result;
}

// ---- Shared extraction + validation ----------------------------------------

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;

    ScrubberConfig config;
    config.logging = extract_logging(root);
    config.detection = extract_detection(root, errors);
    config.models = extract_models(root);
    config.recognizers = extract_recognizers(root, errors);

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_in_place(tbl);
        return extract_and_validate(tbl);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {}: {}", config_path, e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_in_place(tbl);
        return extract_and_validate(tbl);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ScrubberConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    const auto& d = config.detection;
    if (d.default_language.empty()) {
        errors.push_back("detection.default_language must not be empty");
    }
    if (d.score_threshold < 0.0 || d.score_threshold > 1.0) {
        errors.push_back(std::format("detection.score_threshold must be within [0, 1], got {}",
                                     d.score_threshold));
    }
    if (d.context_boost < 0.0 || d.context_boost > 1.0) {
        errors.push_back(std::format("detection.context_boost must be within [0, 1], got {}",
                                     d.context_boost));
    }
    if (d.min_score_with_context < 0.0 || d.min_score_with_context > 1.0) {
        errors.push_back(std::format("detection.min_score_with_context must be within [0, 1], got {}",
                                     d.min_score_with_context));
    }

    std::unordered_set<std::string> model_names;
    for (size_t i = 0; i < config.models.size(); ++i) {
        const auto& m = config.models[i];
        if (m.name.empty()) {
            errors.push_back(std::format("models[{}].name must not be empty", i));
        } else if (!model_names.insert(m.name).second) {
            errors.push_back(std::format("Model '{}' defined more than once", m.name));
        }
        if (utils::to_lower(m.kind) != "name_heuristic") {
            errors.push_back(std::format("Model '{}': unknown kind '{}'", m.name, m.kind));
        }
        if (m.entity_type.empty()) {
            errors.push_back(std::format("Model '{}': entity_type must not be empty", m.name));
        }
        if (m.score < 0.0 || m.score > 1.0) {
            errors.push_back(std::format("Model '{}': score must be within [0, 1], got {}", m.name, m.score));
        }
    }

    std::unordered_set<std::string> recognizer_names;
    for (const auto& spec : config.recognizers) {
        if (!recognizer_names.insert(spec.name).second) {
            errors.push_back(std::format("Recognizer '{}' defined more than once", spec.name));
        }
        if (spec.entity_type.empty()) {
            errors.push_back(std::format("Recognizer '{}': entity_type must not be empty", spec.name));
        }
        if (spec.default_score < 0.0 || spec.default_score > 1.0) {
            errors.push_back(std::format("Recognizer '{}': score must be within [0, 1], got {}",
                                         spec.name, spec.default_score));
        }

        switch (spec.kind) {
            case RecognizerKind::PATTERN: {
                const auto compiled = PatternRecognizer::compile(spec);
                if (compiled.is_error()) {
                    errors.push_back(compiled.error_message());
                }
                break;
            }
            case RecognizerKind::DENY_LIST:
                if (spec.deny_list.empty()) {
                    errors.push_back(std::format("Recognizer '{}': deny_list must not be empty", spec.name));
                }
                break;
            case RecognizerKind::MODEL:
                if (spec.model_ref.empty()) {
                    errors.push_back(std::format("Recognizer '{}': model must name a [[models]] entry",
                                                 spec.name));
                } else if (!model_names.contains(spec.model_ref)) {
                    errors.push_back(std::format("Recognizer '{}': unknown model '{}'",
                                                 spec.name, spec.model_ref));
                }
                break;
        }

        if (spec.validator != ValidatorKind::NONE && spec.kind != RecognizerKind::PATTERN) {
            errors.push_back(std::format("Recognizer '{}': validator only applies to pattern recognizers",
                                         spec.name));
        }
    }

    return errors;
}

} // namespace textscrub
