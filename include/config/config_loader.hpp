#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

/**
 * @brief Loads scrubber.toml
 *
 * Sections: [logging], [detection], [[models]], [[recognizers]].
 * ${ENV_VAR} references inside string values are expanded. Every problem
 * found is reported at once; a config with any error is rejected whole.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ScrubberConfig config;

        static LoadResult ok(ScrubberConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to scrubber.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on an already-extracted config
     * @return One message per problem, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ScrubberConfig& config);

    [[nodiscard]] static std::optional<RecognizerKind> parse_kind(std::string_view kind);
    [[nodiscard]] static std::optional<DetectionFailurePolicy> parse_failure_policy(std::string_view policy);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static DetectionConfig extract_detection(const toml::table& root, std::vector<std::string>& errors);
    static std::vector<ModelConfig> extract_models(const toml::table& root);
    static std::vector<RecognizerSpec> extract_recognizers(const toml::table& root,
                                                           std::vector<std::string>& errors);

    static LoadResult extract_and_validate(const toml::table& root);
};

} // namespace textscrub
