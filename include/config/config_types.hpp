#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace textscrub {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct DetectionConfig {
    std::string default_language = "en";
    double score_threshold = 0.0;
    size_t context_window_words = 5;
    double context_boost = 0.35;
    double min_score_with_context = 0.4;
    DetectionFailurePolicy on_failure = DetectionFailurePolicy::FAIL;
};

/**
 * @brief Named model delegate a MODEL recognizer can reference
 */
struct ModelConfig {
    std::string name;
    std::string kind = "name_heuristic";
    std::string entity_type = "PERSON";
    double score = 0.85;
    std::vector<std::string> given_names;
    std::vector<std::string> honorifics;    // empty = detector defaults
};

struct ScrubberConfig {
    LoggingConfig logging;
    DetectionConfig detection;
    std::vector<ModelConfig> models;
    std::vector<RecognizerSpec> recognizers;
};

} // namespace textscrub
