#pragma once

#include "detector/ientity_detector.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace textscrub {

/**
 * @brief Lightweight person-name detector usable as a model delegate
 *
 * Two rules, both requiring capitalised words:
 * 1. Honorific + names: "Mr. John Smith", "Dr Peeters"
 * 2. Known given name + optional surnames: "Alice", "Alice Martin"
 *
 * Stands in for an NER model where none is deployed; swap it for a real
 * model delegate by registering another IEntityDetector under the same name.
 */
class NameHeuristicDetector : public IEntityDetector {
public:
    struct Config {
        std::string name = "name_heuristic";
        std::string entity_type = "PERSON";
        double score = 0.85;
        std::vector<std::string> given_names;
        std::vector<std::string> honorifics = {
            "mr", "mrs", "ms", "miss", "dr", "prof", "mme", "mevr", "dhr", "mlle"
        };
        size_t max_name_words = 4;
    };

    explicit NameHeuristicDetector(Config config);

    [[nodiscard]] DetectionReport detect(
        std::string_view text,
        std::string_view language,
        const EntityTypeSet& entity_types) const override;

    [[nodiscard]] std::string name() const override { return config_.name; }

private:
    struct Word {
        size_t start;
        size_t end;
    };

    [[nodiscard]] static std::vector<Word> split_words(std::string_view text);
    [[nodiscard]] static bool is_capitalised(std::string_view word);
    [[nodiscard]] static bool joined_by_space(std::string_view text, const Word& a, const Word& b);

    Config config_;
    std::unordered_set<std::string> given_names_;   // lower-cased
    std::unordered_set<std::string> honorifics_;    // lower-cased
};

} // namespace textscrub
