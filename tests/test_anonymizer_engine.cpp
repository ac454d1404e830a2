#include <catch2/catch_test_macros.hpp>
#include "anonymizer/anonymizer_engine.hpp"
#include "detector/name_heuristic_detector.hpp"
#include "mocks/mock_entity_detector.hpp"

#include <memory>
#include <stdexcept>

using namespace textscrub;
using textscrub::testing::MockEntityDetector;

namespace {

RecognizerSpec pattern(std::string name, std::string type, std::string regex, RiskTier tier) {
    RecognizerSpec spec;
    spec.name = std::move(name);
    spec.entity_type = std::move(type);
    spec.kind = RecognizerKind::PATTERN;
    spec.pattern = std::move(regex);
    spec.min_tier = tier;
    return spec;
}

RecognizerSpec person_model(RiskTier tier = RiskTier::C2) {
    RecognizerSpec spec;
    spec.name = "person";
    spec.entity_type = "PERSON";
    spec.kind = RecognizerKind::MODEL;
    spec.model_ref = "person_names";
    spec.min_tier = tier;
    return spec;
}

std::shared_ptr<const IEntityDetector> person_names() {
    NameHeuristicDetector::Config config;
    config.name = "person_names";
    config.given_names = {"Alice", "Bob"};
    return std::make_shared<NameHeuristicDetector>(config);
}

std::shared_ptr<const RecognizerRegistry> banking_registry() {
    RecognizerSpec religion;
    religion.name = "religious_belief";
    religion.entity_type = "RELIGIOUS_BELIEF";
    religion.kind = RecognizerKind::DENY_LIST;
    religion.deny_list = {"christian", "muslim"};
    religion.min_tier = RiskTier::C4;

    auto registry = RecognizerRegistry::create(
        {
            person_model(),
            pattern("email", "EMAIL_ADDRESS", R"([A-Za-z0-9._]+@[A-Za-z0-9.]+\.[a-z]{2,})", RiskTier::C2),
            pattern("iban_be", "IBAN_BE", R"(\bBE\d{2}(?:\s?\d{4}){3}\b)", RiskTier::C3),
            religion,
        },
        ModelDelegates{{"person_names", person_names()}});
    REQUIRE(registry.is_ok());
    return registry.value();
}

} // namespace

// ============================================================================
// Tier selection
// ============================================================================

TEST_CASE("Engine scrubs only the types active at the tier", "[engine]") {
    const AnonymizerEngine engine(banking_registry());
    const std::string text = "Alice (alice@bank.be) pays from BE68 5390 0754 7034, christian";

    SECTION("C1 touches nothing") {
        auto result = engine.scrub(text, "C1", "en");
        REQUIRE(result.is_ok());
        CHECK(result.value().anonymized_text == text);
        CHECK(result.value().entities.empty());
    }

    SECTION("C2 handles contact data") {
        auto result = engine.scrub(text, "C2", "en");
        REQUIRE(result.is_ok());
        CHECK(result.value().anonymized_text ==
              "<PERSON> (<EMAIL_ADDRESS>) pays from BE68 5390 0754 7034, christian");
    }

    SECTION("C3 adds financial data") {
        auto result = engine.scrub(text, "C3", "en");
        REQUIRE(result.is_ok());
        CHECK(result.value().anonymized_text ==
              "<PERSON> (<EMAIL_ADDRESS>) pays from <IBAN_BE>, christian");
    }

    SECTION("C4 adds special categories") {
        auto result = engine.scrub(text, "C4", "en");
        REQUIRE(result.is_ok());
        CHECK(result.value().anonymized_text ==
              "<PERSON> (<EMAIL_ADDRESS>) pays from <IBAN_BE>, <RELIGIOUS_BELIEF>");
        CHECK(result.value().entities.size() == 4);
    }
}

TEST_CASE("Engine tiers are monotonic", "[engine]") {
    const auto registry = banking_registry();
    const auto& c2 = registry->entity_types_for_tier(RiskTier::C2);
    const auto& c3 = registry->entity_types_for_tier(RiskTier::C3);
    const auto& c4 = registry->entity_types_for_tier(RiskTier::C4);

    for (const auto& type : c2) CHECK(c3.contains(type));
    for (const auto& type : c3) CHECK(c4.contains(type));
}

TEST_CASE("Engine rejects an unknown tier", "[engine]") {
    const AnonymizerEngine engine(banking_registry());
    auto result = engine.scrub("Alice", "C9", "en");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIGURATION_ERROR);
}

TEST_CASE("Engine returns an empty result for empty input", "[engine]") {
    const AnonymizerEngine engine(banking_registry());
    for (const auto* tier : {"C1", "C2", "C3", "C4"}) {
        auto result = engine.scrub("", tier, "en");
        REQUIRE(result.is_ok());
        CHECK(result.value() == ScrubResult{});
    }
}

// ============================================================================
// Tokens and offsets
// ============================================================================

TEST_CASE("Engine numbers repeated entities in reading order", "[engine]") {
    const AnonymizerEngine engine(banking_registry());
    const std::string text = "Alice emailed Bob and Alice called again";

    auto result = engine.scrub(text, "C2", "en");
    REQUIRE(result.is_ok());

    const auto& record = result.value();
    CHECK(record.anonymized_text == "<PERSON_1> emailed <PERSON_2> and <PERSON_3> called again");
    REQUIRE(record.entities.size() == 3);
    CHECK(record.entities[0].original_text == "Alice");
    CHECK(record.entities[1].original_text == "Bob");
    CHECK(record.entities[2].original_text == "Alice");
    CHECK(record.entities[2].replacement_token == "<PERSON_3>");
}

TEST_CASE("Engine entity offsets point into the anonymized text", "[engine]") {
    const AnonymizerEngine engine(banking_registry());
    // "Alice" (5 chars) -> "<PERSON>" (8 chars)
    const std::string text = "Alice wrote to a@b.com";

    auto result = engine.scrub(text, "C2", "en");
    REQUIRE(result.is_ok());
    const auto& record = result.value();
    REQUIRE(record.entities.size() == 2);

    const auto& email = record.entities[1];
    CHECK(email.entity_type == "EMAIL_ADDRESS");
    CHECK(email.start == text.find("a@b.com") + 3);

    for (const auto& entity : record.entities) {
        CHECK(record.anonymized_text.substr(entity.start, entity.end - entity.start) ==
              entity.replacement_token);
    }
}

TEST_CASE("Engine leaves no part of an outer span visible when another type nests inside", "[engine][overlap]") {
    RecognizerSpec politics;
    politics.name = "political_opinion";
    politics.entity_type = "POLITICAL_OPINION";
    politics.kind = RecognizerKind::DENY_LIST;
    politics.deny_list = {"green"};
    politics.min_tier = RiskTier::C4;

    auto registry = RecognizerRegistry::create({person_model(), politics},
                                               ModelDelegates{{"person_names", person_names()}});
    REQUIRE(registry.is_ok());
    const AnonymizerEngine engine(registry.value());

    const std::string text = "Call Mr Green Smith today";
    auto result = engine.scrub(text, "C4", "en");
    REQUIRE(result.is_ok());

    const auto& record = result.value();
    CHECK(record.anonymized_text.find("Green") == std::string::npos);
    CHECK(record.anonymized_text.find("Smith") == std::string::npos);
    REQUIRE(record.entities.size() == 1);
    CHECK(record.entities[0].entity_type == "PERSON");
    CHECK(record.entities[0].replacement_token == "<PERSON>");

    auto restored = AnonymizerEngine::descrub(record, DescrubRequest::selective({"<PERSON>"}));
    REQUIRE(restored.is_ok());
    CHECK(restored.value() == text);
}

TEST_CASE("Engine leaves a type unsuffixed when overlap removes its other occurrences", "[engine][overlap]") {
    RecognizerSpec nickname;
    nickname.name = "nickname";
    nickname.entity_type = "NICKNAME";
    nickname.kind = RecognizerKind::DENY_LIST;
    nickname.deny_list = {"alice"};
    nickname.min_tier = RiskTier::C2;

    auto registry = RecognizerRegistry::create({person_model(), nickname},
                                               ModelDelegates{{"person_names", person_names()}});
    REQUIRE(registry.is_ok());
    const AnonymizerEngine engine(registry.value());

    auto result = engine.scrub("Alice met Bob", "C2", "en");
    REQUIRE(result.is_ok());

    const auto& record = result.value();
    CHECK(record.anonymized_text == "<NICKNAME> met <PERSON>");
    REQUIRE(record.entities.size() == 2);
    CHECK(record.entities[1].entity_type == "PERSON");
    CHECK(record.entities[1].original_text == "Bob");
    CHECK(record.entities[1].replacement_token == "<PERSON>");
}

TEST_CASE("Engine handles large input without crashing", "[engine][large]") {
    const AnonymizerEngine engine(banking_registry());

    SECTION("Long text with ordinary word breaks is scrubbed across segments") {
        std::string text;
        for (int i = 0; i < 20000; ++i) text += "plain words ";
        text += "write to alice@bank.be";

        auto result = engine.scrub(text, "C2", "en");
        REQUIRE(result.is_ok());
        CHECK(result.value().complete());
        REQUIRE(result.value().entities.size() == 1);
        CHECK(result.value().entities[0].original_text == "alice@bank.be");
    }

    SECTION("A 100 KB unbroken token is a detection failure") {
        const std::string text = std::string(100 * 1024, 'a') + " mail me";

        auto failed = engine.scrub(text, RiskTier::C2, "en", DetectionFailurePolicy::FAIL);
        REQUIRE(failed.is_error());
        CHECK(failed.error_category() == ErrorCategory::DETECTION_ERROR);
        CHECK(failed.error_message().find("email") != std::string::npos);

        auto partial = engine.scrub(text, RiskTier::C2, "en", DetectionFailurePolicy::PARTIAL);
        REQUIRE(partial.is_ok());
        CHECK(partial.value().failed_recognizers == std::vector<std::string>{"email"});
    }
}

// ============================================================================
// Reversal laws
// ============================================================================

TEST_CASE("Engine round trip restores the original exactly", "[engine][reversal]") {
    const AnonymizerEngine engine(banking_registry());
    const std::string text = "Bob, write to Alice at alice@bank.be; IBAN BE68 5390 0754 7034. Muslim.";

    for (const RiskTier tier : kAllRiskTiers) {
        auto result = engine.scrub(text, tier);
        REQUIRE(result.is_ok());

        auto restored = AnonymizerEngine::descrub(result.value(), DescrubRequest::full(text));
        REQUIRE(restored.is_ok());
        CHECK(restored.value() == text);

        // Restoring every token one by one reaches the same text
        std::vector<std::string> tokens;
        for (const auto& entity : result.value().entities) {
            tokens.push_back(entity.replacement_token);
        }
        if (!tokens.empty()) {
            auto spliced = AnonymizerEngine::descrub(result.value(), DescrubRequest::selective(tokens));
            REQUIRE(spliced.is_ok());
            CHECK(spliced.value() == text);
        }
    }
}

TEST_CASE("Engine selective round trip leaves other placeholders alone", "[engine][reversal]") {
    const AnonymizerEngine engine(banking_registry());
    const std::string text = "Alice emailed Bob at bob@mail.com";

    auto result = engine.scrub(text, "C2", "en");
    REQUIRE(result.is_ok());
    REQUIRE(result.value().anonymized_text == "<PERSON_1> emailed <PERSON_2> at <EMAIL_ADDRESS>");

    auto restored = AnonymizerEngine::descrub(result.value(), DescrubRequest::selective({"<PERSON_2>"}));
    REQUIRE(restored.is_ok());
    CHECK(restored.value() == "<PERSON_1> emailed Bob at <EMAIL_ADDRESS>");
}

TEST_CASE("Engine is deterministic", "[engine]") {
    const AnonymizerEngine engine(banking_registry());
    const std::string text = "Alice and Bob share BE68 5390 0754 7034 and alice@bank.be";

    auto first = engine.scrub(text, "C4", "en");
    auto second = engine.scrub(text, "C4", "en");
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value() == second.value());
}

// ============================================================================
// Detection failures
// ============================================================================

TEST_CASE("Engine detection failure policy", "[engine][failure]") {
    auto failing = std::make_shared<MockEntityDetector>(std::vector<DetectedSpan>{}, "person_names");
    failing->set_mode(MockEntityDetector::Mode::THROW);

    auto registry = RecognizerRegistry::create(
        {
            person_model(),
            pattern("email", "EMAIL_ADDRESS", R"([a-z]+@[a-z]+\.com)", RiskTier::C2),
        },
        ModelDelegates{{"person_names", failing}});
    REQUIRE(registry.is_ok());

    const std::string text = "Alice: a@b.com";

    SECTION("FAIL turns a failed recognizer into a detection error") {
        const AnonymizerEngine engine(registry.value());
        auto result = engine.scrub(text, "C2", "en");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::DETECTION_ERROR);
        CHECK(result.error_message().find("person") != std::string::npos);
    }

    SECTION("PARTIAL proceeds and names the failed recognizer") {
        AnonymizerEngine::Options options;
        options.on_failure = DetectionFailurePolicy::PARTIAL;
        const AnonymizerEngine engine(registry.value(), options);

        auto result = engine.scrub(text, "C2", "en");
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().complete());
        CHECK(result.value().failed_recognizers == std::vector<std::string>{"person"});
        CHECK(result.value().anonymized_text == "Alice: <EMAIL_ADDRESS>");
    }

    SECTION("Per-call override wins over the engine default") {
        const AnonymizerEngine engine(registry.value());
        auto result = engine.scrub(text, RiskTier::C2, "en", DetectionFailurePolicy::PARTIAL);
        REQUIRE(result.is_ok());
        CHECK(result.value().failed_recognizers.size() == 1);
    }

    SECTION("Types not requested never run") {
        const AnonymizerEngine engine(registry.value());
        auto result = engine.scrub(text, "C1", "en");
        REQUIRE(result.is_ok());
        CHECK(result.value().complete());
    }
}

TEST_CASE("Engine with no matches is a success, not a failure", "[engine][failure]") {
    const AnonymizerEngine engine(banking_registry());
    auto result = engine.scrub("nothing sensitive here", "C4", "en");
    REQUIRE(result.is_ok());
    CHECK(result.value().entities.empty());
    CHECK(result.value().complete());
}

// ============================================================================
// External detector
// ============================================================================

TEST_CASE("Engine with an external detector", "[engine]") {
    const auto registry = banking_registry();
    const std::string text = "Alice met Bob";

    SECTION("Spans of types outside the tier are ignored") {
        auto detector = std::make_shared<MockEntityDetector>(std::vector<DetectedSpan>{
            MockEntityDetector::span("PERSON", 0, 5),
            MockEntityDetector::span("HEALTH", 10, 13),
        });
        const AnonymizerEngine engine(registry, detector, {});

        // The mock filters by requested types itself; C2 does not request HEALTH
        auto result = engine.scrub(text, "C2", "en");
        REQUIRE(result.is_ok());
        CHECK(result.value().anonymized_text == "<PERSON> met Bob");
        CHECK(detector->call_count() == 1);
    }

    SECTION("Out-of-range spans are a detection error") {
        auto detector = std::make_shared<MockEntityDetector>(std::vector<DetectedSpan>{
            MockEntityDetector::span("PERSON", 10, 50),
        });
        const AnonymizerEngine engine(registry, detector, {});
        auto result = engine.scrub(text, "C2", "en");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::DETECTION_ERROR);
    }

    SECTION("Null collaborators are rejected") {
        CHECK_THROWS_AS(AnonymizerEngine(nullptr), std::invalid_argument);
        CHECK_THROWS_AS(AnonymizerEngine(registry, nullptr, {}), std::invalid_argument);
    }
}
