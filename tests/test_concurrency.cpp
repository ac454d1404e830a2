#include <catch2/catch_test_macros.hpp>

#include "anonymizer/anonymizer_engine.hpp"
#include "detector/name_heuristic_detector.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace textscrub;

namespace {

std::shared_ptr<const RecognizerRegistry> make_registry() {
    RecognizerSpec person;
    person.name = "person";
    person.entity_type = "PERSON";
    person.kind = RecognizerKind::MODEL;
    person.model_ref = "person_names";
    person.min_tier = RiskTier::C2;

    RecognizerSpec email;
    email.name = "email";
    email.entity_type = "EMAIL_ADDRESS";
    email.pattern = R"([a-z]+@[a-z]+\.[a-z]{2,})";
    email.min_tier = RiskTier::C2;

    RecognizerSpec card;
    card.name = "credit_card";
    card.entity_type = "CREDIT_CARD";
    card.pattern = R"(\b(?:\d[ \-]?){12,18}\d\b)";
    card.validator = ValidatorKind::LUHN;
    card.min_tier = RiskTier::C3;
    card.context_keywords = {"card"};

    NameHeuristicDetector::Config names;
    names.name = "person_names";
    names.given_names = {"Alice", "Bob", "Marie"};

    auto registry = RecognizerRegistry::create(
        {person, email, card},
        ModelDelegates{{"person_names", std::make_shared<NameHeuristicDetector>(names)}});
    REQUIRE(registry.is_ok());
    return registry.value();
}

} // namespace

TEST_CASE("Concurrent scrubs on a shared engine match the serial result", "[stress][engine]") {
    const AnonymizerEngine engine(make_registry());

    const std::vector<std::string> inputs = {
        "Alice paid with card 4111 1111 1111 1111, receipt to alice@shop.be",
        "Bob and Marie wrote to bob@mail.com and marie@mail.com",
        "Nothing to hide here",
        "Marie Dupont, card 5500 0000 0000 0004",
    };

    std::vector<ScrubResult> expected;
    for (const auto& input : inputs) {
        auto result = engine.scrub(input, RiskTier::C3);
        REQUIRE(result.is_ok());
        expected.push_back(result.value());
    }

    constexpr int num_threads = 8;
    constexpr int iterations = 200;
    std::atomic<uint64_t> mismatches{0};
    std::atomic<uint64_t> errors{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {}
            for (int i = 0; i < iterations; ++i) {
                const size_t idx = static_cast<size_t>(t + i) % inputs.size();
                auto result = engine.scrub(inputs[idx], RiskTier::C3);
                if (result.is_error()) {
                    errors.fetch_add(1, std::memory_order_relaxed);
                } else if (!(result.value() == expected[idx])) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    go.store(true, std::memory_order_release);
    for (auto& t : threads) t.join();

    CHECK(errors.load() == 0);
    CHECK(mismatches.load() == 0);
}

TEST_CASE("Concurrent scrubs at different tiers stay independent", "[stress][engine]") {
    const AnonymizerEngine engine(make_registry());
    const std::string text = "Alice paid with card 4111 1111 1111 1111";

    std::atomic<uint64_t> c2_overscrubbed{0};
    std::atomic<uint64_t> c3_misses{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            const RiskTier tier = (t % 2 == 0) ? RiskTier::C2 : RiskTier::C3;
            for (int i = 0; i < 100; ++i) {
                auto result = engine.scrub(text, tier);
                if (result.is_error()) continue;
                const bool card_hidden =
                    result.value().anonymized_text.find("4111") == std::string::npos;
                if (tier == RiskTier::C2 && card_hidden) c2_overscrubbed.fetch_add(1);
                if (tier == RiskTier::C3 && !card_hidden) c3_misses.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(c2_overscrubbed.load() == 0);
    CHECK(c3_misses.load() == 0);
}
