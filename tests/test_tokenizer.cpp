#include <catch2/catch_test_macros.hpp>
#include "anonymizer/tokenizer.hpp"

using namespace textscrub;

static ResolvedSpan resolved(std::string_view text, std::string type, size_t start, size_t end,
                             std::string token, double score = 0.8) {
    ResolvedSpan r;
    r.span.entity_type = std::move(type);
    r.span.start = start;
    r.span.end = end;
    r.span.original_text = std::string(text.substr(start, end - start));
    r.span.score = score;
    r.token = std::move(token);
    return r;
}

TEST_CASE("Tokenizer replaces spans and records entities", "[tokenizer]") {
    const std::string text = "Alice wrote to a@b.com today";
    const auto result = Tokenizer::apply(text, {
        resolved(text, "PERSON", 0, 5, "<PERSON>", 0.85),
        resolved(text, "EMAIL_ADDRESS", 15, 22, "<EMAIL_ADDRESS>", 0.9),
    });

    CHECK(result.anonymized_text == "<PERSON> wrote to <EMAIL_ADDRESS> today");
    CHECK(result.complete());
    REQUIRE(result.entities.size() == 2);

    const auto& person = result.entities[0];
    CHECK(person.entity_type == "PERSON");
    CHECK(person.start == 0);
    CHECK(person.end == 8);
    CHECK(person.original_text == "Alice");
    CHECK(person.replacement_token == "<PERSON>");
    CHECK(person.score == 0.85);
    CHECK(person.explanation == "Person detected");

    SECTION("Later entities shift by the cumulative length delta") {
        // "Alice" (5) -> "<PERSON>" (8): +3
        const auto& email = result.entities[1];
        CHECK(email.start == 15 + 3);
        CHECK(email.end == email.start + email.replacement_token.size());
        CHECK(result.anonymized_text.substr(email.start, email.end - email.start) == "<EMAIL_ADDRESS>");
    }
}

TEST_CASE("Tokenizer delta also shrinks", "[tokenizer]") {
    const std::string text = "card 4111 1111 1111 1111 and pin ****12";
    const auto result = Tokenizer::apply(text, {
        resolved(text, "CREDIT_CARD", 5, 24, "<CC>"),
        resolved(text, "PIN_MASKED", 33, 39, "<PIN_MASKED>"),
    });

    CHECK(result.anonymized_text == "card <CC> and pin <PIN_MASKED>");
    REQUIRE(result.entities.size() == 2);
    // 19 chars -> 4 chars: -15
    CHECK(result.entities[1].start == 33 - 15);
}

TEST_CASE("Tokenizer with no spans returns the text unchanged", "[tokenizer]") {
    const auto result = Tokenizer::apply("nothing to see", {});
    CHECK(result.anonymized_text == "nothing to see");
    CHECK(result.entities.empty());
}

TEST_CASE("Tokenizer applies spans in start order whatever the input order", "[tokenizer]") {
    const std::string text = "ab cd ef";
    const auto result = Tokenizer::apply(text, {
        resolved(text, "X", 6, 8, "<X_2>"),
        resolved(text, "X", 0, 2, "<X_1>"),
    });
    CHECK(result.anonymized_text == "<X_1> cd <X_2>");
    REQUIRE(result.entities.size() == 2);
    CHECK(result.entities[0].replacement_token == "<X_1>");
    CHECK(result.entities[1].start == 9);
}

TEST_CASE("Tokenizer skips a span that starts inside an applied one", "[tokenizer]") {
    const std::string text = "abcdefghij";
    const auto result = Tokenizer::apply(text, {
        resolved(text, "A", 0, 10, "<A>"),
        resolved(text, "B", 2, 5, "<B>"),
    });
    CHECK(result.anonymized_text == "<A>");
    REQUIRE(result.entities.size() == 1);
    CHECK(result.entities[0].original_text == text);
}

TEST_CASE("Tokenizer explanation text", "[tokenizer]") {
    CHECK(Tokenizer::explanation_for("EMAIL_ADDRESS") == "Email address detected");
    CHECK(Tokenizer::explanation_for("PERSON") == "Person detected");
    CHECK(Tokenizer::explanation_for("IBAN_BE") == "Iban be detected");
}
