#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace textscrub::validators {

/**
 * @brief Luhn checksum for card numbers
 * @param value Candidate text; separators are ignored, 13-19 digits required
 */
[[nodiscard]] bool luhn_valid(std::string_view value);

/**
 * @brief ISO 13616 IBAN mod-97 check (spaces ignored, 15-34 characters)
 */
[[nodiscard]] bool iban_valid(std::string_view value);

/**
 * @brief Belgian national register number check (11 digits, separators ignored)
 *
 * The last two digits are 97 - (first nine digits mod 97); people born from
 * 2000 on have a '2' prefixed to the nine digits before the modulo.
 */
[[nodiscard]] bool be_national_register_valid(std::string_view value);

/**
 * @brief Dispatch on validator kind. NONE always accepts.
 */
[[nodiscard]] bool validate(ValidatorKind kind, std::string_view value);

[[nodiscard]] std::optional<ValidatorKind> parse_validator(std::string_view name);

[[nodiscard]] std::string_view validator_name(ValidatorKind kind);

} // namespace textscrub::validators
