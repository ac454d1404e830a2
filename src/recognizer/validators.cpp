#include "recognizer/validators.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cstdint>
#include <string>

namespace textscrub::validators {

namespace {

std::string digits_only(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    return digits;
}

// Separators allowed inside a formatted number; anything else disqualifies
bool only_digits_and_separators(std::string_view value) {
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c)) &&
            c != ' ' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

uint64_t mod97(std::string_view digits) {
    uint64_t remainder = 0;
    for (char c : digits) {
        remainder = (remainder * 10 + static_cast<uint64_t>(c - '0')) % 97;
    }
    return remainder;
}

} // anonymous namespace

bool luhn_valid(std::string_view value) {
    if (!only_digits_and_separators(value)) {
        return false;
    }
    const std::string digits = digits_only(value);

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool iban_valid(std::string_view value) {
    std::string compact;
    compact.reserve(value.size());
    for (char c : value) {
        if (c == ' ') continue;
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
        compact += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (compact.size() < 15 || compact.size() > 34) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(compact[0])) ||
        !std::isalpha(static_cast<unsigned char>(compact[1])) ||
        !std::isdigit(static_cast<unsigned char>(compact[2])) ||
        !std::isdigit(static_cast<unsigned char>(compact[3]))) {
        return false;
    }

    // Country code and check digits move to the end; letters expand to 10..35
    const std::string rearranged = compact.substr(4) + compact.substr(0, 4);
    std::string numeric;
    numeric.reserve(rearranged.size() * 2);
    for (char c : rearranged) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            numeric += c;
        } else {
            numeric += std::to_string(c - 'A' + 10);
        }
    }

    return mod97(numeric) == 1;
}

bool be_national_register_valid(std::string_view value) {
    if (!only_digits_and_separators(value)) {
        return false;
    }
    const std::string digits = digits_only(value);
    if (digits.size() != 11) {
        return false;
    }

    const std::string base = digits.substr(0, 9);
    const auto check = static_cast<uint64_t>(std::stoi(digits.substr(9, 2)));

    if (97 - mod97(base) == check) {
        return true;
    }
    return 97 - mod97("2" + base) == check;
}

bool validate(ValidatorKind kind, std::string_view value) {
    switch (kind) {
        case ValidatorKind::NONE:                 return true;
        case ValidatorKind::LUHN:                 return luhn_valid(value);
        case ValidatorKind::IBAN:                 return iban_valid(value);
        case ValidatorKind::BE_NATIONAL_REGISTER: return be_national_register_valid(value);
    }
    return false;
}

std::optional<ValidatorKind> parse_validator(std::string_view name) {
    const std::string lower = utils::to_lower(name);

    if (lower.empty() || lower == "none") return ValidatorKind::NONE;
    if (lower == "luhn")                  return ValidatorKind::LUHN;
    if (lower == "iban")                  return ValidatorKind::IBAN;
    if (lower == "be_national_register")  return ValidatorKind::BE_NATIONAL_REGISTER;
    return std::nullopt;
}

std::string_view validator_name(ValidatorKind kind) {
    switch (kind) {
        case ValidatorKind::NONE:                 return "none";
        case ValidatorKind::LUHN:                 return "luhn";
        case ValidatorKind::IBAN:                 return "iban";
        case ValidatorKind::BE_NATIONAL_REGISTER: return "be_national_register";
    }
    return "none";
}

} // namespace textscrub::validators
