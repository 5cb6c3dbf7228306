#include "typemaster/difficulty.hpp"

#include <cctype>

#include "typemaster/errors.hpp"

namespace typemaster {
namespace {

std::string to_lower_trimmed(const std::string_view value) {
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        ++start;
    }

    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }

    std::string result;
    result.reserve(end - start);
    for (std::size_t index = start; index < end; ++index) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(value[index]))));
    }
    return result;
}

} // namespace

Difficulty parse_difficulty(const std::string_view value) {
    const std::string normalized = to_lower_trimmed(value);
    if (normalized == "easy") {
        return Difficulty::Easy;
    }
    if (normalized == "medium") {
        return Difficulty::Medium;
    }
    if (normalized == "hard") {
        return Difficulty::Hard;
    }
    throw InvalidDifficulty("Unknown difficulty '" + std::string(value) + "'.");
}

std::string difficulty_to_string(const Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:
            return "Easy";
        case Difficulty::Medium:
            return "Medium";
        case Difficulty::Hard:
            return "Hard";
    }
    return "Easy";
}

} // namespace typemaster
