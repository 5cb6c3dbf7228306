#pragma once

#include <stdexcept>
#include <string>

namespace typemaster {

// Sentence resource missing, unreadable, malformed, or empty for a tier.
class LoadError final : public std::runtime_error {
public:
    explicit LoadError(const std::string& message) : std::runtime_error(message) {}
};

// Difficulty name outside Easy / Medium / Hard.
class InvalidDifficulty final : public std::runtime_error {
public:
    explicit InvalidDifficulty(const std::string& message) : std::runtime_error(message) {}
};

} // namespace typemaster
