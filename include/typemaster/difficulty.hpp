#pragma once

#include <array>
#include <string>
#include <string_view>

#include "typemaster/types.hpp"

namespace typemaster {

constexpr std::array<Difficulty, 3> kAllDifficulties{Difficulty::Easy, Difficulty::Medium, Difficulty::Hard};

// Accepts "Easy", "EASY", "easy" and so on; throws InvalidDifficulty otherwise.
[[nodiscard]] Difficulty parse_difficulty(std::string_view value);
[[nodiscard]] std::string difficulty_to_string(Difficulty difficulty);

} // namespace typemaster
