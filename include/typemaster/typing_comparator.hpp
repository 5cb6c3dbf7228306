#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "typemaster/types.hpp"

namespace typemaster {

constexpr double kCharactersPerWord = 5.0;

// Decodes UTF-8 into code points. A malformed byte decodes as itself.
[[nodiscard]] std::u32string decode_utf8(std::string_view text);
[[nodiscard]] std::size_t character_count(std::string_view text);

// Inputs are UTF-8; one mark per typed code point. complete is true iff typed == target.
[[nodiscard]] Classification classify(std::string_view typed, std::string_view target);

[[nodiscard]] std::size_t count_errors(const Classification& classification);
[[nodiscard]] std::size_t count_correct(const Classification& classification);

// (typed_chars / 5) / minutes. Zero when nothing was typed or no time has passed.
[[nodiscard]] double net_wpm(std::size_t typed_chars, Seconds elapsed);

} // namespace typemaster
