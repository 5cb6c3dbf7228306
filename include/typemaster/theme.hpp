#pragma once

#include <string>
#include <string_view>

#include "typemaster/types.hpp"

namespace typemaster {

struct ThemePalette {
    std::string window_background{};
    std::string text_background{};
    std::string foreground{};
    std::string inverted_background{};
    std::string inverted_foreground{};
    std::string correct{};
    std::string incorrect{};
    std::string extra{};
};

[[nodiscard]] ThemePalette palette_for(Theme theme);

[[nodiscard]] Theme parse_theme(std::string_view value);
[[nodiscard]] std::string theme_to_string(Theme theme);

} // namespace typemaster
