#include "typemaster/theme.hpp"

#include <cctype>

namespace typemaster {

ThemePalette palette_for(const Theme theme) {
    if (theme == Theme::Dark) {
        return ThemePalette{
            "#333333",
            "#555555",
            "#FFFFFF",
            "#DDDDDD",
            "#000000",
            "#34EB55",
            "#FF4500",
            "#AAAAAA",
        };
    }

    return ThemePalette{
        "#F0F0F0",
        "#FFFFFF",
        "#000000",
        "#222222",
        "#FFFFFF",
        "#1E8449",
        "#C0392B",
        "#888888",
    };
}

Theme parse_theme(const std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (const char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    return normalized == "dark" ? Theme::Dark : Theme::Light;
}

std::string theme_to_string(const Theme theme) {
    return theme == Theme::Dark ? "dark" : "light";
}

} // namespace typemaster
