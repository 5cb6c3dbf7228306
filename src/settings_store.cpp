#include "typemaster/settings_store.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <string>
#include <utility>

#include "typemaster/difficulty.hpp"
#include "typemaster/errors.hpp"
#include "typemaster/theme.hpp"

namespace typemaster {
namespace {

std::string trim(std::string value) {
    const auto begin = std::find_if(value.begin(), value.end(), [](const unsigned char ch) {
        return std::isspace(ch) == 0;
    });
    const auto end = std::find_if(value.rbegin(), value.rend(), [](const unsigned char ch) {
        return std::isspace(ch) == 0;
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

} // namespace

SettingsStore::SettingsStore(std::filesystem::path settings_file) : settings_file_(std::move(settings_file)) {
    std::error_code error;
    if (settings_file_.has_parent_path()) {
        std::filesystem::create_directories(settings_file_.parent_path(), error);
    }
}

AppSettings SettingsStore::load() const {
    AppSettings settings{};
    std::ifstream in(settings_file_);
    if (!in) {
        return settings;
    }

    std::string line;
    while (std::getline(in, line)) {
        const std::size_t delimiter = line.find('=');
        if (delimiter == std::string::npos) {
            continue;
        }

        const std::string key = trim(line.substr(0, delimiter));
        const std::string value = trim(line.substr(delimiter + 1));

        if (key == "theme") {
            settings.theme = parse_theme(value);
        } else if (key == "difficulty") {
            try {
                settings.difficulty = parse_difficulty(value);
            } catch (const InvalidDifficulty&) {
            }
        } else if (key == "sentence_file") {
            settings.sentence_file = value;
        } else if (key == "tick_interval_ms") {
            try {
                const int parsed = std::stoi(value);
                settings.tick_interval_ms = std::clamp(parsed, kMinTickIntervalMs, kMaxTickIntervalMs);
            } catch (const std::exception&) {
            }
        }
    }
    return settings;
}

bool SettingsStore::save(const AppSettings& settings) const {
    std::error_code error;
    if (settings_file_.has_parent_path()) {
        std::filesystem::create_directories(settings_file_.parent_path(), error);
    }

    std::ofstream out(settings_file_, std::ios::trunc);
    if (!out) {
        return false;
    }

    out << "theme=" << theme_to_string(settings.theme) << '\n';
    out << "difficulty=" << difficulty_to_string(settings.difficulty) << '\n';
    out << "sentence_file=" << settings.sentence_file << '\n';
    out << "tick_interval_ms="
        << std::clamp(settings.tick_interval_ms, kMinTickIntervalMs, kMaxTickIntervalMs) << '\n';
    return static_cast<bool>(out);
}

const std::filesystem::path& SettingsStore::path() const {
    return settings_file_;
}

} // namespace typemaster
