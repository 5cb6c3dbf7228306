#pragma once

#include <filesystem>

#include "typemaster/types.hpp"

namespace typemaster {

constexpr int kMinTickIntervalMs = 100;
constexpr int kMaxTickIntervalMs = 1000;

class SettingsStore final {
public:
    explicit SettingsStore(std::filesystem::path settings_file);

    [[nodiscard]] AppSettings load() const;
    // Returns false when the file could not be written.
    bool save(const AppSettings& settings) const;

    [[nodiscard]] const std::filesystem::path& path() const;

private:
    std::filesystem::path settings_file_;
};

} // namespace typemaster
