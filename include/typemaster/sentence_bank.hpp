#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "typemaster/types.hpp"

namespace typemaster {

// Returns an index in [0, count). Called with count > 0 only.
using RandomIndex = std::function<std::size_t(std::size_t count)>;

[[nodiscard]] RandomIndex make_default_random_index();

class SentenceBank final {
public:
    explicit SentenceBank(RandomIndex random_index = make_default_random_index());

    // Resource format: "[Easy]" / "[Medium]" / "[Hard]" headers, one sentence per line.
    [[nodiscard]] static SentenceBank parse(std::string_view text, RandomIndex random_index = make_default_random_index());
    [[nodiscard]] static SentenceBank load_file(
        const std::filesystem::path& path,
        RandomIndex random_index = make_default_random_index()
    );

    [[nodiscard]] Sentence pick(Difficulty difficulty) const;
    [[nodiscard]] std::size_t count(Difficulty difficulty) const;
    [[nodiscard]] bool has_tier(Difficulty difficulty) const;
    [[nodiscard]] std::size_t total() const;

    void add(Difficulty difficulty, std::string sentence);

private:
    std::array<std::vector<std::string>, 3> tiers_{};
    RandomIndex random_index_;

    [[nodiscard]] const std::vector<std::string>& tier(Difficulty difficulty) const;
};

} // namespace typemaster
