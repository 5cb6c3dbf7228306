#include "typemaster/sentence_bank.hpp"

#include <cctype>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <utility>

#include "typemaster/difficulty.hpp"
#include "typemaster/errors.hpp"

namespace typemaster {
namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string trim(const std::string_view value) {
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        ++start;
    }

    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }

    return std::string(value.substr(start, end - start));
}

bool is_tier_header(const std::string& line) {
    return line.size() >= 2 && line.front() == '[' && line.back() == ']';
}

std::size_t tier_index(const Difficulty difficulty) {
    return static_cast<std::size_t>(difficulty);
}

} // namespace

RandomIndex make_default_random_index() {
    auto engine = std::make_shared<std::mt19937>(std::random_device{}());
    return [engine](const std::size_t count) {
        std::uniform_int_distribution<std::size_t> distribution(0, count - 1);
        return distribution(*engine);
    };
}

SentenceBank::SentenceBank(RandomIndex random_index) : random_index_(std::move(random_index)) {}

SentenceBank SentenceBank::parse(const std::string_view text, RandomIndex random_index) {
    SentenceBank bank(std::move(random_index));

    std::string_view body = text;
    if (body.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        body.remove_prefix(kUtf8Bom.size());
    }

    std::istringstream lines{std::string(body)};
    std::string raw_line;
    std::size_t line_number = 0;
    bool has_tier = false;
    Difficulty current = Difficulty::Easy;

    while (std::getline(lines, raw_line)) {
        ++line_number;
        const std::string line = trim(raw_line);
        if (line.empty()) {
            continue;
        }

        if (is_tier_header(line)) {
            try {
                current = parse_difficulty(std::string_view(line).substr(1, line.size() - 2));
            } catch (const InvalidDifficulty&) {
                throw LoadError(
                    "Unknown difficulty tag " + line + " on line " + std::to_string(line_number) + "."
                );
            }
            has_tier = true;
            continue;
        }

        if (!has_tier) {
            throw LoadError(
                "Sentence on line " + std::to_string(line_number) + " appears before any difficulty tag."
            );
        }

        bank.add(current, line);
    }

    if (bank.total() == 0) {
        throw LoadError("Sentence resource contains no sentences.");
    }

    return bank;
}

SentenceBank SentenceBank::load_file(const std::filesystem::path& path, RandomIndex random_index) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LoadError("Unable to open sentence file " + path.string() + ".");
    }

    std::string content(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );
    return parse(content, std::move(random_index));
}

Sentence SentenceBank::pick(const Difficulty difficulty) const {
    const std::vector<std::string>& sentences = tier(difficulty);
    if (sentences.empty()) {
        throw LoadError("No sentences for " + difficulty_to_string(difficulty) + " difficulty.");
    }

    std::size_t index = random_index_ ? random_index_(sentences.size()) : 0;
    if (index >= sentences.size()) {
        index %= sentences.size();
    }
    return Sentence{sentences[index], difficulty};
}

std::size_t SentenceBank::count(const Difficulty difficulty) const {
    return tier(difficulty).size();
}

bool SentenceBank::has_tier(const Difficulty difficulty) const {
    return !tier(difficulty).empty();
}

std::size_t SentenceBank::total() const {
    std::size_t sum = 0;
    for (const std::vector<std::string>& sentences : tiers_) {
        sum += sentences.size();
    }
    return sum;
}

void SentenceBank::add(const Difficulty difficulty, std::string sentence) {
    tiers_[tier_index(difficulty)].push_back(std::move(sentence));
}

const std::vector<std::string>& SentenceBank::tier(const Difficulty difficulty) const {
    return tiers_[tier_index(difficulty)];
}

} // namespace typemaster
