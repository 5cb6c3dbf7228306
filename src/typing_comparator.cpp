#include "typemaster/typing_comparator.hpp"

#include <algorithm>

namespace typemaster {
namespace {

// Number of bytes in a UTF-8 sequence from its lead byte; 0 for a continuation byte.
std::size_t sequence_length(const unsigned char lead) {
    if ((lead & 0x80) == 0) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 0;
}

bool is_continuation(const unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

} // namespace

std::u32string decode_utf8(const std::string_view text) {
    std::u32string result;
    result.reserve(text.size());

    std::size_t position = 0;
    while (position < text.size()) {
        const auto lead = static_cast<unsigned char>(text[position]);
        const std::size_t length = sequence_length(lead);

        bool valid = length > 0 && position + length <= text.size();
        for (std::size_t offset = 1; valid && offset < length; ++offset) {
            valid = is_continuation(static_cast<unsigned char>(text[position + offset]));
        }
        if (!valid) {
            result.push_back(static_cast<char32_t>(lead));
            ++position;
            continue;
        }

        char32_t code_point = length == 1 ? lead : lead & (0x7F >> length);
        for (std::size_t offset = 1; offset < length; ++offset) {
            code_point = (code_point << 6) | (static_cast<unsigned char>(text[position + offset]) & 0x3F);
        }
        result.push_back(code_point);
        position += length;
    }
    return result;
}

std::size_t character_count(const std::string_view text) {
    return decode_utf8(text).size();
}

Classification classify(const std::string_view typed_text, const std::string_view target_text) {
    const std::u32string typed = decode_utf8(typed_text);
    const std::u32string target = decode_utf8(target_text);

    Classification result;
    result.marks.reserve(typed.size());

    for (std::size_t index = 0; index < typed.size(); ++index) {
        if (index >= target.size()) {
            result.marks.push_back(CharClass::Extra);
        } else if (typed[index] == target[index]) {
            result.marks.push_back(CharClass::Correct);
        } else {
            result.marks.push_back(CharClass::Incorrect);
        }
    }

    result.complete = typed.size() == target.size() &&
                      std::all_of(result.marks.begin(), result.marks.end(), [](const CharClass mark) {
                          return mark == CharClass::Correct;
                      });
    return result;
}

std::size_t count_errors(const Classification& classification) {
    return static_cast<std::size_t>(std::count_if(
        classification.marks.begin(),
        classification.marks.end(),
        [](const CharClass mark) { return mark != CharClass::Correct; }
    ));
}

std::size_t count_correct(const Classification& classification) {
    return static_cast<std::size_t>(
        std::count(classification.marks.begin(), classification.marks.end(), CharClass::Correct)
    );
}

double net_wpm(const std::size_t typed_chars, const Seconds elapsed) {
    if (typed_chars == 0 || elapsed.count() <= 0.0) {
        return 0.0;
    }
    const double words = static_cast<double>(typed_chars) / kCharactersPerWord;
    const double minutes = elapsed.count() / 60.0;
    return words / minutes;
}

} // namespace typemaster
