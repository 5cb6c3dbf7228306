#include "typemaster/results_reporter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "typemaster/typing_comparator.hpp"

namespace typemaster {

Result summarize(const Session& session) {
    const Classification classification = classify(session.typed, session.target.text);

    Result result;
    result.duration = session.finished_elapsed;
    result.typed_characters = classification.marks.size();
    result.net_wpm = net_wpm(result.typed_characters, session.finished_elapsed);
    result.character_errors = count_errors(classification);
    result.correct_characters = count_correct(classification);
    result.accuracy_percent = result.typed_characters == 0
                                  ? 0.0
                                  : (static_cast<double>(result.correct_characters) /
                                     static_cast<double>(result.typed_characters)) * 100.0;
    result.reason = session.finish_reason;
    return result;
}

std::string result_title(const Result& result) {
    return result.reason == FinishReason::TimedOut ? "Time's Up!" : "Test Complete!";
}

std::string format_duration(const Seconds duration) {
    const long total_seconds = std::lround(std::max(duration.count(), 0.0));
    std::ostringstream out;
    out << total_seconds / 60 << ':' << std::setw(2) << std::setfill('0') << total_seconds % 60;
    return out.str();
}

std::string format_result(const Result& result) {
    std::ostringstream out;
    if (result.reason == FinishReason::Completed) {
        out << "Congratulations!\n\n";
    } else {
        out << "The time limit was reached.\n\n";
    }
    out << "Final WPM: " << std::lround(result.net_wpm) << '\n';
    out << "Character Errors: " << result.character_errors << '\n';
    out << "Accuracy: " << std::fixed << std::setprecision(1) << result.accuracy_percent << "%\n";
    out << "Time: " << format_duration(result.duration);
    return out.str();
}

} // namespace typemaster
