#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace typemaster {

using SteadyClock = std::chrono::steady_clock;
using Seconds = std::chrono::duration<double>;

constexpr Seconds kSessionTimeLimit{300.0};

enum class Difficulty {
    Easy = 0,
    Medium = 1,
    Hard = 2,
};

enum class Theme {
    Light = 0,
    Dark = 1,
};

enum class CharClass {
    Correct,
    Incorrect,
    Extra,
};

enum class SessionState {
    Ready,
    Running,
    Finished,
};

enum class FinishReason {
    Completed,
    TimedOut,
};

struct Sentence {
    std::string text{};
    Difficulty difficulty{Difficulty::Easy};
};

struct Classification {
    std::vector<CharClass> marks{};
    bool complete{false};
};

struct Session {
    Sentence target{};
    SessionState state{SessionState::Ready};
    std::optional<SteadyClock::time_point> started_at{};
    std::string typed{};
    Seconds finished_elapsed{0.0};
    FinishReason finish_reason{FinishReason::Completed};
};

struct Result {
    Seconds duration{0.0};
    double net_wpm{0.0};
    std::size_t character_errors{0};
    std::size_t correct_characters{0};
    std::size_t typed_characters{0};
    double accuracy_percent{0.0};
    FinishReason reason{FinishReason::Completed};
};

struct AppSettings {
    Theme theme{Theme::Light};
    Difficulty difficulty{Difficulty::Easy};
    std::string sentence_file{};
    int tick_interval_ms{1000};
};

} // namespace typemaster
