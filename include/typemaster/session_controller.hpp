#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "typemaster/sentence_bank.hpp"
#include "typemaster/types.hpp"

namespace typemaster {

class RepeatingTimer {
public:
    virtual ~RepeatingTimer() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    [[nodiscard]] virtual bool is_active() const = 0;
};

using Clock = std::function<SteadyClock::time_point()>;

[[nodiscard]] Clock default_clock();

// Owns the current Session and drives Ready -> Running -> Finished -> Ready.
// The timer runs exactly while the session is Running.
class SessionController final {
public:
    SessionController(SentenceBank bank, RepeatingTimer& timer, Clock clock = default_clock());
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Throws LoadError if the bank has no sentences for the tier.
    void select_difficulty(Difficulty difficulty);
    [[nodiscard]] Difficulty difficulty() const;

    // Draws a new sentence and installs a Ready session, abandoning any current one.
    void start();

    // Full current input text. Returns the Result if this keystroke finished the session.
    std::optional<Result> type(std::string_view text);

    // Periodic time check. Returns the Result if the time limit was reached.
    std::optional<Result> tick();

    // Abandons the current attempt without a Result; keeps the target sentence.
    void reset();

    // Finished -> Ready with a freshly drawn sentence.
    void acknowledge_results();

    [[nodiscard]] const std::optional<Session>& session() const;
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] bool is_finished() const;

    [[nodiscard]] Seconds elapsed() const;
    [[nodiscard]] Seconds remaining() const;
    [[nodiscard]] double live_wpm() const;
    [[nodiscard]] Classification classification() const;
    [[nodiscard]] const std::optional<Result>& last_result() const;
    [[nodiscard]] const SentenceBank& bank() const;

private:
    SentenceBank bank_;
    RepeatingTimer& timer_;
    Clock clock_;
    Difficulty difficulty_{Difficulty::Easy};
    std::optional<Session> session_{};
    std::optional<Result> last_result_{};

    [[nodiscard]] Session draw_session() const;
    [[nodiscard]] Seconds running_elapsed() const;
    Result finish(FinishReason reason, Seconds elapsed);
};

} // namespace typemaster
