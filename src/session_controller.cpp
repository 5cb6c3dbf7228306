#include "typemaster/session_controller.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "typemaster/errors.hpp"
#include "typemaster/difficulty.hpp"
#include "typemaster/results_reporter.hpp"
#include "typemaster/typing_comparator.hpp"

namespace typemaster {

Clock default_clock() {
    return [] { return SteadyClock::now(); };
}

SessionController::SessionController(SentenceBank bank, RepeatingTimer& timer, Clock clock)
    : bank_(std::move(bank)),
      timer_(timer),
      clock_(clock ? std::move(clock) : default_clock()) {}

SessionController::~SessionController() {
    timer_.stop();
}

void SessionController::select_difficulty(const Difficulty difficulty) {
    if (!bank_.has_tier(difficulty)) {
        throw LoadError("No sentences for " + difficulty_to_string(difficulty) + " difficulty.");
    }

    difficulty_ = difficulty;
    if (session_.has_value() && session_->state == SessionState::Ready) {
        session_ = draw_session();
    }
}

Difficulty SessionController::difficulty() const {
    return difficulty_;
}

void SessionController::start() {
    Session next = draw_session();
    timer_.stop();
    session_ = std::move(next);
    last_result_.reset();
}

std::optional<Result> SessionController::type(const std::string_view text) {
    if (!session_.has_value() || session_->state == SessionState::Finished) {
        return std::nullopt;
    }

    if (session_->state == SessionState::Ready) {
        if (text.empty()) {
            return std::nullopt;
        }
        session_->state = SessionState::Running;
        session_->started_at = clock_();
        timer_.start();
    } else {
        const Seconds elapsed = running_elapsed();
        if (elapsed >= kSessionTimeLimit) {
            return finish(FinishReason::TimedOut, elapsed);
        }
    }

    session_->typed.assign(text.begin(), text.end());
    if (classify(session_->typed, session_->target.text).complete) {
        return finish(FinishReason::Completed, running_elapsed());
    }
    return std::nullopt;
}

std::optional<Result> SessionController::tick() {
    if (!is_running()) {
        return std::nullopt;
    }

    const Seconds elapsed = running_elapsed();
    if (elapsed >= kSessionTimeLimit) {
        return finish(FinishReason::TimedOut, elapsed);
    }
    return std::nullopt;
}

void SessionController::reset() {
    if (!session_.has_value() || session_->state == SessionState::Finished) {
        return;
    }

    timer_.stop();
    Session abandoned = std::move(*session_);
    session_ = Session{};
    session_->target = std::move(abandoned.target);
}

void SessionController::acknowledge_results() {
    if (!is_finished()) {
        return;
    }

    session_ = draw_session();
    last_result_.reset();
}

const std::optional<Session>& SessionController::session() const {
    return session_;
}

bool SessionController::is_running() const {
    return session_.has_value() && session_->state == SessionState::Running;
}

bool SessionController::is_finished() const {
    return session_.has_value() && session_->state == SessionState::Finished;
}

Seconds SessionController::elapsed() const {
    if (!session_.has_value()) {
        return Seconds{0.0};
    }

    switch (session_->state) {
        case SessionState::Ready:
            return Seconds{0.0};
        case SessionState::Running:
            return running_elapsed();
        case SessionState::Finished:
            return session_->finished_elapsed;
    }
    return Seconds{0.0};
}

Seconds SessionController::remaining() const {
    return std::max(kSessionTimeLimit - elapsed(), Seconds{0.0});
}

double SessionController::live_wpm() const {
    if (!session_.has_value()) {
        return 0.0;
    }
    return net_wpm(character_count(session_->typed), elapsed());
}

Classification SessionController::classification() const {
    if (!session_.has_value()) {
        return {};
    }
    return classify(session_->typed, session_->target.text);
}

const std::optional<Result>& SessionController::last_result() const {
    return last_result_;
}

const SentenceBank& SessionController::bank() const {
    return bank_;
}

Session SessionController::draw_session() const {
    Session session;
    session.target = bank_.pick(difficulty_);
    return session;
}

Seconds SessionController::running_elapsed() const {
    if (!session_.has_value() || !session_->started_at.has_value()) {
        return Seconds{0.0};
    }
    const Seconds elapsed = std::chrono::duration_cast<Seconds>(clock_() - *session_->started_at);
    return std::max(elapsed, Seconds{0.0});
}

Result SessionController::finish(const FinishReason reason, const Seconds elapsed) {
    timer_.stop();
    session_->state = SessionState::Finished;
    session_->finish_reason = reason;
    session_->finished_elapsed = std::min(elapsed, kSessionTimeLimit);

    Result result = summarize(*session_);
    last_result_ = result;
    return result;
}

} // namespace typemaster
