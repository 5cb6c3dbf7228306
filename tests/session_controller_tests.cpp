#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "typemaster/errors.hpp"
#include "typemaster/session_controller.hpp"

namespace {

using typemaster::Difficulty;
using typemaster::FinishReason;
using typemaster::Result;
using typemaster::Seconds;
using typemaster::SessionController;
using typemaster::SessionState;
using typemaster::SteadyClock;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << '\n';
        std::exit(1);
    }
}

bool near(double actual, double expected) {
    return std::fabs(actual - expected) < 1e-6;
}

class FakeTimer final : public typemaster::RepeatingTimer {
public:
    void start() override {
        active = true;
        ++starts;
    }
    void stop() override {
        active = false;
    }
    [[nodiscard]] bool is_active() const override {
        return active;
    }

    bool active{false};
    int starts{0};
};

struct FakeClock {
    SteadyClock::time_point now{SteadyClock::time_point{} + std::chrono::hours(1)};

    void advance(double seconds) {
        now += std::chrono::duration_cast<SteadyClock::duration>(Seconds{seconds});
    }
};

struct Fixture {
    FakeTimer timer;
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    std::size_t next_index{0};
    std::unique_ptr<SessionController> controller;

    Fixture() {
        typemaster::SentenceBank bank = typemaster::SentenceBank::parse(
            "[Easy]\ncat\ndog\n[Medium]\nbird song\n",
            [this](std::size_t count) { return next_index % count; }
        );
        std::shared_ptr<FakeClock> shared_clock = clock;
        controller = std::make_unique<SessionController>(
            std::move(bank),
            timer,
            [shared_clock]() { return shared_clock->now; }
        );
    }
};

void test_start_creates_ready_session() {
    Fixture fixture;
    expect(!fixture.controller->session().has_value(), "no session before start");
    expect(!fixture.controller->type("c").has_value(), "typing without a session is ignored");
    expect(!fixture.controller->session().has_value(), "typing does not create a session");

    fixture.controller->start();
    const auto& session = fixture.controller->session();
    expect(session.has_value(), "start creates a session");
    expect(session->state == SessionState::Ready, "new session is ready");
    expect(session->target.text == "cat", "first sentence drawn");
    expect(!session->started_at.has_value(), "no start timestamp before typing");
    expect(!fixture.timer.active, "timer idle while ready");
    expect(fixture.controller->elapsed().count() == 0.0, "elapsed is zero while ready");
}

void test_first_keystroke_starts_timer_once() {
    Fixture fixture;
    fixture.controller->start();

    fixture.controller->type("");
    expect(fixture.controller->session()->state == SessionState::Ready, "empty input keeps ready");

    fixture.controller->type("c");
    const auto started_at = fixture.controller->session()->started_at;
    expect(started_at.has_value(), "first character records the start");
    expect(fixture.controller->is_running(), "first character enters running");
    expect(fixture.timer.active && fixture.timer.starts == 1, "timer started on entering running");

    fixture.clock->advance(2.0);
    fixture.controller->type("ca");
    fixture.clock->advance(1.0);
    fixture.controller->type("c");
    fixture.controller->type("");
    expect(fixture.controller->session()->started_at == started_at, "start timestamp never changes");
    expect(fixture.timer.starts == 1, "timer started only once");
    expect(fixture.controller->is_running(), "deleting input keeps running");
}

void test_completion_finishes_session() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->type("c");
    fixture.clock->advance(30.0);

    const std::optional<Result> result = fixture.controller->type("cat");
    expect(result.has_value(), "exact match produces a result");
    expect(result->reason == FinishReason::Completed, "completed reason");
    expect(near(result->duration.count(), 30.0), "duration is elapsed at finish");
    expect(near(result->net_wpm, 1.2), "scenario A wpm");
    expect(result->character_errors == 0, "scenario A errors");
    expect(fixture.controller->is_finished(), "session finished");
    expect(!fixture.timer.active, "timer stopped on finish");

    fixture.clock->advance(10.0);
    expect(near(fixture.controller->elapsed().count(), 30.0), "elapsed frozen after finish");
    expect(!fixture.controller->type("catx").has_value(), "input after finish is ignored");
    expect(fixture.controller->session()->typed == "cat", "typed text unchanged after finish");
    expect(!fixture.controller->tick().has_value(), "tick after finish is ignored");
    expect(fixture.controller->last_result().has_value(), "last result retained");
}

void test_mismatch_and_extras_do_not_finish() {
    Fixture fixture;
    fixture.controller->start();

    expect(!fixture.controller->type("cbt").has_value(), "mismatch does not finish");
    expect(fixture.controller->is_running(), "still running after mismatch");
    expect(fixture.controller->classification().marks.size() == 3, "live classification available");

    expect(!fixture.controller->type("catdog").has_value(), "extras do not finish");
    expect(!fixture.controller->classification().complete, "extras are not complete");
}

void test_timeout_on_tick() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->type("c");
    fixture.clock->advance(10.0);
    fixture.controller->type("ca");

    fixture.clock->advance(200.0);
    expect(!fixture.controller->tick().has_value(), "tick before limit does nothing");
    expect(fixture.controller->is_running(), "still running before the limit");
    expect(near(fixture.controller->remaining().count(), 90.0), "remaining time counts down");

    fixture.clock->advance(90.5);
    const std::optional<Result> result = fixture.controller->tick();
    expect(result.has_value(), "tick at the limit finishes");
    expect(result->reason == FinishReason::TimedOut, "timed out reason");
    expect(near(result->duration.count(), 300.0), "scenario D duration is the limit");
    expect(result->character_errors == 0, "scenario D counts no missing characters");
    expect(!fixture.timer.active, "timer stopped on timeout");
    expect(near(fixture.controller->remaining().count(), 0.0), "no time remaining");
}

void test_keystroke_after_limit_times_out_first() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->type("ca");
    fixture.clock->advance(301.0);

    const std::optional<Result> result = fixture.controller->type("cat");
    expect(result.has_value(), "late keystroke finishes the session");
    expect(result->reason == FinishReason::TimedOut, "timeout wins over completion");
    expect(fixture.controller->session()->typed == "ca", "late keystroke is not accepted");
}

void test_reset_abandons_without_result() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->type("cb");
    fixture.clock->advance(5.0);

    fixture.next_index = 1;
    fixture.controller->reset();
    const auto& session = fixture.controller->session();
    expect(session->state == SessionState::Ready, "reset returns to ready");
    expect(session->typed.empty(), "reset clears typed text");
    expect(!session->started_at.has_value(), "reset clears the start timestamp");
    expect(session->target.text == "cat", "reset does not draw a new sentence");
    expect(!fixture.timer.active, "reset stops the timer");
    expect(!fixture.controller->last_result().has_value(), "reset produces no result");
    expect(fixture.controller->elapsed().count() == 0.0, "elapsed is zero after reset");

    fixture.controller->reset();
    fixture.controller->reset();
    expect(fixture.controller->session()->state == SessionState::Ready, "repeated reset stays ready");
    expect(fixture.controller->session()->target.text == "cat", "repeated reset keeps the sentence");
    expect(fixture.controller->session()->typed.empty(), "repeated reset keeps empty input");

    fixture.controller->start();
    expect(fixture.controller->session()->target.text == "dog", "explicit start draws a fresh sentence");
}

void test_tick_after_reset_is_ignored() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->type("c");
    fixture.clock->advance(100.0);
    fixture.controller->reset();

    fixture.clock->advance(250.0);
    expect(!fixture.controller->tick().has_value(), "late tick after reset does nothing");
    expect(fixture.controller->session()->state == SessionState::Ready, "session stays ready after late tick");
    expect(!fixture.controller->last_result().has_value(), "late tick produces no result");
    expect(!fixture.timer.active, "timer stays stopped after late tick");
}

void test_acknowledge_draws_new_session() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->acknowledge_results();
    expect(fixture.controller->session()->target.text == "cat", "acknowledge outside finished is ignored");

    fixture.controller->type("cat");
    expect(fixture.controller->is_finished(), "instant completion finishes");
    expect(fixture.controller->last_result()->net_wpm == 0.0, "zero elapsed reports zero wpm");

    fixture.next_index = 1;
    fixture.controller->acknowledge_results();
    const auto& session = fixture.controller->session();
    expect(session->state == SessionState::Ready, "acknowledge returns to ready");
    expect(session->target.text == "dog", "acknowledge draws a new sentence");
    expect(session->typed.empty() && !session->started_at.has_value(), "no state carried over");
    expect(!fixture.controller->last_result().has_value(), "previous result cleared with the new session");
}

void test_difficulty_selection() {
    Fixture fixture;
    fixture.controller->select_difficulty(Difficulty::Medium);
    expect(fixture.controller->difficulty() == Difficulty::Medium, "difficulty recorded");

    fixture.controller->start();
    expect(fixture.controller->session()->target.text == "bird song", "start uses selected tier");

    fixture.controller->select_difficulty(Difficulty::Easy);
    expect(fixture.controller->session()->target.text == "cat", "ready session redrawn for the new tier");

    fixture.controller->type("c");
    fixture.controller->select_difficulty(Difficulty::Medium);
    expect(fixture.controller->session()->target.text == "cat", "running session keeps its sentence");

    bool threw = false;
    try {
        fixture.controller->select_difficulty(Difficulty::Hard);
    } catch (const typemaster::LoadError&) {
        threw = true;
    }
    expect(threw, "empty tier rejected at selection");
    expect(fixture.controller->difficulty() == Difficulty::Medium, "failed selection keeps the previous tier");
}

void test_live_wpm_counts_characters() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->type("c");
    fixture.clock->advance(60.0);
    fixture.controller->type("caf\xC3\xA9");
    expect(near(fixture.controller->live_wpm(), 0.8), "accented input counts characters");
    expect(fixture.controller->classification().marks.size() == 4, "one mark per typed character");
}

void test_live_wpm() {
    Fixture fixture;
    fixture.controller->start();
    fixture.controller->select_difficulty(Difficulty::Medium);
    fixture.controller->type("b");
    expect(fixture.controller->live_wpm() == 0.0, "no elapsed time means zero wpm");

    fixture.clock->advance(60.0);
    fixture.controller->type("bird song");
    expect(fixture.controller->is_finished(), "completing medium sentence");
    expect(near(fixture.controller->live_wpm(), 9.0 / 5.0), "nine chars in a minute");
}

} // namespace

int main() {
    test_start_creates_ready_session();
    test_first_keystroke_starts_timer_once();
    test_completion_finishes_session();
    test_mismatch_and_extras_do_not_finish();
    test_timeout_on_tick();
    test_keystroke_after_limit_times_out_first();
    test_reset_abandons_without_result();
    test_tick_after_reset_is_ignored();
    test_acknowledge_draws_new_session();
    test_difficulty_selection();
    test_live_wpm();
    test_live_wpm_counts_characters();
    return 0;
}
