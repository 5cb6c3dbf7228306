#include "typemaster/qt_repeating_timer.hpp"

#include <utility>

namespace typemaster {

QtRepeatingTimer::QtRepeatingTimer(const int interval_ms) {
    timer_.setInterval(interval_ms);
    timer_.setSingleShot(false);
    QObject::connect(&timer_, &QTimer::timeout, &timer_, [this]() {
        if (callback_) {
            callback_();
        }
    });
}

void QtRepeatingTimer::on_timeout(std::function<void()> callback) {
    callback_ = std::move(callback);
}

void QtRepeatingTimer::start() {
    timer_.start();
}

void QtRepeatingTimer::stop() {
    timer_.stop();
}

bool QtRepeatingTimer::is_active() const {
    return timer_.isActive();
}

} // namespace typemaster
