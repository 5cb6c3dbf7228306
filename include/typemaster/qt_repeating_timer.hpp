#pragma once

#include <functional>

#include <QTimer>

#include "typemaster/session_controller.hpp"

namespace typemaster {

class QtRepeatingTimer final : public RepeatingTimer {
public:
    explicit QtRepeatingTimer(int interval_ms);

    void on_timeout(std::function<void()> callback);

    void start() override;
    void stop() override;
    [[nodiscard]] bool is_active() const override;

private:
    QTimer timer_;
    std::function<void()> callback_;
};

} // namespace typemaster
