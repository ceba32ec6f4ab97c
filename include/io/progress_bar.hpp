#pragma once
// progress_bar.hpp — terminal progress for long single-threaded runs (indicators)
//
// Driven from the simulation thread through sim::RunHooks::on_progress, so
// no background thread is needed; update() only redraws when the integer
// percentage changes.

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>

#include <indicators/progress_bar.hpp>
#include <indicators/cursor_control.hpp>

#include "core/config.hpp"

class RunProgress {
public:
    RunProgress() = default;
    RunProgress(const RunProgress&) = delete;
    RunProgress& operator=(const RunProgress&) = delete;
    ~RunProgress() { finish(); }

    void start() {
        indicators::show_console_cursor(false);
        bar_ = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{50},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowRemainingTime{true},
            indicators::option::MaxProgress{100},
            indicators::option::Stream{std::cerr}
        );
        last_pct_ = -1;
    }

    void update(core::count_t done, core::count_t total) {
        if (!bar_ || total == 0) return;
        const int pct = static_cast<int>((100.0 * static_cast<double>(done)) / static_cast<double>(total));
        if (pct == last_pct_) return;
        last_pct_ = pct;
        std::ostringstream oss;
        oss << done << "/" << total;
        bar_->set_option(indicators::option::PostfixText{oss.str()});
        bar_->set_progress(static_cast<std::size_t>(pct));
    }

    void finish() {
        if (!bar_) return;
        if (!bar_->is_completed()) bar_->mark_as_completed();
        indicators::show_console_cursor(true);
        bar_.reset();
    }

private:
    std::unique_ptr<indicators::ProgressBar> bar_;
    int last_pct_{-1};
};
