
#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include "symbol.hpp"

namespace qrcast {

struct ClockConfig {
    uint32_t frame_interval_ms{100};
    uint32_t header_hold_ms{0};
    uint16_t tiles{1};
};

// What the display shows during one tick: seq[first, first + count).
struct Screen {
    uint64_t cycle{0};
    size_t first{0};
    size_t count{0};
};

class DisplaySurface {
public:
    virtual ~DisplaySurface() = default;
    virtual void present(const RenderedSequence& seq, const Screen& screen) = 0;
};

class DisplayClock : public std::enable_shared_from_this<DisplayClock> {
public:
    using ProgressFn = std::function<void(const Screen&, size_t total)>;

    DisplayClock(asio::io_context& io, DisplaySurface& surface, const ClockConfig& cfg);

    void start(std::shared_ptr<const RenderedSequence> seq);
    // Takes effect at the next tick boundary; the last screen stays up.
    void stop();
    void on_progress(ProgressFn fn) { progress_ = std::move(fn); }

    bool running() const { return running_.load(); }
    uint64_t screens_shown() const { return shown_.load(); }
    std::optional<Screen> current() const;
    const ClockConfig& config() const { return cfg_; }

    std::chrono::milliseconds hold_for(const Screen& s) const;

private:
    using clock = std::chrono::steady_clock;

    void tick();
    Screen next_screen() const;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    DisplaySurface& surface_;
    ClockConfig cfg_;
    ProgressFn progress_;

    std::shared_ptr<const RenderedSequence> seq_;
    size_t pos_{0};
    uint64_t cycle_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> shown_{0};

    mutable std::mutex cur_mtx_;
    std::optional<Screen> current_;
};

} // namespace qrcast
