
#include "display_clock.hpp"
#include "logging.hpp"
#include <algorithm>

namespace qrcast {

DisplayClock::DisplayClock(asio::io_context &io, DisplaySurface &surface,
                           const ClockConfig &cfg)
    : strand_(asio::make_strand(io)), timer_(strand_), surface_(surface),
      cfg_(cfg) {
  if (cfg_.tiles == 0)
    cfg_.tiles = 1;
  if (cfg_.frame_interval_ms == 0)
    cfg_.frame_interval_ms = 1;
}

void DisplayClock::start(std::shared_ptr<const RenderedSequence> seq) {
  auto self = shared_from_this();
  asio::post(strand_, [this, self, seq = std::move(seq)]() mutable {
    if (running_ || !seq || seq->empty())
      return;
    seq_ = std::move(seq);
    pos_ = 0;
    cycle_ = 0;
    running_ = true;
    Logger::instance().log(LogLevel::INFO,
                           "display clock started: %zu frames, %u ms/screen, "
                           "%u per screen",
                           seq_->size(), cfg_.frame_interval_ms,
                           (unsigned)cfg_.tiles);
    tick();
  });
}

void DisplayClock::stop() {
  stop_requested_ = true;
  auto self = shared_from_this();
  asio::post(strand_, [this, self]() {
    if (!running_)
      return;
    running_ = false;
    timer_.cancel();
    Logger::instance().log(LogLevel::INFO,
                           "display clock stopped after %llu screens, cycle %llu",
                           (unsigned long long)shown_.load(),
                           (unsigned long long)cycle_);
  });
}

std::optional<Screen> DisplayClock::current() const {
  std::lock_guard<std::mutex> lk(cur_mtx_);
  return current_;
}

Screen DisplayClock::next_screen() const {
  Screen s;
  s.cycle = cycle_;
  s.first = pos_;
  s.count = std::min<size_t>(cfg_.tiles, seq_->size() - pos_);
  return s;
}

std::chrono::milliseconds DisplayClock::hold_for(const Screen &s) const {
  std::chrono::milliseconds hold(cfg_.frame_interval_ms);
  if (cfg_.header_hold_ms > cfg_.frame_interval_ms && seq_) {
    for (size_t i = s.first; i < s.first + s.count && i < seq_->size(); ++i) {
      if ((*seq_)[i].type == FrameType::Header) {
        hold = std::chrono::milliseconds(cfg_.header_hold_ms);
        break;
      }
    }
  }
  return hold;
}

void DisplayClock::tick() {
  if (stop_requested_) {
    running_ = false;
    return;
  }
  Screen s = next_screen();
  surface_.present(*seq_, s);
  auto shown_at = clock::now();
  shown_++;
  {
    std::lock_guard<std::mutex> lk(cur_mtx_);
    current_ = s;
  }
  if (progress_)
    progress_(s, seq_->size());

  pos_ += s.count;
  if (pos_ >= seq_->size()) {
    pos_ = 0;
    cycle_++;
    Logger::instance().log(LogLevel::DEBUG, "cycle %llu complete",
                           (unsigned long long)cycle_);
  }

  // Deadline counts from the present so every screen gets its full hold.
  timer_.expires_at(shown_at + hold_for(s));
  auto self = shared_from_this();
  timer_.async_wait([this, self](std::error_code ec) {
    if (ec == asio::error::operation_aborted || !running_)
      return;
    tick();
  });
}

} // namespace qrcast
