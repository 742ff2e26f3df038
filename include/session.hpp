
#pragma once
#include <asio.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "display_clock.hpp"
#include "fec.hpp"
#include "scheduler.hpp"
#include "symbol.hpp"
#include "transfer_info.hpp"

namespace qrcast {

enum class SessionState { Idle, Building, Transmitting, Completed, Aborted };

const char* session_state_str(SessionState s);

struct TransferConfig {
    uint32_t chunk_size{1024};
    uint16_t repetition{3};
    uint16_t parity_group_size{8};
    bool parity{true};
    uint32_t frame_interval_ms{100};
    uint32_t header_hold_ms{0};
    uint16_t tiles{1};
    EccLevel ecc{EccLevel::M};
    uint32_t max_symbol_bytes{0};   // 0: full symbol capacity
    bool compress{false};

    RedundancyPlan redundancy_plan() const {
        return RedundancyPlan{repetition, parity_group_size, parity};
    }
    ClockConfig clock_config() const {
        return ClockConfig{frame_interval_ms, header_hold_ms, tiles};
    }
};

// Throws TransferError(InvalidConfiguration) on a zero knob.
void validate_config(const TransferConfig& cfg);

// Everything Building produces; immutable once published.
struct PreparedTransfer {
    TransferInfo info;
    std::shared_ptr<const FrameSequence> frames;
    std::shared_ptr<const RenderedSequence> rendered;
};

PreparedTransfer prepare_transfer(const std::string& filename,
                                  const std::vector<uint8_t>& bytes,
                                  const TransferConfig& cfg,
                                  const SymbolRenderer& renderer);

class TransferSession {
public:
    using DoneFn = std::function<void(std::exception_ptr)>;

    TransferSession(asio::io_context& io, const SymbolRenderer& renderer,
                    DisplaySurface& surface);
    ~TransferSession();
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Select the file for the next transfer and return to Idle, dropping any
    // previous sequence. Refused while Building or Transmitting.
    void load(const std::string& path);
    void load(const std::string& filename, std::vector<uint8_t> bytes);

    // Idle -> Building -> Transmitting. Build errors return to Idle and are
    // rethrown.
    void start(const TransferConfig& cfg);
    // Same, with Building on the background worker; done runs on io. If the
    // session is destroyed first, the result and done are dropped.
    void start_async(const TransferConfig& cfg, DoneFn done);

    // Transmitting -> Completed / Aborted. False in any other state.
    bool stop();
    bool cancel();

    SessionState state() const;
    bool has_file() const;
    std::optional<TransferInfo> info() const;
    std::shared_ptr<const FrameSequence> frames() const;
    std::shared_ptr<const RenderedSequence> rendered() const;
    std::shared_ptr<DisplayClock> clock() const;

    void on_progress(DisplayClock::ProgressFn fn);

private:
    void begin_building();
    void publish(PreparedTransfer p, const TransferConfig& cfg);
    void fail_build(const std::exception_ptr& ep);

    asio::io_context& io_;
    const SymbolRenderer& renderer_;
    DisplaySurface& surface_;
    asio::thread_pool worker_{1};
    // Expires with the session; handlers posted to io_ check it first.
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    mutable std::mutex mtx_;
    SessionState state_{SessionState::Idle};
    std::string filename_;
    std::shared_ptr<const std::vector<uint8_t>> file_;
    std::optional<PreparedTransfer> prepared_;
    std::shared_ptr<DisplayClock> clock_;
    DisplayClock::ProgressFn progress_;
};

} // namespace qrcast
