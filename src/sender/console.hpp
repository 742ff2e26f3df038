#pragma once
#include <asio.hpp>
#include <functional>
#include <string>
#include "session.hpp"

namespace qrcast {

// Operator controls read line by line: load <path>, start, stop, cancel,
// status, quit. Commands are executed on the io context.
class OperatorConsole {
public:
    using StartedFn = std::function<void(const TransferInfo&)>;

    OperatorConsole(asio::io_context& io, TransferSession& session,
                    const TransferConfig& cfg, std::function<void()> on_quit,
                    StartedFn on_started = nullptr);

    // Read commands from fd asynchronously on the io context until quit or
    // end of input. fd is duplicated; the caller keeps its own descriptor.
    void read_from(int fd);
    void close_input();

    // Returns false once the operator asked to quit.
    bool execute(const std::string& line);

private:
    void read_next();
    void start_transfer();

    asio::io_context& io_;
    TransferSession& session_;
    TransferConfig cfg_;
    std::function<void()> on_quit_;
    StartedFn on_started_;
    asio::posix::stream_descriptor input_;
    std::string inbuf_;
};

} // namespace qrcast
