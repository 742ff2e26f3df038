
#include "console.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstring>
#include <sstream>
#include <unistd.h>

namespace qrcast {

OperatorConsole::OperatorConsole(asio::io_context &io, TransferSession &session,
                                 const TransferConfig &cfg,
                                 std::function<void()> on_quit,
                                 StartedFn on_started)
    : io_(io), session_(session), cfg_(cfg), on_quit_(std::move(on_quit)),
      on_started_(std::move(on_started)), input_(io) {}

void OperatorConsole::read_from(int fd) {
  int dupfd = ::dup(fd);
  if (dupfd < 0) {
    Logger::instance().log(LogLevel::WARN, "console disabled: dup failed: %s",
                           std::strerror(errno));
    return;
  }
  std::error_code ec;
  input_.assign(dupfd, ec);
  if (ec) {
    // regular files cannot be polled
    ::close(dupfd);
    Logger::instance().log(LogLevel::WARN, "console disabled: %s",
                           ec.message().c_str());
    return;
  }
  read_next();
}

void OperatorConsole::close_input() {
  std::error_code ec;
  input_.close(ec);
}

void OperatorConsole::read_next() {
  asio::async_read_until(
      input_, asio::dynamic_buffer(inbuf_), '\n',
      [this](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::DEBUG, "console input closed: %s",
                                   ec.message().c_str());
          return;
        }
        std::string line = inbuf_.substr(0, n - 1);
        inbuf_.erase(0, n);
        if (!line.empty() && line.back() == '\r')
          line.pop_back();
        if (!line.empty() && !execute(line))
          return;
        read_next();
      });
}

void OperatorConsole::start_transfer() {
  session_.start_async(cfg_, [this](std::exception_ptr ep) {
    if (!ep) {
      auto info = session_.info();
      if (info && on_started_)
        on_started_(*info);
      return;
    }
    try {
      std::rethrow_exception(ep);
    } catch (const TransferError &e) {
      Logger::instance().log(LogLevel::ERROR, "cannot start: %s: %s",
                             errc_str(e.code()), e.what());
    } catch (const std::exception &e) {
      Logger::instance().log(LogLevel::ERROR, "cannot start: %s", e.what());
    }
  });
}

bool OperatorConsole::execute(const std::string &line) {
  std::istringstream ss(line);
  std::string cmd, arg;
  ss >> cmd;
  std::getline(ss >> std::ws, arg);

  try {
    if (cmd == "stop" || cmd == "s") {
      if (!session_.stop())
        Logger::instance().log(LogLevel::WARN, "stop ignored in state %s",
                               session_state_str(session_.state()));
    } else if (cmd == "cancel" || cmd == "c") {
      if (!session_.cancel())
        Logger::instance().log(LogLevel::WARN, "cancel ignored in state %s",
                               session_state_str(session_.state()));
    } else if (cmd == "load" || cmd == "l") {
      if (arg.empty()) {
        Logger::instance().log(LogLevel::WARN, "usage: load <path>");
        return true;
      }
      session_.load(arg);
    } else if (cmd == "start") {
      start_transfer();
    } else if (cmd == "status") {
      auto info = session_.info();
      auto clock = session_.clock();
      if (!info) {
        Logger::instance().log(LogLevel::INFO, "state %s, nothing built",
                               session_state_str(session_.state()));
      } else {
        Logger::instance().log(
            LogLevel::INFO, "state %s, %s (%s), %u chunks, %llu screens shown",
            session_state_str(session_.state()), info->filename.c_str(),
            format_size(info->original_size).c_str(),
            (unsigned)info->total_chunks,
            (unsigned long long)(clock ? clock->screens_shown() : 0));
      }
    } else if (cmd == "quit" || cmd == "q") {
      session_.cancel();
      close_input();
      if (on_quit_)
        on_quit_();
      return false;
    } else {
      Logger::instance().log(LogLevel::WARN, "unknown command: %s",
                             cmd.c_str());
    }
  } catch (const TransferError &e) {
    Logger::instance().log(LogLevel::ERROR, "%s: %s", errc_str(e.code()),
                           e.what());
  }
  return true;
}

} // namespace qrcast
