
#include "console.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "terminal_surface.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <iostream>
#include <unistd.h>

using namespace qrcast;

static void usage(const char *prog) {
  std::cerr
      << "usage: " << prog << " [options] [file]\n"
      << "  --chunk-size N        bytes per chunk (default 1024)\n"
      << "  --repeat N            data passes per cycle (default 3)\n"
      << "  --group N             chunks per parity group (default 8)\n"
      << "  --no-parity           do not emit parity frames\n"
      << "  --interval-ms N       display time per screen (default 100)\n"
      << "  --header-hold-ms N    minimum display time of header screens\n"
      << "  --tiles N             symbols shown side by side (default 1)\n"
      << "  --ecc L|M|Q|H         error correction level (default M)\n"
      << "  --max-symbol-bytes N  cap symbol payload below the QR maximum\n"
      << "  --compress            deflate the file before framing\n"
      << "  --log-level LEVEL     trace|debug|info|warn|error\n"
      << "  --log-file PATH       append log lines to PATH\n"
      << "console: load <path> | start | stop | cancel | status | quit\n";
}

int main(int argc, char **argv) {
  TransferConfig cfg;
  std::string file;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto number = [&](int &i, uint64_t max) -> uint64_t {
      std::string v = next(i);
      uint64_t n = 0;
      if (!parse_uint(v, max, n)) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(1);
      }
      return n;
    };
    if (a == "--chunk-size")
      cfg.chunk_size = (uint32_t)number(i, 0xFFFF);
    else if (a == "--repeat")
      cfg.repetition = (uint16_t)number(i, 0xFFFF);
    else if (a == "--group")
      cfg.parity_group_size = (uint16_t)number(i, 0xFFFF);
    else if (a == "--no-parity")
      cfg.parity = false;
    else if (a == "--interval-ms")
      cfg.frame_interval_ms = (uint32_t)number(i, 60000);
    else if (a == "--header-hold-ms")
      cfg.header_hold_ms = (uint32_t)number(i, 60000);
    else if (a == "--tiles")
      cfg.tiles = (uint16_t)number(i, 16);
    else if (a == "--max-symbol-bytes")
      cfg.max_symbol_bytes = (uint32_t)number(i, 0xFFFF);
    else if (a == "--compress")
      cfg.compress = true;
    else if (a == "--ecc") {
      std::string v = next(i);
      if (!parse_ecc_level(v, cfg.ecc)) {
        std::cerr << "bad ecc level: " << v << "\n";
        return 1;
      }
    } else if (a == "--log-level") {
      std::string v = next(i);
      LogLevel lvl;
      if (!parse_log_level(v, lvl)) {
        std::cerr << "bad log level: " << v << "\n";
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (a == "--log-file") {
      std::string v = next(i);
      if (!Logger::instance().open_file(v)) {
        std::cerr << "cannot open log file " << v << "\n";
        return 1;
      }
    } else if (a == "-h" || a == "--help") {
      usage(argv[0]);
      return 0;
    } else if (!a.empty() && a[0] == '-') {
      std::cerr << "unknown option " << a << "\n";
      usage(argv[0]);
      return 1;
    } else
      file = a;
  }

  try {
    validate_config(cfg);
  } catch (const TransferError &e) {
    std::cerr << errc_str(e.code()) << ": " << e.what() << "\n";
    return 1;
  }

  asio::io_context io;
  auto work = asio::make_work_guard(io);
  QrencodeRenderer renderer;
  TerminalSurface surface;
  TransferSession session(io, renderer, surface);

  auto announce = [&](const TransferInfo &info) {
    surface.set_banner(info.filename + "  " + format_size(info.original_size) +
                       "  " + std::to_string(info.total_chunks) + " chunks");
  };
  OperatorConsole console(
      io, session, cfg,
      [&]() {
        work.reset();
        io.stop();
      },
      announce);

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "signal %d, cancelling", sig);
    console.execute("quit");
  });

  if (!file.empty()) {
    try {
      session.load(file);
      session.start(cfg);
      if (auto info = session.info())
        announce(*info);
    } catch (const TransferError &e) {
      std::cerr << errc_str(e.code()) << ": " << e.what() << "\n";
      return 1;
    } catch (const std::exception &e) {
      std::cerr << "error: " << e.what() << "\n";
      return 1;
    }
  }

  console.read_from(STDIN_FILENO);

  io.run();
  return 0;
}
