
#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace qrcast {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

Logger::~Logger() {
  if (out_)
    std::fclose(out_);
}

void Logger::set_level(LogLevel lvl) { level_ = lvl; }

bool Logger::open_file(const std::string &path) {
  FILE *f = std::fopen(path.c_str(), "a");
  if (!f)
    return false;
  std::lock_guard<std::mutex> lk(mtx_);
  if (out_)
    std::fclose(out_);
  out_ = f;
  return true;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  FILE *out = out_ ? out_ : stderr;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  std::fprintf(out, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  std::fflush(out);
}

} // namespace qrcast
