
#include "session.hpp"
#include "compress.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "framer.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace qrcast {

const char *session_state_str(SessionState s) {
  switch (s) {
  case SessionState::Idle:
    return "Idle";
  case SessionState::Building:
    return "Building";
  case SessionState::Transmitting:
    return "Transmitting";
  case SessionState::Completed:
    return "Completed";
  default:
    return "Aborted";
  }
}

void validate_config(const TransferConfig &cfg) {
  const char *bad = nullptr;
  if (cfg.chunk_size == 0)
    bad = "chunk size";
  else if (cfg.repetition == 0)
    bad = "repetition factor";
  else if (cfg.parity_group_size == 0)
    bad = "parity group size";
  else if (cfg.frame_interval_ms == 0)
    bad = "frame interval";
  else if (cfg.tiles == 0)
    bad = "tiles per screen";
  if (bad)
    throw TransferError(Errc::InvalidConfiguration,
                        std::string(bad) + " must be > 0");
}

PreparedTransfer prepare_transfer(const std::string &filename,
                                  const std::vector<uint8_t> &bytes,
                                  const TransferConfig &cfg,
                                  const SymbolRenderer &renderer) {
  validate_config(cfg);
  if (bytes.empty())
    throw TransferError(Errc::EmptyFile, "file is empty");

  size_t capacity = renderer.capacity(cfg.ecc);
  if (cfg.max_symbol_bytes > 0 && cfg.max_symbol_bytes < capacity)
    capacity = cfg.max_symbol_bytes;

  size_t max_chunk = max_chunk_payload(capacity);
  if (max_chunk == 0)
    throw TransferError(Errc::InvalidConfiguration,
                        "symbol capacity of " + std::to_string(capacity) +
                            " bytes cannot carry a data frame");
  size_t chunk_size = cfg.chunk_size;
  if (chunk_size > max_chunk) {
    Logger::instance().log(LogLevel::WARN,
                           "chunk size %zu exceeds symbol capacity, using %zu",
                           chunk_size, max_chunk);
    chunk_size = max_chunk;
  }

  std::string name = filename;
  truncate_utf8(name, kMaxFilename);
  if (header_frame_size(0) > capacity)
    throw TransferError(Errc::InvalidConfiguration,
                        "symbol capacity too small for the header frame");
  if (header_frame_size(name.size()) > capacity) {
    truncate_utf8(name, capacity - header_frame_size(0));
    Logger::instance().log(LogLevel::WARN,
                           "filename truncated to %zu bytes to fit header",
                           name.size());
  }

  TransferInfo info;
  info.filename = name;
  info.original_size = bytes.size();
  info.content_hash = content_hash(bytes);

  std::optional<std::vector<uint8_t>> packed;
  if (cfg.compress) {
    packed = deflate_payload(bytes);
    if (!packed)
      Logger::instance().log(LogLevel::INFO,
                             "compression does not shrink %s, sending raw",
                             name.c_str());
  }
  const std::vector<uint8_t> &payload = packed ? *packed : bytes;
  info.compressed = packed.has_value();
  info.total_size = payload.size();

  std::vector<Chunk> chunks = frame_payload(payload, chunk_size);
  info.chunk_size = (uint16_t)chunk_size;
  info.total_chunks = (uint16_t)chunks.size();
  info.session_id = random_session_id();
  info.created_at = (uint64_t)std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();

  auto frames = std::make_shared<const FrameSequence>(
      build_sequence(info, chunks, cfg.redundancy_plan()));
  auto rendered = std::make_shared<const RenderedSequence>(
      render_sequence(*frames, renderer, cfg.ecc, capacity));

  SequenceStats st = sequence_stats(*frames);
  Logger::instance().log(
      LogLevel::INFO,
      "built transfer %016llx: %s %s%s, %u chunks of %u, %zu frames/cycle "
      "(%zu header, %zu data, %zu parity), ecc %s",
      (unsigned long long)info.session_id, name.c_str(),
      format_size(info.original_size).c_str(),
      info.compressed ? (" -> " + format_size(info.total_size)).c_str() : "",
      (unsigned)info.total_chunks, (unsigned)info.chunk_size, frames->size(),
      st.header_frames, st.data_frames, st.parity_frames,
      ecc_level_str(cfg.ecc));
  Logger::instance().log(
      LogLevel::DEBUG, "content sha256 %s",
      bytes_to_hex(info.content_hash.data(), info.content_hash.size()).c_str());

  return PreparedTransfer{std::move(info), std::move(frames),
                          std::move(rendered)};
}

TransferSession::TransferSession(asio::io_context &io,
                                 const SymbolRenderer &renderer,
                                 DisplaySurface &surface)
    : io_(io), renderer_(renderer), surface_(surface) {}

TransferSession::~TransferSession() {
  alive_.reset();
  worker_.join();
  std::lock_guard<std::mutex> lk(mtx_);
  if (clock_)
    clock_->stop();
}

void TransferSession::load(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw TransferError(Errc::FileUnreadable, "cannot open " + path);
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  if (in.bad())
    throw TransferError(Errc::FileUnreadable, "read error on " + path);
  load(std::filesystem::path(path).filename().string(), std::move(bytes));
}

void TransferSession::load(const std::string &filename,
                           std::vector<uint8_t> bytes) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_ == SessionState::Building || state_ == SessionState::Transmitting)
    throw TransferError(Errc::SessionNotIdle,
                        std::string("cannot load while ") +
                            session_state_str(state_));
  prepared_.reset();
  clock_.reset();
  filename_ = filename;
  file_ = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
  state_ = SessionState::Idle;
  Logger::instance().log(LogLevel::INFO, "loaded %s (%s)", filename_.c_str(),
                         format_size(file_->size()).c_str());
}

void TransferSession::begin_building() {
  if (state_ != SessionState::Idle)
    throw TransferError(Errc::SessionNotIdle,
                        std::string("cannot start while ") +
                            session_state_str(state_));
  if (!file_)
    throw TransferError(Errc::InvalidConfiguration, "no file loaded");
  state_ = SessionState::Building;
}

void TransferSession::start(const TransferConfig &cfg) {
  std::string name;
  std::shared_ptr<const std::vector<uint8_t>> file;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    begin_building();
    name = filename_;
    file = file_;
  }
  try {
    publish(prepare_transfer(name, *file, cfg, renderer_), cfg);
  } catch (const std::exception &) {
    fail_build(std::current_exception());
    throw;
  }
}

void TransferSession::start_async(const TransferConfig &cfg, DoneFn done) {
  std::string name;
  std::shared_ptr<const std::vector<uint8_t>> file;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    begin_building();
    name = filename_;
    file = file_;
  }
  std::weak_ptr<int> alive = alive_;
  asio::post(worker_, [this, alive, cfg, name, file, done]() {
    std::exception_ptr ep;
    std::optional<PreparedTransfer> p;
    try {
      p = prepare_transfer(name, *file, cfg, renderer_);
    } catch (const std::exception &) {
      ep = std::current_exception();
    }
    asio::post(io_, [this, alive, cfg, ep, done, p = std::move(p)]() mutable {
      if (alive.expired()) {
        Logger::instance().log(LogLevel::DEBUG,
                               "session gone, dropping build result");
        return;
      }
      if (ep)
        fail_build(ep);
      else
        publish(std::move(*p), cfg);
      if (done)
        done(ep);
    });
  });
}

void TransferSession::fail_build(const std::exception_ptr &ep) {
  std::lock_guard<std::mutex> lk(mtx_);
  state_ = SessionState::Idle;
  try {
    std::rethrow_exception(ep);
  } catch (const TransferError &e) {
    Logger::instance().log(LogLevel::ERROR, "build failed (%s): %s",
                           errc_str(e.code()), e.what());
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "build failed: %s", e.what());
  }
}

void TransferSession::publish(PreparedTransfer p, const TransferConfig &cfg) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto rendered = p.rendered;
  prepared_ = std::move(p);
  clock_ = std::make_shared<DisplayClock>(io_, surface_, cfg.clock_config());
  if (progress_)
    clock_->on_progress(progress_);
  state_ = SessionState::Transmitting;
  clock_->start(std::move(rendered));
}

bool TransferSession::stop() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_ != SessionState::Transmitting)
    return false;
  state_ = SessionState::Completed;
  clock_->stop();
  Logger::instance().log(LogLevel::INFO, "transfer %016llx completed",
                         (unsigned long long)prepared_->info.session_id);
  return true;
}

bool TransferSession::cancel() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_ != SessionState::Transmitting)
    return false;
  state_ = SessionState::Aborted;
  clock_->stop();
  Logger::instance().log(LogLevel::INFO, "transfer %016llx aborted",
                         (unsigned long long)prepared_->info.session_id);
  return true;
}

SessionState TransferSession::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

bool TransferSession::has_file() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return file_ != nullptr;
}

std::optional<TransferInfo> TransferSession::info() const {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!prepared_)
    return std::nullopt;
  return prepared_->info;
}

std::shared_ptr<const FrameSequence> TransferSession::frames() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return prepared_ ? prepared_->frames : nullptr;
}

std::shared_ptr<const RenderedSequence> TransferSession::rendered() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return prepared_ ? prepared_->rendered : nullptr;
}

std::shared_ptr<DisplayClock> TransferSession::clock() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return clock_;
}

void TransferSession::on_progress(DisplayClock::ProgressFn fn) {
  std::lock_guard<std::mutex> lk(mtx_);
  progress_ = std::move(fn);
}

} // namespace qrcast
