
#include "terminal_surface.hpp"
#include <algorithm>

namespace qrcast {

TerminalSurface::TerminalSurface(FILE *out, int quiet_zone)
    : out_(out), quiet_(quiet_zone) {}

void TerminalSurface::present(const RenderedSequence &seq,
                              const Screen &screen) {
  std::vector<const Matrix *> tiles;
  int height = 0;
  for (size_t i = screen.first; i < screen.first + screen.count; ++i) {
    tiles.push_back(seq[i].matrix.get());
    height = std::max(height, seq[i].matrix->width);
  }
  height += 2 * quiet_;

  // light module on a light quiet zone; positions outside a symbol are light
  auto light = [&](const Matrix *m, int x, int y) {
    x -= quiet_;
    y -= quiet_;
    if (x < 0 || y < 0 || x >= m->width || y >= m->width)
      return true;
    return !m->dark(x, y);
  };

  std::string buf;
  buf.reserve((size_t)height * height * tiles.size() * 2);
  buf += cleared_ ? "\x1b[H" : "\x1b[2J\x1b[H";
  cleared_ = true;
  for (int y = 0; y < height; y += 2) {
    for (const Matrix *m : tiles) {
      // smaller symbols are padded so every tile has the same footprint
      for (int x = 0; x < height; ++x) {
        bool top = light(m, x, y);
        bool bottom = y + 1 < height ? light(m, x, y + 1) : true;
        if (top && bottom)
          buf += "\xe2\x96\x88"; // full block
        else if (top)
          buf += "\xe2\x96\x80"; // upper half
        else if (bottom)
          buf += "\xe2\x96\x84"; // lower half
        else
          buf += ' ';
      }
      buf += "  ";
    }
    buf += "\x1b[K\n";
  }

  char status[160];
  const RenderedFrame &first = seq[screen.first];
  std::snprintf(status, sizeof(status),
                "cycle %llu  frame %zu-%zu/%zu  %s #%u\x1b[K\n",
                (unsigned long long)screen.cycle + 1, screen.first + 1,
                screen.first + screen.count, seq.size(),
                frame_type_str(first.type), (unsigned)first.index);
  if (!banner_.empty()) {
    buf += banner_;
    buf += "\x1b[K\n";
  }
  buf += status;
  buf += "\x1b[J";
  std::fwrite(buf.data(), 1, buf.size(), out_);
  std::fflush(out_);
}

} // namespace qrcast
