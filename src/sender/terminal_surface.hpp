
#pragma once
#include <cstdio>
#include <string>
#include "display_clock.hpp"

namespace qrcast {

// Draws each screen on a terminal with UTF-8 half blocks, two module rows per
// text line, tiles side by side.
class TerminalSurface : public DisplaySurface {
public:
    explicit TerminalSurface(FILE* out = stdout, int quiet_zone = 2);
    void present(const RenderedSequence& seq, const Screen& screen) override;
    void set_banner(std::string banner) { banner_ = std::move(banner); }
private:
    FILE* out_;
    int quiet_;
    bool cleared_{false};
    std::string banner_;
};

} // namespace qrcast
