// ======================================================================
// \title  console_test.cpp
// \brief  Operator console command tests
// ======================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include "console.hpp"
#include "test_support.hpp"

using namespace qrcast;

class ConsoleTest : public ::testing::Test {
  protected:
    ConsoleTest() {
        cfg.chunk_size = 200;
        cfg.repetition = 2;
        cfg.frame_interval_ms = 1;
    }

    asio::io_context io;
    test::FakeRenderer renderer;
    test::RecordingSurface surface;
    TransferSession session{io, renderer, surface};
    TransferConfig cfg;
    int quits = 0;
};

TEST_F(ConsoleTest, LoadStartStop) {
    std::string path = ::testing::TempDir() + "qrcast_console_load.bin";
    {
        auto bytes = test::pattern_bytes(1200);
        std::ofstream out(path, std::ios::binary);
        out.write((const char*)bytes.data(), (std::streamsize)bytes.size());
    }
    auto guard = asio::make_work_guard(io);
    std::string started;
    OperatorConsole console(io, session, cfg, [this]() { quits++; },
                            [&](const TransferInfo& info) {
                                started = info.filename;
                                guard.reset();
                            });

    EXPECT_TRUE(console.execute("load " + path));
    EXPECT_TRUE(session.has_file());
    EXPECT_TRUE(console.execute("start"));
    EXPECT_EQ(SessionState::Building, session.state());

    surface.after_present = [&](size_t shown) {
        if (shown == 2)
            EXPECT_TRUE(console.execute("stop"));
    };
    io.run();
    std::remove(path.c_str());

    EXPECT_EQ("qrcast_console_load.bin", started);
    EXPECT_EQ(SessionState::Completed, session.state());
    EXPECT_EQ(2u, surface.shown.size());
    EXPECT_EQ(0, quits);
}

TEST_F(ConsoleTest, QuitCancelsActiveTransfer) {
    OperatorConsole console(io, session, cfg, [this]() { quits++; });
    session.load("a.bin", test::pattern_bytes(900));
    session.start(cfg);
    EXPECT_FALSE(console.execute("quit"));
    EXPECT_EQ(SessionState::Aborted, session.state());
    EXPECT_EQ(1, quits);
    io.run();
    EXPECT_TRUE(surface.shown.empty());
}

TEST_F(ConsoleTest, ShortAliases) {
    OperatorConsole console(io, session, cfg, [this]() { quits++; });
    session.load("a.bin", test::pattern_bytes(900));
    session.start(cfg);
    EXPECT_TRUE(console.execute("c"));
    EXPECT_EQ(SessionState::Aborted, session.state());
    io.run();
    io.restart();

    session.load("a.bin", test::pattern_bytes(900));
    session.start(cfg);
    EXPECT_TRUE(console.execute("s"));
    EXPECT_EQ(SessionState::Completed, session.state());
    EXPECT_FALSE(console.execute("q"));
    EXPECT_EQ(1, quits);
    io.run();
}

// Bad commands and refused transitions are logged, never thrown.
TEST_F(ConsoleTest, ErrorsKeepTheConsoleAlive) {
    OperatorConsole console(io, session, cfg, [this]() { quits++; });
    EXPECT_TRUE(console.execute("stop"));
    EXPECT_TRUE(console.execute("cancel"));
    EXPECT_EQ(SessionState::Idle, session.state());

    EXPECT_TRUE(console.execute("start"));
    EXPECT_EQ(SessionState::Idle, session.state());

    EXPECT_TRUE(console.execute("load"));
    EXPECT_FALSE(session.has_file());
    EXPECT_TRUE(console.execute("load /nonexistent/qrcast/file.bin"));
    EXPECT_FALSE(session.has_file());

    EXPECT_TRUE(console.execute("status"));
    EXPECT_TRUE(console.execute("frobnicate"));

    session.load("a.bin", test::pattern_bytes(900));
    session.start(cfg);
    EXPECT_TRUE(console.execute("load a.bin"));
    EXPECT_EQ(SessionState::Transmitting, session.state());
    EXPECT_TRUE(console.execute("status"));
    EXPECT_TRUE(console.execute("cancel"));
    io.run();
    EXPECT_EQ(0, quits);
}

TEST_F(ConsoleTest, ReadsCommandsFromDescriptor) {
    int fds[2];
    ASSERT_EQ(0, ::pipe(fds));
    OperatorConsole console(io, session, cfg, [this]() { quits++; });
    console.read_from(fds[0]);
    ::close(fds[0]);

    const char input[] = "status\r\n\nquit\nstatus\n";
    ASSERT_EQ((ssize_t)(sizeof(input) - 1), ::write(fds[1], input, sizeof(input) - 1));
    io.run();
    ::close(fds[1]);
    EXPECT_EQ(1, quits);
}

TEST_F(ConsoleTest, EndOfInputStopsReading) {
    int fds[2];
    ASSERT_EQ(0, ::pipe(fds));
    OperatorConsole console(io, session, cfg, [this]() { quits++; });
    console.read_from(fds[0]);
    ::close(fds[0]);
    ASSERT_EQ(7, ::write(fds[1], "status\n", 7));
    ::close(fds[1]);
    io.run();
    EXPECT_EQ(0, quits);
}
