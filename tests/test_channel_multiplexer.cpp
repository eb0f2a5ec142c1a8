#include <gtest/gtest.h>
#include <platform/terminal.hpp>
#include <ssh/channel_multiplexer.hpp>
#include "support/local_host.hpp"
#include <chrono>
#include <memory>
#include <unistd.h>

// ── LineBuffer ──────────────────────────────────────────

TEST(LineBuffer, SplitsAcrossChunks) {
    LineBuffer buf;
    auto first = buf.feed("alp", 3);
    EXPECT_TRUE(first.empty());
    auto second = buf.feed("ha\nbe", 5);
    EXPECT_EQ(second, std::vector<std::string>{"alpha"});
    auto third = buf.feed("ta\n\ngamma", 9);
    EXPECT_EQ(third, (std::vector<std::string>{"beta", ""}));
    EXPECT_EQ(buf.flush(), std::optional<std::string>("gamma"));
    EXPECT_EQ(buf.flush(), std::nullopt);
}

TEST(LineBuffer, DropsCarriageReturnBeforeNewline) {
    LineBuffer buf;
    std::string data = "one\r\ntwo\r\n";
    auto lines = buf.feed(data.data(), data.size());
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(buf.flush(), std::nullopt);
}

TEST(LineBuffer, CarriageReturnSplitFromItsNewline) {
    LineBuffer buf;
    EXPECT_TRUE(buf.feed("x\r", 2).empty());
    EXPECT_EQ(buf.feed("\n", 1), std::vector<std::string>{"x"});
}

// ── Multiplexer over local channels (parameter: poller) ─

enum class PollerKind { Posix, Tick };

class MuxTest : public ::testing::TestWithParam<PollerKind> {
protected:
    ScratchDir home{"mux"};
    Logger logger = Logger::disabled();
    LocalHost host{home.path()};
    std::unique_ptr<ReadinessPoller> poller;
    std::vector<std::pair<bool, std::string>> lines;
    std::vector<MuxState> states;

    void SetUp() override {
        if (GetParam() == PollerKind::Posix) poller = std::make_unique<PosixPoller>();
        else poller = std::make_unique<TickPoller>(MUX_TICK_INTERVAL_MS);
        platform::InterruptGuard::reset();
    }

    void TearDown() override {
        platform::InterruptGuard::reset();
    }

    std::unique_ptr<ChannelMultiplexer> mux(const std::string& tag = "t") {
        auto m = std::make_unique<ChannelMultiplexer>(logger, *poller, "box", tag);
        m->set_line_sink([this](bool err, const std::string& line) {
            lines.emplace_back(err, line);
        });
        m->set_state_observer([this](MuxState s) { states.push_back(s); });
        return m;
    }

    static ChannelRequest command(const std::string& cmd) {
        ChannelRequest r;
        r.command = cmd;
        return r;
    }
};

TEST_P(MuxTest, CapturesBothStreamsAndExitStatus) {
    auto m = mux();
    auto rc = m->run(host, command("printf 'a\\r\\nb\\n'; printf 'err\\n' >&2; printf 'tail'; exit 4"),
                     MuxOptions{});
    ASSERT_TRUE(rc.is_ok()) << rc.error;
    EXPECT_EQ(rc.value, 4);

    std::vector<std::string> out, err;
    for (const auto& l : lines) (l.first ? err : out).push_back(l.second);
    EXPECT_EQ(out, (std::vector<std::string>{"a", "b", "tail"}));
    EXPECT_EQ(err, std::vector<std::string>{"err"});
}

TEST_P(MuxTest, WalksThroughEveryState) {
    auto m = mux();
    auto rc = m->run(host, command("echo hi"), MuxOptions{});
    ASSERT_TRUE(rc.is_ok());
    EXPECT_EQ(states, (std::vector<MuxState>{MuxState::Opening, MuxState::Streaming,
                                             MuxState::Draining, MuxState::Closed}));
    EXPECT_EQ(m->state(), MuxState::Closed);
}

TEST_P(MuxTest, DrainsOutputWrittenJustBeforeExit) {
    auto m = mux();
    auto rc = m->run(host, command("i=0; while [ $i -lt 500 ]; do echo line$i; i=$((i+1)); done"),
                     MuxOptions{});
    ASSERT_TRUE(rc.is_ok());
    EXPECT_EQ(rc.value, 0);
    ASSERT_EQ(lines.size(), 500u);
    EXPECT_EQ(lines.front().second, "line0");
    EXPECT_EQ(lines.back().second, "line499");
}

TEST_P(MuxTest, StderrOnlyOutputDoesNotStall) {
    auto m = mux();
    auto rc = m->run(host, command("i=0; while [ $i -lt 20000 ]; do echo noise$i >&2; i=$((i+1)); done"),
                     MuxOptions{});
    ASSERT_TRUE(rc.is_ok());
    EXPECT_EQ(lines.size(), 20000u);
}

TEST_P(MuxTest, InterruptCancelsAndCloses) {
    auto m = mux();
    m->set_line_sink([this](bool err, const std::string& line) {
        lines.emplace_back(err, line);
        if (line == "started") platform::InterruptGuard::trigger();
    });

    auto start = std::chrono::steady_clock::now();
    auto rc = m->run(host, command("echo started; sleep 5; echo finished"), MuxOptions{});
    auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(rc.is_err());
    EXPECT_EQ(rc.kind, ErrorKind::Cancelled);
    EXPECT_EQ(m->state(), MuxState::Closed);
    EXPECT_LT(took, std::chrono::seconds(4));
    for (const auto& l : lines) EXPECT_NE(l.second, "finished");
}

TEST_P(MuxTest, TimeoutEndsTheStream) {
    auto m = mux();
    MuxOptions opts;
    opts.timeout_secs = 1;
    auto rc = m->run(host, command("sleep 5"), opts);
    ASSERT_TRUE(rc.is_err());
    EXPECT_EQ(rc.kind, ErrorKind::Timeout);
}

TEST_P(MuxTest, CapturedCommandSeesClosedInput) {
    auto m = mux();
    auto rc = m->run(host, command("cat; echo done"), MuxOptions{});
    ASSERT_TRUE(rc.is_ok());
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.back().second, "done");
}

TEST_P(MuxTest, InteractiveForwardsInputAndRawOutput) {
    if (GetParam() == PollerKind::Tick) {
        GTEST_SKIP() << "TickPoller watches the console, not arbitrary descriptors";
    }
    int in_pipe[2], out_pipe[2];
    ASSERT_EQ(pipe(in_pipe), 0);
    ASSERT_EQ(pipe(out_pipe), 0);
    const char input[] = "ping\n";
    ASSERT_EQ(write(in_pipe[1], input, sizeof(input) - 1), static_cast<ssize_t>(sizeof(input) - 1));
    close(in_pipe[1]);

    MuxOptions opts;
    opts.interactive = true;
    opts.log_lines = false;
    opts.input_fd = in_pipe[0];
    opts.output_fd = out_pipe[1];
    opts.error_fd = out_pipe[1];

    auto m = mux();
    auto rc = m->run(host, command("read line; echo \"got $line\""), opts);
    close(in_pipe[0]);
    close(out_pipe[1]);
    ASSERT_TRUE(rc.is_ok()) << rc.error;

    char buf[64] = {0};
    ssize_t n = read(out_pipe[0], buf, sizeof(buf) - 1);
    close(out_pipe[0]);
    ASSERT_GT(n, 0);
    EXPECT_EQ(std::string(buf, static_cast<size_t>(n)), "got ping\n");
    EXPECT_TRUE(lines.empty());   // raw mode bypasses the line sink
}

TEST_P(MuxTest, OpenFailureClosesWithoutStreaming) {
    class RefusingHost : public LocalHost {
    public:
        using LocalHost::LocalHost;
        Result<std::unique_ptr<ChannelIO>> open_exec(const std::string&, const ExecOptions&) override {
            return Result<std::unique_ptr<ChannelIO>>::Err("administratively prohibited",
                                                           ErrorKind::ChannelFailed);
        }
    };
    RefusingHost refusing(home.path());
    auto m = mux();
    auto rc = m->run(refusing, command("true"), MuxOptions{});
    EXPECT_EQ(rc.kind, ErrorKind::ChannelFailed);
    EXPECT_EQ(states, (std::vector<MuxState>{MuxState::Opening, MuxState::Closed}));
}

INSTANTIATE_TEST_SUITE_P(Pollers, MuxTest, ::testing::Values(PollerKind::Posix, PollerKind::Tick),
                         [](const ::testing::TestParamInfo<PollerKind>& info) {
                             return info.param == PollerKind::Posix ? std::string("Posix")
                                                                    : std::string("Tick");
                         });

// ── Remote log ──────────────────────────────────────────

TEST(MuxLogging, CompleteLinesGoToRemoteLog) {
    ScratchDir dir("mux_log");
    GlobalSettings settings;
    settings.log_dir = (dir / "logs").string();
    Logger logger(settings);
    PosixPoller poller;
    LocalHost host(dir.path());

    ChannelMultiplexer m(logger, poller, "pmx", "update.sh");
    m.set_line_sink([](bool, const std::string&) {});
    ChannelRequest req;
    req.command = "echo first; echo second";
    auto rc = m.run(host, req, MuxOptions{});
    ASSERT_TRUE(rc.is_ok());

    std::string text = read_text(logger.remote_path());
    EXPECT_NE(text.find("] [pmx] [update.sh] first\n"), std::string::npos);
    EXPECT_NE(text.find("] [pmx] [update.sh] second\n"), std::string::npos);
}
