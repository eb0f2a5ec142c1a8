#include <gtest/gtest.h>
#include <managers/script_deployer.hpp>
#include <managers/script_runner.hpp>
#include "support/local_host.hpp"
#include <algorithm>

namespace fs = std::filesystem;

struct CapturedLines {
    std::vector<std::string> out;
    std::vector<std::string> err;

    LineSink sink() {
        return [this](bool from_stderr, const std::string& line) {
            (from_stderr ? err : out).push_back(line);
        };
    }

    bool has(const std::string& line) const {
        return std::find(out.begin(), out.end(), line) != out.end();
    }
};

// ── Command construction ────────────────────────────────

TEST(BuildExecCommand, WrapsAndPropagatesExitStatus) {
    auto cmd = build_exec_command("bash", "/root/.fleetsh_scripts/up.sh", {"--full", "a b"}, true);
    EXPECT_EQ(cmd,
              "cd ~ && chmod +x /root/.fleetsh_scripts/up.sh && "
              "bash -e /root/.fleetsh_scripts/up.sh --full 'a b' ; rc=$?; "
              "rm -f /root/.fleetsh_scripts/up.sh; exit $rc");
}

TEST(BuildExecCommand, NoErrexitWhenDisabled) {
    auto cmd = build_exec_command("sh", "/x/s.sh", {}, false);
    EXPECT_NE(cmd.find("&& sh /x/s.sh ;"), std::string::npos);
    EXPECT_EQ(cmd.find("-e"), std::string::npos);
}

TEST(ScriptEnvironment, PortsUserAndKey) {
    ScratchDir keys("keys");
    write_text(keys / "pmx_key.pub", "ssh-ed25519 AAAA test\n");

    HostProfile profile;
    profile.user = "admin";
    profile.port = 2222;

    auto env = script_environment(profile, 22, keys / "pmx_key.pub");
    EXPECT_EQ(env["SSH_PORT"], "2222");
    EXPECT_EQ(env["ACTUAL_PORT"], "22");
    EXPECT_EQ(env["ADMIN_USER"], "admin");
    EXPECT_EQ(env["SSH_KEY_PATH"], (keys / "pmx_key").string());
    EXPECT_EQ(env["SSH_PUBLIC_KEY"], "ssh-ed25519 AAAA test\n");

    auto bare = script_environment(profile, 2222, std::nullopt);
    EXPECT_EQ(bare["SSH_KEY_PATH"], "");
    EXPECT_EQ(bare["SSH_PUBLIC_KEY"], "");
}

// ── Deploy and run (parameter: structured fs available) ─

class DeployTest : public ::testing::TestWithParam<bool> {
protected:
    ScratchDir remote{"deploy_remote"};
    ScratchDir scripts{"deploy_scripts"};
    Logger logger = Logger::disabled();
    PosixPoller poller;
    LocalHost host{remote.path(), GetParam()};
    CapturedLines lines;

    DeployRequest request(const std::string& name, const std::string& body) {
        write_text(scripts / name, body);
        DeployRequest req;
        req.local_script = scripts / name;
        req.alias = "test";
        req.exit_on_error = true;
        return req;
    }

    fs::path artifact(const std::string& name) const {
        return remote.path() / ".fleetsh_scripts" / name;
    }
};

TEST_P(DeployTest, SuccessfulScriptIsRemoved) {
    auto req = request("ok.sh", "echo hello from $HOME\nexit 0\n");
    ScriptDeployer deployer(host, logger, poller);
    deployer.set_line_sink(lines.sink());

    auto rc = deployer.deploy_and_run(req);
    ASSERT_TRUE(rc.is_ok()) << rc.error;
    EXPECT_EQ(rc.value, 0);
    EXPECT_TRUE(lines.has("hello from " + remote.path().string()));
    EXPECT_FALSE(fs::exists(artifact("ok.sh")));
}

TEST_P(DeployTest, FailingScriptIsRemovedAndStatusReturned) {
    auto req = request("bad.sh", "echo partial\necho oops >&2\nexit 3\n");
    ScriptDeployer deployer(host, logger, poller);
    deployer.set_line_sink(lines.sink());

    auto rc = deployer.deploy_and_run(req);
    ASSERT_TRUE(rc.is_ok()) << rc.error;
    EXPECT_EQ(rc.value, 3);
    EXPECT_TRUE(lines.has("partial"));
    EXPECT_EQ(lines.err, std::vector<std::string>{"oops"});
    EXPECT_FALSE(fs::exists(artifact("bad.sh")));
}

TEST_P(DeployTest, ArgumentsAndEnvironmentReachTheScript) {
    auto req = request("args.sh", "echo \"$1|$2|$ACTUAL_PORT|$ADMIN_USER\"\n");
    req.args = {"one", "two words"};
    req.env = {{"ACTUAL_PORT", "2222"}, {"ADMIN_USER", "ops"}};

    ScriptDeployer deployer(host, logger, poller);
    deployer.set_line_sink(lines.sink());
    auto rc = deployer.deploy_and_run(req);
    ASSERT_TRUE(rc.is_ok());
    EXPECT_EQ(rc.value, 0);
    EXPECT_TRUE(lines.has("one|two words|2222|ops"));
}

TEST_P(DeployTest, ErrexitStopsAtFirstFailingCommand) {
    auto req = request("errexit.sh", "false\necho unreachable\n");
    ScriptDeployer deployer(host, logger, poller);
    deployer.set_line_sink(lines.sink());

    auto rc = deployer.deploy_and_run(req);
    ASSERT_TRUE(rc.is_ok());
    EXPECT_NE(rc.value, 0);
    EXPECT_FALSE(lines.has("unreachable"));
    EXPECT_FALSE(fs::exists(artifact("errexit.sh")));
}

TEST_P(DeployTest, UploadPlacesScriptUnderWorkDir) {
    write_text(scripts / "keep.sh", "echo kept\n");
    ScriptDeployer deployer(host, logger, poller);
    auto path = deployer.upload(scripts / "keep.sh");
    ASSERT_TRUE(path.is_ok()) << path.error;
    EXPECT_EQ(path.value, artifact("keep.sh").string());
    EXPECT_EQ(read_text(artifact("keep.sh")), "echo kept\n");
}

INSTANTIATE_TEST_SUITE_P(Backends, DeployTest, ::testing::Values(true, false),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Structured") : std::string("ShellFallback");
                         });

TEST(DeployFailure, BrokenUploadLeavesNoArtifact) {
    ScratchDir remote("torn_remote");
    ScratchDir scripts("torn_scripts");
    write_text(scripts / "setup.sh", "echo one\necho two\necho three\n");
    LocalHost host(remote.path());
    host.tear_uploads();
    Logger logger = Logger::disabled();
    PosixPoller poller;
    ScriptDeployer deployer(host, logger, poller);

    DeployRequest req;
    req.local_script = scripts / "setup.sh";
    req.alias = "test";
    auto rc = deployer.deploy_and_run(req);
    ASSERT_TRUE(rc.is_err());
    EXPECT_EQ(rc.kind, ErrorKind::Io);
    EXPECT_FALSE(fs::exists(remote / ".fleetsh_scripts/setup.sh"));
}

TEST(DetectShell, BashUnlessOnlyShAnswers) {
    ScratchDir remote("shell_probe");
    LocalHost host(remote.path());
    Logger logger = Logger::disabled();
    PosixPoller poller;
    ScriptDeployer deployer(host, logger, poller);

    host.stub(SHELL_PROBE_CMD, "echo sh");
    EXPECT_EQ(deployer.detect_shell(), "sh");

    host.stub(SHELL_PROBE_CMD, "echo bash");
    EXPECT_EQ(deployer.detect_shell(), "bash");

    host.stub(SHELL_PROBE_CMD, "echo something-else");
    EXPECT_EQ(deployer.detect_shell(), "bash");

    host.stub(SHELL_PROBE_CMD, "exit 1");
    EXPECT_EQ(deployer.detect_shell(), "bash");
}

// ── Multi-script runner ─────────────────────────────────

class RunnerTest : public ::testing::Test {
protected:
    ScratchDir remote{"runner_remote"};
    ScratchDir scripts{"runner_scripts"};
    Logger logger = Logger::disabled();
    PosixPoller poller;
    int connects = 0;
    std::vector<int> sleeps;

    HostConnector connector() {
        return [this]() {
            connects++;
            ConnectedHost c;
            c.host = std::make_unique<LocalHost>(remote.path());
            c.port = 22;
            return Result<ConnectedHost>::Ok(std::move(c));
        };
    }

    ScriptRunner runner() {
        return ScriptRunner(logger, poller, connector(), scripts.path(),
                            [this](int secs) { sleeps.push_back(secs); });
    }

    HostProfile profile(std::vector<std::string> names) {
        HostProfile p;
        p.aliases = {"box"};
        p.host = "box";
        p.user = "root";
        p.scripts = std::move(names);
        return p;
    }
};

TEST_F(RunnerTest, FailFastStopsAtFirstNonZeroExit) {
    write_text(scripts / "x.sh", "exit 3\n");
    write_text(scripts / "y.sh", "touch \"$HOME/y_ran\"\n");

    ScriptRunOptions opts;
    auto rc = runner().run_all(profile({"x.sh", "y.sh"}), "box", opts);
    ASSERT_TRUE(rc.is_ok()) << rc.error;
    EXPECT_EQ(rc.value, 3);
    EXPECT_EQ(connects, 1);
    EXPECT_FALSE(fs::exists(remote / "y_ran"));
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RunnerTest, RunsAllInOrderWithDelayBetween) {
    write_text(scripts / "a.sh", "echo a >> \"$HOME/order\"\n");
    write_text(scripts / "b.sh", "echo b >> \"$HOME/order\"\n");
    write_text(scripts / "c.sh", "echo c >> \"$HOME/order\"\n");

    ScriptRunOptions opts;
    opts.delay_secs = 3;
    auto r = runner();
    CapturedLines lines;
    r.set_line_sink(lines.sink());
    auto rc = r.run_all(profile({"a.sh", "b.sh", "c.sh"}), "box", opts);
    ASSERT_TRUE(rc.is_ok());
    EXPECT_EQ(rc.value, 0);
    EXPECT_EQ(read_text(remote / "order"), "a\nb\nc\n");
    EXPECT_EQ(connects, 3);
    EXPECT_EQ(sleeps, (std::vector<int>{3, 3}));
}

TEST_F(RunnerTest, ConfiguredArgumentsArePassed) {
    write_text(scripts / "greet.sh", "echo \"$@\" > \"$HOME/greeting\"\n");
    auto p = profile({"greet.sh"});
    p.script_args["greet.sh"] = {"hello", "world"};
    p.default_args = {"ignored"};

    ScriptRunOptions opts;
    auto rc = runner().run_all(p, "box", opts);
    ASSERT_TRUE(rc.is_ok());
    EXPECT_EQ(read_text(remote / "greeting"), "hello world\n");
}

TEST_F(RunnerTest, MissingScriptFailsBeforeConnecting) {
    write_text(scripts / "present.sh", "exit 0\n");
    ScriptRunOptions opts;
    auto rc = runner().run_one(profile({}), "box", "absent.sh", std::nullopt, opts);
    ASSERT_TRUE(rc.is_err());
    EXPECT_EQ(rc.kind, ErrorKind::PathNotFound);
    EXPECT_EQ(connects, 0);
}

TEST_F(RunnerTest, ConnectionFailureIsPropagated) {
    write_text(scripts / "s.sh", "exit 0\n");
    ScriptRunner r(logger, poller,
                   []() { return Result<ConnectedHost>::Err("refused", ErrorKind::PortUnreachable); },
                   scripts.path(), [](int) {});
    ScriptRunOptions opts;
    auto rc = r.run_all(profile({"s.sh"}), "box", opts);
    EXPECT_EQ(rc.kind, ErrorKind::PortUnreachable);
}

TEST_F(RunnerTest, AvailableScriptsAreSortedShellFiles) {
    write_text(scripts / "zeta.sh", "");
    write_text(scripts / "alpha.sh", "");
    write_text(scripts / "notes.txt", "");
    EXPECT_EQ(runner().available_scripts(), (std::vector<std::string>{"alpha.sh", "zeta.sh"}));
}

TEST_F(RunnerTest, NoScriptsConfiguredIsSuccess) {
    ScriptRunOptions opts;
    auto rc = runner().run_all(profile({}), "box", opts);
    ASSERT_TRUE(rc.is_ok());
    EXPECT_EQ(rc.value, 0);
    EXPECT_EQ(connects, 0);
}
