#include <gtest/gtest.h>
#include <core/config.hpp>
#include "support/local_host.hpp"

namespace fs = std::filesystem;

static const char* kFleet = R"(
settings:
  log_level: debug
  max_log_size: 2M
  max_log_files: 3
  script_exit_on_error: false
  force_tty: false
  scripts_dir: my-scripts
  script_delay: 0

hosts:
  - aliases: [pmx, proxmox]
    host: 192.168.1.10
    user: root
    port: 2222
    password: secret
    keyfile: ssh/pmx_key
    scripts: [update.sh, harden.sh]
    script_args:
      update.sh: [--full, --quiet]
    default_args: [--dry-run]
  - alias: web
    host: web.example.com
    user: deploy
)";

TEST(Config, ParsesSettingsAndHosts) {
    auto cfg = Config::parse(kFleet, "/etc/fleetsh");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    const auto& s = cfg.value.settings();
    EXPECT_EQ(s.log_level, LogLevel::Debug);
    EXPECT_EQ(s.max_log_size, "2M");
    EXPECT_EQ(s.max_log_files, 3);
    EXPECT_FALSE(s.script_exit_on_error);
    EXPECT_FALSE(s.force_tty);
    EXPECT_EQ(s.script_delay, 0);
    EXPECT_EQ(s.scripts_dir, "/etc/fleetsh/my-scripts");
    EXPECT_EQ(s.log_dir, "/etc/fleetsh/logs");
    EXPECT_EQ(cfg.value.hosts().size(), 2u);
}

TEST(Config, EveryAliasFindsTheSameProfile) {
    auto cfg = Config::parse(kFleet, "/etc/fleetsh");
    ASSERT_TRUE(cfg.is_ok());
    auto a = cfg.value.find("pmx");
    auto b = cfg.value.find("proxmox");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value.host, b.value.host);
    EXPECT_EQ(a.value.port, 2222);
    EXPECT_EQ(a.value.password, std::optional<std::string>("secret"));
    EXPECT_EQ(a.value.scripts, (std::vector<std::string>{"update.sh", "harden.sh"}));
}

TEST(Config, ScriptArgsOverrideDefaults) {
    auto cfg = Config::parse(kFleet, "/etc/fleetsh");
    ASSERT_TRUE(cfg.is_ok());
    auto p = cfg.value.find("pmx").value;
    EXPECT_EQ(p.args_for("update.sh"), (std::vector<std::string>{"--full", "--quiet"}));
    EXPECT_EQ(p.args_for("harden.sh"), std::vector<std::string>{"--dry-run"});
}

TEST(Config, DefaultsForOmittedFields) {
    auto cfg = Config::parse(kFleet, "/etc/fleetsh");
    ASSERT_TRUE(cfg.is_ok());
    auto web = cfg.value.find("web").value;
    EXPECT_EQ(web.port, 22);
    EXPECT_FALSE(web.password.has_value());
    EXPECT_FALSE(web.keyfile.has_value());
    EXPECT_TRUE(web.scripts.empty());
}

TEST(Config, UnknownAliasIsConfigMissing) {
    auto cfg = Config::parse(kFleet, "/etc/fleetsh");
    ASSERT_TRUE(cfg.is_ok());
    auto missing = cfg.value.find("nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.kind, ErrorKind::ConfigMissing);
}

TEST(Config, DuplicateAliasRejected) {
    auto cfg = Config::parse(R"(
hosts:
  - aliases: [a, shared]
    host: h1
    user: u
  - aliases: [shared]
    host: h2
    user: u
)", "/tmp");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_NE(cfg.error.find("shared"), std::string::npos);
}

TEST(Config, HostAndUserRequired) {
    auto no_user = Config::parse("hosts:\n  - aliases: [x]\n    host: h\n", "/tmp");
    ASSERT_TRUE(no_user.is_err());
    EXPECT_NE(no_user.error.find("'x'"), std::string::npos);

    auto no_alias = Config::parse("hosts:\n  - host: h\n    user: u\n", "/tmp");
    EXPECT_TRUE(no_alias.is_err());
}

TEST(Config, PortRangeChecked) {
    auto cfg = Config::parse("hosts:\n  - aliases: [x]\n    host: h\n    user: u\n    port: 70000\n", "/tmp");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.kind, ErrorKind::ConfigMissing);
}

TEST(Config, UnknownSettingWarns) {
    auto cfg = Config::parse("settings:\n  colour: blue\n", "/tmp");
    ASSERT_TRUE(cfg.is_ok());
    ASSERT_EQ(cfg.value.warnings().size(), 1u);
    EXPECT_NE(cfg.value.warnings()[0].find("colour"), std::string::npos);
}

TEST(Config, InvalidYamlIsAnError) {
    auto cfg = Config::parse("hosts: [unclosed", "/tmp");
    EXPECT_TRUE(cfg.is_err());
}

TEST(Config, LoadMissingFile) {
    auto cfg = Config::load("/nonexistent/fleetsh/config.yaml");
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.kind, ErrorKind::ConfigMissing);
}

TEST(Config, KeyfileDiscovery) {
    ScratchDir dir("config_keys");
    write_text(dir / "ssh/pmx_key", "private");
    write_text(dir / "ssh/web_key", "private");
    write_text(dir / "config.yaml", kFleet);

    auto cfg = Config::load(dir / "config.yaml");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;

    // Explicit keyfile, relative to the config directory
    auto pmx = cfg.value.keyfile_for(cfg.value.find("pmx").value);
    ASSERT_TRUE(pmx.has_value());
    EXPECT_EQ(*pmx, dir / "ssh/pmx_key");

    // <keys_dir>/<alias>_key
    auto web = cfg.value.keyfile_for(cfg.value.find("web").value);
    ASSERT_TRUE(web.has_value());
    EXPECT_EQ(*web, dir / "ssh/web_key");

    fs::remove(dir / "ssh/web_key");
    EXPECT_FALSE(cfg.value.keyfile_for(cfg.value.find("web").value).has_value());
}

TEST(Config, EmptySectionsLoadAsNoHosts) {
    auto cfg = Config::parse("settings:\nhosts:\n  # - aliases: [web]\n  #   host: 10.0.0.5\n", "/cfg");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    EXPECT_TRUE(cfg.value.hosts().empty());
    EXPECT_EQ(cfg.value.settings().connect_timeout, 5);

    auto scalar = Config::parse("hosts: web\n", "/cfg");
    ASSERT_TRUE(scalar.is_err());
    EXPECT_NE(scalar.error.find("'hosts' must be a list"), std::string::npos);
}

TEST(Config, DefaultConfigParsesAndIsNotOverwritten) {
    ScratchDir dir("config_default");
    auto path = dir / "nested/config.yaml";
    ASSERT_TRUE(create_default_config(path).is_ok());
    ASSERT_TRUE(config_exists(path));
    auto cfg = Config::load(path);
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    EXPECT_TRUE(cfg.value.hosts().empty());

    write_text(path, "hosts: []\n# mine\n");
    ASSERT_TRUE(create_default_config(path).is_ok());
    EXPECT_EQ(read_text(path), "hosts: []\n# mine\n");
}
