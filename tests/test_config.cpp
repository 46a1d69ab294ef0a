#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(ConfigTest, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.device_defaults().user, "robot");
    EXPECT_EQ(c.device_defaults().password, "maker");
    EXPECT_EQ(c.device_defaults().port, 22);
    EXPECT_EQ(c.device_defaults().home, "/home/robot");
    EXPECT_EQ(c.run().command, "brickrun -r -- pybricks-micropython {}");
    EXPECT_EQ(c.run().poll_interval_ms, 100);
    EXPECT_EQ(c.run().probe_timeout_ms, 3000);
    EXPECT_EQ(c.compile().mpy_cross, "mpy-cross");
    EXPECT_EQ(c.compile().build_dir, "build");
    EXPECT_EQ(c.compile().flags, std::vector<std::string>{"-mno-unicode"});
}

TEST(ConfigTest, PerDeviceOverridesInheritDefaults) {
    auto r = Config::parse(R"(
device:
  user: maker
  timeout: 5
devices:
  192.168.133.101:
    password: secret
  ev3dev.local:
    port: 2222
)");
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto a = r.value.device_for("192.168.133.101");
    EXPECT_EQ(a.user, "maker");
    EXPECT_EQ(a.password, "secret");
    EXPECT_EQ(a.timeout, 5);

    auto b = r.value.device_for("ev3dev.local");
    EXPECT_EQ(b.port, 2222);
    EXPECT_EQ(b.password, "maker");

    auto other = r.value.device_for("10.0.0.1");
    EXPECT_EQ(other.user, "maker");
    EXPECT_EQ(other.port, 22);
}

TEST(ConfigTest, HostnameEntryFollowsResolvedAddress) {
    auto r = Config::parse(R"(
devices:
  ev3dev.local:
    password: secret
    home: /home/maker
  10.0.0.9:
    port: 2200
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    Config config = r.value;

    EXPECT_EQ(config.device_for("192.168.1.50").password, "maker");
    config.alias_device("ev3dev.local", "192.168.1.50");
    EXPECT_EQ(config.device_for("192.168.1.50").password, "secret");
    EXPECT_EQ(config.device_for("192.168.1.50").home, "/home/maker");

    // An address with its own entry keeps it
    config.alias_device("ev3dev.local", "10.0.0.9");
    EXPECT_EQ(config.device_for("10.0.0.9").port, 2200);
    EXPECT_EQ(config.device_for("10.0.0.9").password, "maker");

    // Names without an entry change nothing
    config.alias_device("other.local", "192.168.1.51");
    EXPECT_EQ(config.device_for("192.168.1.51").password, "maker");
}

TEST(ConfigTest, RunAndCompileSections) {
    auto r = Config::parse(R"(
run:
  command: "python3 {}"
  poll_interval_ms: 50
compile:
  flags: "-O2"
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.run().command, "python3 {}");
    EXPECT_EQ(r.value.run().poll_interval_ms, 50);
    EXPECT_EQ(r.value.compile().flags, std::vector<std::string>{"-O2"});
}

TEST(ConfigTest, MalformedYamlIsConfigError) {
    auto r = Config::parse("device: [unclosed");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(ConfigTest, WrongValueTypeIsConfigError) {
    auto r = Config::parse("device:\n  port: twenty-two\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(ConfigTest, InvalidNumbersRejected) {
    EXPECT_TRUE(Config::parse("run:\n  poll_interval_ms: 0\n").is_err());
    EXPECT_TRUE(Config::parse("run:\n  probe_timeout_ms: -1\n").is_err());
    EXPECT_TRUE(Config::parse("device:\n  port: 70000\n").is_err());
}

TEST(ConfigTest, NonMapRootRejected) {
    auto r = Config::parse("- a\n- b\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(ConfigTest, LoadFile) {
    fs::path dir = fs::temp_directory_path() / "brickdev_config_test";
    fs::create_directories(dir);
    fs::path file = dir / "config.yaml";
    std::ofstream(file) << "device:\n  home: /home/robot/projects\n";

    auto r = Config::load_file(file);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.device_defaults().home, "/home/robot/projects");

    auto missing = Config::load_file(dir / "absent.yaml");
    EXPECT_TRUE(missing.is_err());
    EXPECT_EQ(missing.kind, ErrorKind::Config);

    fs::remove_all(dir);
}
