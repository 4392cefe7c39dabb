#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "celestial_echo_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        auto path = test_dir / "config.yaml";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config config;
    EXPECT_EQ(config.horizons().host, "horizons.jpl.nasa.gov");
    EXPECT_EQ(config.horizons().port, 6775);
    EXPECT_EQ(config.query().step_size, "7d");
    EXPECT_EQ(config.query().quantity_code, "21");
    EXPECT_FALSE(config.log().verbose);
    EXPECT_EQ(fs::path(config.store().path).filename(), "events.yaml");
}

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    auto r = Config::load_file(write_config("# nothing here\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.horizons().port, 6775);
    EXPECT_EQ(r.value.session().step_timeout, std::chrono::seconds(30));
}

TEST_F(ConfigTest, Overrides) {
    auto r = Config::load_file(write_config(R"(
horizons:
  host: "localhost"
  port: 7000
  step_timeout: 5
  connect_timeout: 2
query:
  step_size: "1h"
  quantity_code: "20"
log:
  verbose: true
store:
  path: "/tmp/celestial_echo_events.yaml"
)"));
    ASSERT_TRUE(r.is_ok()) << r.error;

    const Config& c = r.value;
    EXPECT_EQ(c.query().step_size, "1h");
    EXPECT_EQ(c.query().quantity_code, "20");
    EXPECT_EQ(c.store().path, "/tmp/celestial_echo_events.yaml");

    SessionConfig s = c.session();
    EXPECT_EQ(s.host, "localhost");
    EXPECT_EQ(s.port, 7000);
    EXPECT_EQ(s.step_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(s.connect_timeout, std::chrono::seconds(2));
    EXPECT_TRUE(s.verbose);
}

TEST_F(ConfigTest, StorePathExpandsHome) {
    auto r = Config::load_file(write_config("store:\n  path: \"~/echoes.yaml\"\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.store().path.find('~'), std::string::npos);
    EXPECT_EQ(fs::path(r.value.store().path).filename(), "echoes.yaml");
}

TEST_F(ConfigTest, InvalidPort) {
    auto r = Config::load_file(write_config("horizons:\n  port: 70000\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("horizons.port"), std::string::npos);
}

TEST_F(ConfigTest, NonPositiveStepTimeout) {
    auto r = Config::load_file(write_config("horizons:\n  step_timeout: 0\n"));
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigTest, MissingFile) {
    auto r = Config::load_file(test_dir / "absent.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Config not found"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    auto r = Config::load_file(write_config("horizons: [unclosed\n"));
    EXPECT_TRUE(r.is_err());
}
