#include <gtest/gtest.h>
#include <cli/query_cli.hpp>
#include <store/event_store.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "scripted_channel.hpp"

namespace fs = std::filesystem;

class QueryCLITest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path store_path;
    Config config;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "celestial_echo_cli_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        store_path = test_dir / "events.yaml";

        auto config_path = test_dir / "config.yaml";
        std::ofstream(config_path)
            << "horizons:\n  host: \"horizons.test\"\n  step_timeout: 1\n"
            << "store:\n  path: \"" << store_path.string() << "\"\n";
        auto loaded = Config::load_file(config_path);
        ASSERT_TRUE(loaded.is_ok()) << loaded.error;
        config = loaded.value;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::shared_ptr<ScriptedTranscript> reaching(const std::string& reply_to_target) {
        auto t = std::make_shared<ScriptedTranscript>();
        t->banner = transcript::BANNER;
        t->replies = {transcript::PAGE_OFF, reply_to_target};
        return t;
    }

    std::shared_ptr<ScriptedTranscript> full_run() {
        auto t = reaching(transcript::SELECT);
        for (const auto& r : transcript::after_select()) t->replies.push_back(r);
        return t;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST(QueryCLIOutputPath, TargetWithoutWhitespace) {
    EXPECT_EQ(default_output_path("2015 HM10;"), "2015HM10;.txt");
    EXPECT_EQ(default_output_path(" Mars Barycenter "), "MarsBarycenter.txt");
}

TEST_F(QueryCLITest, WritesTableOnSuccess) {
    auto out = test_dir / "table.txt";
    QueryCLI cli(config, scripted_opener(full_run()));

    EXPECT_EQ(cli.run_query("2018-01-01 10:00", "2015 HM10;", out.string()), 0);

    ASSERT_TRUE(fs::exists(out));
    EXPECT_EQ(read_file(out), transcript::ROWS + "\n");
}

TEST_F(QueryCLITest, FailedWriteExitsOne) {
    // Every write to /dev/full fails with ENOSPC.
    if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    QueryCLI cli(config, scripted_opener(full_run()));

    EXPECT_EQ(cli.run_query("2018-01-01 10:00", "2015 HM10;", "/dev/full"), 1);
    EXPECT_TRUE(fs::exists("/dev/full"));
}

TEST_F(QueryCLITest, AmbiguousTargetExitsTwoWithoutFile) {
    auto out = test_dir / "table.txt";
    QueryCLI cli(config, scripted_opener(reaching(transcript::MULTIPLE)));

    EXPECT_EQ(cli.run_query("2018-01-01 10:00", "Apophis", out.string()), 2);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(QueryCLITest, UnknownTargetExitsOneWithoutFile) {
    auto out = test_dir / "table.txt";
    QueryCLI cli(config, scripted_opener(reaching(transcript::NO_MATCHES)));

    EXPECT_EQ(cli.run_query("2018-01-01 10:00", "Vulcan", out.string()), 1);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(QueryCLITest, ConnectionFailureExitsOne) {
    ChannelOpener refuse = [](const std::string& host, int port, std::chrono::seconds) {
        return Result<ChannelPtr>::Err("Connection refused: " + host + ":" + std::to_string(port));
    };
    QueryCLI cli(config, refuse);

    EXPECT_EQ(cli.run_query("2018-01-01 10:00", "Mars", (test_dir / "t.txt").string()), 1);
    EXPECT_FALSE(fs::exists(test_dir / "t.txt"));
}

TEST_F(QueryCLITest, TrackStoresEvent) {
    auto t = full_run();
    QueryCLI cli(config, scripted_opener(t));

    EXPECT_EQ(cli.run_track("957145893449601024", "2018-01-21 06:55:25",
                            "@celestial_echo 2015 HM10;"), 0);

    ASSERT_GE(t->sent.size(), 2u);
    EXPECT_EQ(t->sent[1], "2015 HM10;\r\n");
    EXPECT_EQ(t->sent[5], "2018-01-21 06:55:25\r\n");

    auto events = EventStore(store_path).load();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].tweet_id, 957145893449601024);
    EXPECT_EQ(events[0].celestial_body, "2015 HM10;");
    EXPECT_NEAR(events[0].round_trip, 8.33028 * 120.0, 1e-6);
    EXPECT_EQ(events[0].deadline, "2018-01-21 07:12:04");
}

TEST_F(QueryCLITest, TrackAmbiguousStoresNothing) {
    QueryCLI cli(config, scripted_opener(reaching(transcript::MULTIPLE)));

    EXPECT_EQ(cli.run_track("1", "2018-01-21 06:55:25", "@celestial_echo Apophis"), 2);
    EXPECT_TRUE(EventStore(store_path).load().empty());
}

TEST_F(QueryCLITest, TrackNotFoundRepliesAndStoresNothing) {
    QueryCLI cli(config, scripted_opener(reaching(transcript::NO_MATCHES)));

    EXPECT_EQ(cli.run_track("1", "2018-01-21 06:55:25", "@celestial_echo Vulcan"), 0);
    EXPECT_TRUE(EventStore(store_path).load().empty());
}

TEST_F(QueryCLITest, TrackRejectsBadArguments) {
    auto t = full_run();
    QueryCLI cli(config, scripted_opener(t));

    EXPECT_EQ(cli.run_track("not-a-number", "2018-01-21 06:55:25", "Mars"), 1);
    EXPECT_EQ(cli.run_track("1", "yesterday", "Mars"), 1);
    EXPECT_EQ(t->opens, 0);
}

TEST_F(QueryCLITest, DueAndReplied) {
    EventStore store(store_path);
    EventForm form;
    form.tweet_id = 5;
    form.celestial_body = "Moon";
    form.deadline = *parse_timestamp("2018-01-01 00:00:00");
    ASSERT_TRUE(store.insert(form).is_ok());

    QueryCLI cli(config, scripted_opener(full_run()));

    EXPECT_EQ(cli.run_due(), 0);
    EXPECT_EQ(cli.run_replied("1"), 0);
    EXPECT_TRUE(store.load()[0].replied);
    EXPECT_EQ(cli.run_replied("2"), 1);
    EXPECT_EQ(cli.run_replied("abc"), 1);
}
