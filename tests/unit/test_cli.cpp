#include <gtest/gtest.h>
#include "puresend/core/cli.hpp"
#include "puresend/core/config.hpp"

using namespace puresend::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        Config::instance().set_defaults();
    }

    void TearDown() override {
        Config::instance().clear();
    }

    CommandLineParser parser_{"puresend"};
};

TEST_F(CommandLineParserTest, CommandAndArguments) {
    const char* argv[] = {"puresend", "-d", "/tmp/in", "send", "movie.mkv", "192.168.1.20", "53317"};
    ASSERT_TRUE(parser_.parse(7, argv));

    EXPECT_EQ(parser_.command(), "send");
    EXPECT_EQ(parser_.get_positional_args(),
              (std::vector<std::string>{"send", "movie.mkv", "192.168.1.20", "53317"}));
    EXPECT_EQ(parser_.get_option("directory"), "/tmp/in");
}

TEST_F(CommandLineParserTest, OptionForms) {
    const char* argv[] = {"puresend", "--port=6000", "--pin", "4321", "-c/etc/ps.conf", "--verbose", "share"};
    ASSERT_TRUE(parser_.parse(7, argv));

    EXPECT_EQ(parser_.get_option("port"), "6000");
    EXPECT_EQ(parser_.get_option("pin"), "4321");
    EXPECT_EQ(parser_.get_option("config"), "/etc/ps.conf");
    EXPECT_TRUE(parser_.get_flag("verbose"));
    EXPECT_FALSE(parser_.get_flag("overwrite"));
}

TEST_F(CommandLineParserTest, DefaultsAndDoubleDash) {
    const char* argv[] = {"puresend", "prepare", "--", "--odd-name.txt"};
    ASSERT_TRUE(parser_.parse(4, argv));

    EXPECT_EQ(parser_.get_option("config"), "~/.puresend.conf");
    EXPECT_EQ(parser_.get_positional_args(), (std::vector<std::string>{"prepare", "--odd-name.txt"}));
}

TEST_F(CommandLineParserTest, BadOptions) {
    const char* unknown[] = {"puresend", "--frobnicate"};
    EXPECT_EQ(parser_.parse(2, unknown).error, ErrorCode::INVALID_ARGUMENT);

    const char* missing[] = {"puresend", "--port"};
    EXPECT_EQ(parser_.parse(2, missing).error, ErrorCode::INVALID_ARGUMENT);

    const char* flag_value[] = {"puresend", "--overwrite=yes"};
    EXPECT_EQ(parser_.parse(2, flag_value).error, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(CommandLineParserTest, PortValidation) {
    std::uint16_t port = 7;
    ASSERT_TRUE(parser_.get_port("port", port));
    EXPECT_EQ(port, 7);

    for (const char* bad : {"0", "65536", "80x", "-1"}) {
        std::string arg = std::string("--port=") + bad;
        const char* argv[] = {"puresend", arg.c_str()};
        ASSERT_TRUE(parser_.parse(2, argv));
        EXPECT_EQ(parser_.get_port("port", port).error, ErrorCode::INVALID_ARGUMENT) << bad;
    }
}

TEST_F(CommandLineParserTest, ApplyToConfig) {
    const char* argv[] = {"puresend", "-p", "6000", "-d", "/srv/inbox", "--overwrite", "--encrypt",
                          "--no-discovery", "--no-compression", "receive"};
    ASSERT_TRUE(parser_.parse(10, argv));

    auto& config = Config::instance();
    ASSERT_TRUE(parser_.apply_to(config));

    EXPECT_EQ(config.get_int("transfer.port"), 6000);
    EXPECT_EQ(config.get_int("share.port"), 6000);
    EXPECT_EQ(config.get_int("web_upload.port"), 6000);
    EXPECT_EQ(config.get_string("receive.directory"), "/srv/inbox");
    EXPECT_TRUE(config.get_bool("receive.overwrite"));
    EXPECT_TRUE(config.get_bool("transfer.encryption"));
    EXPECT_FALSE(config.get_bool("transfer.compression"));
    EXPECT_FALSE(config.get_bool("discovery.enabled"));
}
