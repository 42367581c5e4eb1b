#include <gtest/gtest.h>
#include "puresend/core/config.hpp"
#include "puresend/core/application.hpp"
#include <fstream>
#include <filesystem>
#include <iterator>

using namespace puresend::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = (std::filesystem::temp_directory_path() / "puresend_test_config.txt").string();
    }

    void TearDown() override {
        Config::instance().clear();
        std::filesystem::remove(test_file);
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto value = Config::instance().get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "true");
    config.set("bool.yes", "YES");
    config.set("bool.false", "false");
    config.set("bool.off", "Off");
    config.set("bool.garbage", "maybe");
    config.set("int.value", "42");
    config.set("uint64.value", "274877906944");
    config.set("string.value", "hello world");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_TRUE(config.get_bool("bool.yes"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_FALSE(config.get_bool("bool.off", true));
    EXPECT_TRUE(config.get_bool("bool.garbage", true));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_uint64("uint64.value"), 274877906944ULL);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");

    config.set("int.garbage", "twelve");
    EXPECT_EQ(config.get_int("int.garbage", 7), 7);
    config.set("int.trailing", "42abc");
    EXPECT_EQ(config.get_int("int.trailing", 7), 7);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "; another comment\n";
    file << "key1=value1\n";
    file << "  key2 = value2 \n";
    file << "\n";
    file << "[transfer]\n";
    file << "port = 53317\n";
    file << "encryption = on\n";
    file << "[ share ]\n";
    file << "pin_max_attempts=5\n";
    file.close();

    auto& config = Config::instance();
    ASSERT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_EQ(config.get_int("transfer.port"), 53317);
    EXPECT_TRUE(config.get_bool("transfer.encryption"));
    EXPECT_EQ(config.get_int("share.pin_max_attempts"), 5);
    EXPECT_FALSE(config.contains("port"));
}

TEST_F(ConfigTest, MalformedLineNamesItsLocation) {
    std::ofstream file(test_file);
    file << "transfer.port = 9000\n";
    file << "no separator here\n";
    file << "transfer.chunk_size = 4096\n";
    file.close();

    auto& config = Config::instance();
    auto result = config.load_from_file(test_file);
    EXPECT_EQ(result.error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(result.message.find(":2:"), std::string::npos);
    EXPECT_EQ(config.get_int("transfer.port"), 9000);
    EXPECT_FALSE(config.contains("transfer.chunk_size"));

    std::ofstream(test_file) << "[unterminated\n";
    EXPECT_EQ(config.load_from_file(test_file).error, ErrorCode::INVALID_ARGUMENT);

    std::ofstream(test_file) << "bad key = 1\n";
    EXPECT_EQ(config.load_from_file(test_file).error, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_EQ(Config::instance().load_from_file(test_file + ".missing").error, ErrorCode::NOT_FOUND);
}

TEST_F(ConfigTest, SaveAndReload) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");
    config.set("share.port", "8080");
    config.set("zzz", "unsectioned");

    ASSERT_TRUE(config.save_to_file(test_file));

    std::ifstream saved(test_file);
    std::string text((std::istreambuf_iterator<char>(saved)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("[share]\nport = 8080"), std::string::npos);
    EXPECT_LT(text.find("zzz = unsectioned"), text.find("[share]"));

    config.clear();
    EXPECT_FALSE(config.contains("test.key1"));

    ASSERT_TRUE(config.load_from_file(test_file));
    EXPECT_EQ(config.get_string("test.key1"), "value1");
    EXPECT_EQ(config.get_string("test.key2"), "value2");
    EXPECT_EQ(config.get_int("share.port"), 8080);
    EXPECT_EQ(config.get_string("zzz"), "unsectioned");
}

TEST_F(ConfigTest, Validate) {
    auto& config = Config::instance();
    config.set_defaults();
    EXPECT_TRUE(config.validate());

    config.set("share.port", "70000");
    EXPECT_EQ(config.validate().error, ErrorCode::INVALID_ARGUMENT);
    config.set("share.port", "8080");

    config.set("transfer.chunk_size", "0");
    EXPECT_FALSE(config.validate());
    config.set("transfer.chunk_size", "65536");

    config.set("log.level", "chatty");
    EXPECT_FALSE(config.validate());
    config.set("log.level", "off");
    EXPECT_TRUE(config.validate());

    config.set("transfer.compression_mode", "fastest");
    EXPECT_EQ(config.validate().error, ErrorCode::INVALID_ARGUMENT);
    config.set("transfer.compression_mode", "Manual");
    EXPECT_TRUE(config.validate());

    config.set("transfer.compression_level", "12");
    EXPECT_EQ(config.validate().error, ErrorCode::INVALID_ARGUMENT);
    config.set("transfer.compression_level", "1");
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, DefaultsCoverEveryComponent) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_FALSE(config.get_string("node.name").empty());
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 1048576);
    EXPECT_EQ(config.get_uint64("transfer.max_file_size"), 68719476736ULL);
    EXPECT_TRUE(config.get_bool("receive.auto_accept"));
    EXPECT_EQ(config.get_int("discovery.port"), 5353);
    EXPECT_EQ(config.get_int("share.pin_max_attempts"), 3);
    EXPECT_EQ(config.get_int("share.pin_lock_seconds"), 300);
    EXPECT_EQ(config.get_int("resume.expiry_hours"), 24);
    EXPECT_EQ(config.get_string("log.level"), "info");
}

TEST_F(ConfigTest, ApplicationSettingsFollowConfig) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("node.id", "node-1");
    config.set("node.name", "Workstation");
    config.set("receive.directory", "/tmp/puresend-incoming");
    config.set("receive.auto_accept", "false");
    config.set("transfer.offer_timeout_seconds", "5");
    config.set("share.pin_max_attempts", "5");
    config.set("web_upload.port", "18090");
    config.set("transfer.compression_mode", "manual");
    config.set("transfer.compression_level", "2");

    auto settings = ApplicationSettings::from_config(config);

    EXPECT_EQ(settings.transfer.local_id, "node-1");
    EXPECT_EQ(settings.discovery.local_id, "node-1");
    EXPECT_EQ(settings.transfer.local_name, "Workstation");
    EXPECT_FALSE(settings.transfer.auto_receive);
    EXPECT_FALSE(settings.web_upload.auto_receive);
    EXPECT_EQ(settings.transfer.offer_timeout, std::chrono::seconds(5));
    EXPECT_EQ(settings.storage.receive_directory, std::filesystem::path("/tmp/puresend-incoming"));
    EXPECT_EQ(settings.web_upload.receive_directory, std::filesystem::path("/tmp/puresend-incoming"));
    EXPECT_EQ(settings.share.access.max_pin_attempts, 5u);
    EXPECT_EQ(settings.web_upload.port, 18090);
    EXPECT_TRUE(settings.transfer.compression.enabled);
    EXPECT_EQ(settings.transfer.compression.mode, puresend::transfer::CompressionMode::Manual);
    EXPECT_EQ(settings.transfer.compression.level, 2);
}

TEST_F(ConfigTest, MissingNodeIdGetsRandomOne) {
    auto& config = Config::instance();
    config.set_defaults();

    auto first = ApplicationSettings::from_config(config);
    auto second = ApplicationSettings::from_config(config);

    EXPECT_FALSE(first.transfer.local_id.empty());
    EXPECT_NE(first.transfer.local_id, second.transfer.local_id);
}
