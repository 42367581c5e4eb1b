#include <gtest/gtest.h>
#include "http_test_client.hpp"
#include "puresend/share/web_upload_server.hpp"
#include "puresend/crypto/hash.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>

using namespace puresend;
using namespace puresend::share;
namespace http = puresend::test::http;
using puresend::test::http_get;
using puresend::test::http_post_json;
using puresend::test::http_request;

class WebUploadTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "puresend_web_upload_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        content_.resize(5 * 64 * 1024 + 99);
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& byte : content_) {
            byte = static_cast<char>(dist(rng));
        }

        WebUploadConfig config;
        config.receive_directory = test_dir_;
        config.chunk_size = 64 * 1024;
        config.progress_interval = std::chrono::milliseconds(0);
        server_ = std::make_unique<WebUploadServer>(config);
        server_->set_event_handler([this](const WebUploadEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });

        WebUploadInfo info;
        ASSERT_TRUE(server_->start(info));
        ASSERT_NE(info.port, 0);
        EXPECT_TRUE(server_->is_running());
        port_ = info.port;
    }

    void TearDown() override {
        server_->stop();
        server_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    void become_accepted() {
        http_get(port_, "/request-status");
        auto requests = server_->get_requests();
        ASSERT_EQ(requests.size(), 1u);
        ASSERT_TRUE(server_->accept_request(requests[0].id));
    }

    std::string init(const std::string& name, std::uint64_t size) {
        auto reply = http_post_json(port_, "/upload/init", {{"fileName", name}, {"fileSize", size}});
        EXPECT_EQ(reply.status, http::status::ok) << reply.body;
        return reply.json().value("uploadId", std::string());
    }

    test::HttpReply send_chunk(const std::string& upload_id, std::size_t index) {
        std::size_t chunk = 64 * 1024;
        auto offset = index * chunk;
        auto body = content_.substr(offset, std::min(chunk, content_.size() - offset));
        return http_request(port_, http::verb::post, "/upload/chunk", body,
                            {{"x-upload-id", upload_id}, {"x-chunk-index", std::to_string(index)}},
                            "application/octet-stream");
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream out;
        out << file.rdbuf();
        return out.str();
    }

    std::filesystem::path test_dir_;
    std::string content_;
    std::unique_ptr<WebUploadServer> server_;
    std::uint16_t port_ = 0;
    std::mutex mutex_;
    std::vector<WebUploadEvent> events_;
};

TEST_F(WebUploadTest, RequestStatusAndCapabilities) {
    auto status = http_get(port_, "/request-status").json();
    EXPECT_EQ(status["hasRequest"], true);
    EXPECT_EQ(status["status"], "pending");

    auto caps = http_get(port_, "/capabilities").json();
    EXPECT_EQ(caps["encryption"], false);
    EXPECT_EQ(caps["compression"], false);
    EXPECT_EQ(caps["chunk_size"], 64 * 1024);
}

TEST_F(WebUploadTest, UnapprovedClientCannotUpload) {
    auto reply = http_post_json(port_, "/upload/init", {{"fileName", "a.bin"}, {"fileSize", 10}});
    EXPECT_EQ(reply.status, http::status::forbidden);
    EXPECT_EQ(reply.json()["success"], false);

    auto chunk = send_chunk("whatever", 0);
    EXPECT_EQ(chunk.status, http::status::forbidden);
}

TEST_F(WebUploadTest, ChunksInAnyOrderAssembleTheFile) {
    become_accepted();

    auto upload_id = init("notes.bin", content_.size());
    ASSERT_FALSE(upload_id.empty());

    for (std::size_t index : {5u, 1u, 3u}) {
        auto reply = send_chunk(upload_id, index);
        ASSERT_EQ(reply.status, http::status::ok) << reply.body;
        EXPECT_EQ(reply.json()["complete"], false);
    }

    auto status = http_get(port_, "/upload/status/" + upload_id).json();
    EXPECT_EQ(status["found"], true);
    EXPECT_EQ(status["fileName"], "notes.bin");
    EXPECT_EQ(status["totalChunks"], 6);
    EXPECT_EQ(status["receivedChunks"], (std::vector<int>{1, 3, 5}));
    EXPECT_EQ(status["complete"], false);

    // A repeated chunk is harmless.
    ASSERT_EQ(send_chunk(upload_id, 3).status, http::status::ok);

    ASSERT_EQ(send_chunk(upload_id, 0).status, http::status::ok);
    ASSERT_EQ(send_chunk(upload_id, 2).status, http::status::ok);
    auto last = send_chunk(upload_id, 4);
    ASSERT_EQ(last.status, http::status::ok);
    EXPECT_EQ(last.json()["complete"], true);

    std::vector<std::uint8_t> bytes(content_.begin(), content_.end());
    EXPECT_EQ(last.json()["fileHash"], crypto::hash_utils::hash_hex(bytes));

    auto saved = test_dir_ / "notes.bin";
    ASSERT_TRUE(std::filesystem::exists(saved));
    EXPECT_EQ(read_file(saved), content_);

    // The session is gone once the file is in place.
    EXPECT_EQ(http_get(port_, "/upload/status/" + upload_id).json()["found"], false);

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_FALSE(events_.empty());
    EXPECT_EQ(events_.front().kind, UploadEventKind::Started);
    EXPECT_EQ(events_.back().kind, UploadEventKind::Completed);
    EXPECT_EQ(events_.back().saved_path, saved.string());
}

TEST_F(WebUploadTest, ExistingFileIsNotOverwritten) {
    become_accepted();
    {
        std::ofstream existing(test_dir_ / "notes.bin");
        existing << "keep me";
    }

    auto upload_id = init("notes.bin", content_.size());
    for (std::size_t index = 0; index < 6; ++index) {
        ASSERT_EQ(send_chunk(upload_id, index).status, http::status::ok);
    }

    EXPECT_EQ(read_file(test_dir_ / "notes.bin"), "keep me");
    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_TRUE(events_.back().saved_path.has_value());
    EXPECT_NE(*events_.back().saved_path, (test_dir_ / "notes.bin").string());
    EXPECT_EQ(read_file(*events_.back().saved_path), content_);
}

TEST_F(WebUploadTest, EmptyFileCompletesAtInit) {
    become_accepted();

    auto reply = http_post_json(port_, "/upload/init", {{"fileName", "empty.txt"}, {"fileSize", 0}});
    ASSERT_EQ(reply.status, http::status::ok);
    EXPECT_EQ(reply.json()["complete"], true);
    EXPECT_EQ(reply.json()["chunkCount"], 0);
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "empty.txt"));
}

TEST_F(WebUploadTest, BadRequests) {
    become_accepted();

    EXPECT_EQ(http_post_json(port_, "/upload/init", {{"fileName", "x"}}).status, http::status::bad_request);

    auto upload_id = init("x.bin", content_.size());
    EXPECT_EQ(http_request(port_, http::verb::post, "/upload/chunk", "abc",
                           {{"x-upload-id", upload_id}, {"x-chunk-index", "two"}},
                           "application/octet-stream").status,
              http::status::bad_request);
    EXPECT_EQ(send_chunk("unknown-session", 0).status, http::status::not_found);

    // Out of range and wrong-sized chunks are refused.
    EXPECT_EQ(send_chunk(upload_id, 9).status, http::status::bad_request);
    EXPECT_EQ(http_request(port_, http::verb::post, "/upload/chunk", "short",
                           {{"x-upload-id", upload_id}, {"x-chunk-index", "0"}},
                           "application/octet-stream").status,
              http::status::bad_request);
}

TEST_F(WebUploadTest, ChunkTableSizeIsBounded) {
    become_accepted();

    auto tiny = http_post_json(port_, "/upload/init",
                               {{"fileName", "huge.bin"}, {"fileSize", 1ULL << 30}, {"chunkSize", 1}});
    EXPECT_EQ(tiny.status, http::status::bad_request);
    EXPECT_EQ(tiny.json()["success"], false);

    auto oversized = http_post_json(port_, "/upload/init",
                                    {{"fileName", "a.bin"}, {"fileSize", 10}, {"chunkSize", 64ULL * 1024 * 1024}});
    EXPECT_EQ(oversized.status, http::status::bad_request);

    WebUploadConfig config;
    config.receive_directory = test_dir_ / "limited";
    config.chunk_size = 64 * 1024;
    config.max_chunk_count = 4;
    config.auto_receive = true;
    WebUploadServer limited(config);
    WebUploadInfo info;
    ASSERT_TRUE(limited.start(info));
    http_get(info.port, "/request-status");
    ASSERT_EQ(limited.get_requests().at(0).status, RequestStatus::Accepted);

    // content_ spans six 64KB chunks.
    auto refused = http_post_json(info.port, "/upload/init",
                                  {{"fileName", "six.bin"}, {"fileSize", content_.size()}});
    EXPECT_EQ(refused.status, http::status::bad_request);

    auto accepted = http_post_json(info.port, "/upload/init",
                                   {{"fileName", "four.bin"}, {"fileSize", 4 * 64 * 1024}});
    EXPECT_EQ(accepted.status, http::status::ok);
    EXPECT_EQ(accepted.json()["chunkCount"], 4);
    limited.stop();

    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "huge.bin"));
}

TEST_F(WebUploadTest, StopDropsPartialFiles) {
    become_accepted();

    auto upload_id = init("partial.bin", content_.size());
    ASSERT_EQ(send_chunk(upload_id, 0).status, http::status::ok);

    server_->stop();
    EXPECT_FALSE(server_->is_running());
    EXPECT_TRUE(std::filesystem::is_empty(test_dir_));
}
