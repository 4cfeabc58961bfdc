#include <gtest/gtest.h>

#include "core/job_poller.h"
#include "core/transfer_task.h"
#include "infra/api_client.h"
#include "infra/transfer_engine.h"
#include "support/fakes.h"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace ermes::core;
using namespace ermes::infra;
using namespace ermes::test_support;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

class TransferEngineTest : public ::testing::Test {
protected:
    std::string prefix = "ermes_test_" + std::to_string(::getpid()) + "_";
    ClientConfig config;
    std::shared_ptr<ScriptedHttpClient> http = std::make_shared<ScriptedHttpClient>();
    std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
    std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();
    std::shared_ptr<TokenLifecycle> tokens;
    std::shared_ptr<ApiSession> session;
    std::shared_ptr<HttpTransferEngine> engine;
    std::vector<fs::path> scratch;

    void SetUp() override {
        config.base_url = "http://api";
        config.transfer.temp_dir_prefix = prefix;
        tokens = std::make_shared<TokenLifecycle>(config.token,
                                                  config.url(config.endpoints.jobs_list), http);
        tokens->set("t1");
        session = std::make_shared<ApiSession>(config, http, tokens, logger);
        engine = std::make_shared<HttpTransferEngine>(config, http, session, logger);
    }

    void TearDown() override {
        std::error_code ec;
        for (const auto& path : scratch) {
            fs::remove_all(path, ec);
        }
        for (const auto& entry : fs::directory_iterator(fs::temp_directory_path(), ec)) {
            if (entry.path().filename().string().rfind(prefix, 0) == 0) {
                fs::remove_all(entry.path(), ec);
            }
        }
    }

    int leftovers() const {
        int count = 0;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(fs::temp_directory_path(), ec)) {
            if (entry.path().filename().string().rfind(prefix, 0) == 0) {
                ++count;
            }
        }
        return count;
    }

    fs::path make_input(const std::string& name, const std::string& content) {
        const fs::path path =
            fs::temp_directory_path() / ("ermes_input_" + std::to_string(::getpid()) + "_" + name);
        std::ofstream out(path, std::ios::binary);
        out << content;
        scratch.push_back(path);
        return path;
    }
};

// ============================================================
// Download
// ============================================================

TEST_F(TransferEngineTest, KnownLengthDownloadEndsAt100) {
    const std::string body(10 * 8192, 'x');
    http->push_response(200, body,
                        {{"Content-Length", std::to_string(body.size())},
                         {"Content-Disposition", "attachment; filename=\"result.zip\""}});

    auto result = engine->download(DownloadRequest{"job-1", "dt-1"}, CancelToken::create(), events);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    const fs::path path = result.value().local_path;
    EXPECT_EQ(path.filename(), "result.zip");
    EXPECT_EQ(path.parent_path().filename().string().rfind(prefix + "job-1_", 0), 0u);
    EXPECT_EQ(fs::file_size(path), body.size());
    EXPECT_EQ(result.value().bytes, body.size());
    EXPECT_EQ(result.value().datatype_id.value_or(""), "dt-1");

    const auto percents = events->percents();
    ASSERT_FALSE(percents.empty());
    EXPECT_EQ(percents.back(), 100);
    for (std::size_t i = 0; i + 1 < percents.size(); ++i) {
        EXPECT_GE(percents[i], kDownloadProgressFloor);
        EXPECT_LE(percents[i], kDownloadProgressCeiling);
    }
    EXPECT_EQ(events->indeterminate_count(), 0);
    EXPECT_TRUE(events->saw_status("Starting download for job job-1..."));

    const auto requests = http->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "http://api/retrieve/job-1");
    EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer t1");
    EXPECT_EQ(requests[0].buffer_size, 8192u);
    EXPECT_EQ(requests[0].timeout.count(), 0);
}

TEST_F(TransferEngineTest, UnknownLengthNeverReportsPercent) {
    http->push_response(200, std::string(5 * 8192, 'y'));

    auto result = engine->download(DownloadRequest{"job-2", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(fs::path(result.value().local_path).filename(), "job-2.zip");
    EXPECT_TRUE(events->percents().empty());
    EXPECT_EQ(events->indeterminate_count(), 1);
}

TEST_F(TransferEngineTest, CancelAfterFirstChunkRemovesPartialDownload) {
    const std::string body(10 * 8192, 'z');
    http->push_response(200, body, {{"Content-Length", std::to_string(body.size())}});
    auto token = CancelToken::create();
    int delivered = 0;
    http->after_chunk = [&](std::size_t index) {
        ++delivered;
        if (index == 0) {
            EXPECT_EQ(leftovers(), 1);
            token->request_cancel();
        }
    };

    auto api = std::make_shared<FakeJobApi>();
    api->push_job(make_job("job-3", JobStatus::End, 200, "ok", true));
    TransferTask task(engine, api, events, logger);

    auto result = task.download_job("job-3", token);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Cancelled);
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(leftovers(), 0);
    ASSERT_EQ(events->failed.size(), 1u);
    EXPECT_EQ(events->failed[0], "Download cancelled");
    EXPECT_EQ(events->terminal_count(), 1);
}

TEST_F(TransferEngineTest, ServerErrorUsesJsonDetail) {
    http->push_response(404, R"({"detail":"Result not found"})");

    auto result = engine->download(DownloadRequest{"job-4", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::FatalServer);
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().user_message, "Result not found");
    EXPECT_EQ(leftovers(), 0);
}

TEST_F(TransferEngineTest, NetworkErrorIsPrefixed) {
    http->push_error(HttpErrorCode::NETWORK_ERROR, "connection reset");

    auto result = engine->download(DownloadRequest{"job-5", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Network);
    EXPECT_EQ(result.error().user_message, "Network error during download: connection reset");
}

TEST_F(TransferEngineTest, EmptyBodyStillCreatesFile) {
    http->push_response(200, "", {{"Content-Length", "0"}});

    auto result = engine->download(DownloadRequest{"job-6", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_TRUE(fs::exists(result.value().local_path));
    EXPECT_EQ(fs::file_size(result.value().local_path), 0u);
}

TEST_F(TransferEngineTest, DownloadWithoutSessionTokenFails) {
    tokens->clear();

    auto result = engine->download(DownloadRequest{"job-7", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::AuthFailure);
    EXPECT_EQ(http->request_count(), 0u);
}

TEST_F(TransferEngineTest, RejectedTokenIsRenewedOnce) {
    session->set_login(LoginCredentials{"ana", "secret"});
    http->push_response(401, R"({"detail":"Not authenticated"})");
    http->push_response(200, R"({"access_token":"t2"})");
    http->push_response(200, "payload", {{"Content-Length", "7"}});

    auto result = engine->download(DownloadRequest{"job-8", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(read_file(result.value().local_path), "payload");
    EXPECT_EQ(result.value().bytes, 7u);
    EXPECT_EQ(events->percents().back(), 100);
    EXPECT_TRUE(logger->has_event("unauthorized"));

    const auto requests = http->requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer t1");
    EXPECT_EQ(requests[1].url, "http://api/auth/login");
    EXPECT_EQ(requests[2].url, "http://api/retrieve/job-8");
    EXPECT_EQ(requests[2].headers.at("Authorization"), "Bearer t2");
}

TEST_F(TransferEngineTest, SecondRejectionIsAuthFailure) {
    session->set_login(LoginCredentials{"ana", "secret"});
    http->push_response(401, "");
    http->push_response(200, R"({"access_token":"t2"})");
    http->push_response(401, "");

    auto result = engine->download(DownloadRequest{"job-9", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::AuthFailure);
    EXPECT_EQ(result.error().user_message, "authentication failed: token rejected by the API");
    EXPECT_EQ(http->request_count(), 3u);
    EXPECT_EQ(leftovers(), 0);
}

TEST_F(TransferEngineTest, RejectionWithoutCredentialsIsTokenExpired) {
    http->push_response(401, "");

    auto result = engine->download(DownloadRequest{"job-10", std::nullopt}, CancelToken::create(),
                                   events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::TokenExpired);
    EXPECT_EQ(http->request_count(), 1u);
}

TEST_F(TransferEngineTest, PolledJobSurvivesTokenRejectionAtDownload) {
    session->set_login(LoginCredentials{"ana", "secret"});
    auto api = std::make_shared<HttpJobApi>(config, http, session, logger);
    http->push_response(200, R"({"status":"end","status_code":200,"result":"ok",)"
                             R"("resource_url":"r","body":{"datatype_id":"dt"}})");
    http->push_response(401, "");
    http->push_response(200, R"({"access_token":"t2"})");
    http->push_response(200, "zipdata");

    PollingPolicy policy;
    policy.interval = 5ms;
    policy.error_sleep = 5ms;
    JobPoller poller(policy, session, api, engine, events, logger);
    auto outcome = poller.run("j1", CancelToken::create());

    ASSERT_EQ(outcome.state, PollerState::Done);
    EXPECT_TRUE(events->job_errors.empty());
    ASSERT_EQ(events->completed.size(), 1u);
    EXPECT_EQ(read_file(events->completed[0]), "zipdata");
    EXPECT_EQ(events->finished, 1);

    const auto requests = http->requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[0].url, "http://api/jobs/j1");
    EXPECT_EQ(requests[1].url, "http://api/retrieve/j1");
    EXPECT_EQ(requests[2].url, "http://api/auth/login");
    EXPECT_EQ(requests[3].url, "http://api/retrieve/j1");
}

// ============================================================
// Upload
// ============================================================

TEST_F(TransferEngineTest, OversizedUploadSendsNothing) {
    const fs::path path = make_input("huge.tif", "");
    fs::resize_file(path, 1025ull * 1024ull * 1024ull);

    auto result = engine->upload(UploadRequest{path.string(), "dt-1", "s2", "up-1"},
                                 CancelToken::create(), events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::TooLarge);
    EXPECT_EQ(result.error().user_message,
              "File too large: 1025.0 MB. Maximum allowed size is 1 GB (1024 MB).");
    EXPECT_EQ(http->request_count(), 0u);
}

TEST_F(TransferEngineTest, TiffResponseIsSaved) {
    const fs::path input = make_input("scene.tif", "input-bytes");
    http->push_response(200, "{}");  // validation ping
    http->push_response(200, "TIFF-RESULT", {{"Content-Type", "image/tiff"}});

    auto result = engine->upload(UploadRequest{input.string(), "dt-9", "sentinel2", "up-2"},
                                 CancelToken::create(), events);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    const fs::path out = result.value().local_path;
    scratch.push_back(out);
    EXPECT_EQ(out.extension(), ".tif");
    EXPECT_EQ(read_file(out), "TIFF-RESULT");
    EXPECT_EQ(result.value().datatype_id.value_or(""), "dt-9");

    EXPECT_EQ(events->percents(), (std::vector<int>{5, 10, 15, 20, 70, 85, 100}));
    EXPECT_TRUE(events->saw_status("File size: 0.0 MB"));

    const auto requests = http->requests();
    ASSERT_EQ(requests.size(), 2u);
    const auto& post = requests[1];
    EXPECT_EQ(post.method, HttpMethod::POST);
    EXPECT_EQ(post.url, "http://api/jobs/create_from_file");
    ASSERT_TRUE(post.file.has_value());
    EXPECT_EQ(post.file->field, "file");
    EXPECT_EQ(post.file->filename, "scene.tif");
    EXPECT_EQ(post.file->content_type, "image/tiff");
    ASSERT_EQ(post.query.size(), 2u);
    EXPECT_EQ(post.query[0], (std::pair<std::string, std::string>{"datatype_id", "dt-9"}));
    EXPECT_EQ(post.query[1], (std::pair<std::string, std::string>{"image_type", "sentinel2"}));
    EXPECT_EQ(post.timeout, std::chrono::seconds(6000));
}

TEST_F(TransferEngineTest, JsonErrorResponse) {
    const fs::path input = make_input("bad.tif", "input");
    http->push_response(200, "{}");
    http->push_response(422, R"({"detail":"Invalid datatype"})",
                        {{"Content-Type", "application/json"}});

    auto result = engine->upload(UploadRequest{input.string(), "dt", "s2", "up-3"},
                                 CancelToken::create(), events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::FatalServer);
    EXPECT_EQ(result.error().code, 422);
    EXPECT_EQ(result.error().user_message, "API returned error: Invalid datatype");
}

TEST_F(TransferEngineTest, NonTiffSuccessIsRawBodyError) {
    const fs::path input = make_input("odd.tif", "input");
    http->push_response(200, "{}");
    http->push_response(200, "processing queued", {{"Content-Type", "text/plain"}});

    auto result = engine->upload(UploadRequest{input.string(), "dt", "s2", "up-4"},
                                 CancelToken::create(), events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().user_message, "API returned error: processing queued");
    EXPECT_EQ(leftovers(), 0);
}

TEST_F(TransferEngineTest, UploadTimeoutMessage) {
    const fs::path input = make_input("slow.tif", "input");
    http->push_response(200, "{}");
    http->push_error(HttpErrorCode::TIMEOUT, "Operation timed out");

    auto result = engine->upload(UploadRequest{input.string(), "dt", "s2", "up-5"},
                                 CancelToken::create(), events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Timeout);
    EXPECT_EQ(result.error().user_message,
              "Upload timeout - the file may be too large or server is slow");
}

TEST_F(TransferEngineTest, UploadRejectedTokenIsTokenExpired) {
    const fs::path input = make_input("auth.tif", "input");
    http->push_response(200, "{}");
    http->push_response(401, R"({"detail":"Not authenticated"})");

    auto result = engine->upload(UploadRequest{input.string(), "dt", "s2", "up-6"},
                                 CancelToken::create(), events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::TokenExpired);
}

TEST_F(TransferEngineTest, UploadCancelledBeforeStart) {
    const fs::path input = make_input("c.tif", "input");
    auto token = CancelToken::create();
    token->request_cancel();

    auto result = engine->upload(UploadRequest{input.string(), "dt", "s2", "up-7"}, token, events);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Cancelled);
    EXPECT_EQ(result.error().user_message, "Inference cancelled");
    EXPECT_EQ(http->request_count(), 0u);
}

// ============================================================
// Helpers
// ============================================================

TEST(ContentDispositionTest, Variants) {
    EXPECT_EQ(filename_from_content_disposition("attachment; filename=\"a b.zip\"", "f.zip"),
              "a b.zip");
    EXPECT_EQ(filename_from_content_disposition("attachment; filename=out.zip; size=3", "f.zip"),
              "out.zip");
    EXPECT_EQ(filename_from_content_disposition("attachment; filename=\"../../etc/passwd\"",
                                                "f.zip"),
              "passwd");
    EXPECT_EQ(filename_from_content_disposition("attachment; filename=\"\"", "f.zip"), "f.zip");
    EXPECT_EQ(filename_from_content_disposition("attachment", "f.zip"), "f.zip");
    EXPECT_EQ(filename_from_content_disposition("", "f.zip"), "f.zip");
}

TEST(ContentTypeTest, TiffDetection) {
    EXPECT_TRUE(is_tiff_content_type("image/tiff"));
    EXPECT_TRUE(is_tiff_content_type("Image/TIF; charset=binary"));
    EXPECT_FALSE(is_tiff_content_type("application/json"));
    EXPECT_FALSE(is_tiff_content_type(""));
}
