#include <gtest/gtest.h>

#include "core/transfer_task.h"
#include "support/fakes.h"

using namespace ermes::core;
using namespace ermes::test_support;

class TransferTaskTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeJobApi> api = std::make_shared<FakeJobApi>();
  std::shared_ptr<FakeTransferEngine> engine = std::make_shared<FakeTransferEngine>();
  std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();
  TransferTask task{engine, api, events};
};

TEST_F(TransferTaskTest, DownloadUsesDatatypeFromJobDetail) {
  auto job = make_job("job-1", JobStatus::End, 200, "ok", true);
  job.datatype_id = "dt-3";
  api->push_job(job);

  auto result = task.download_job("job-1", CancelToken::create());

  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(engine->downloads.size(), 1u);
  EXPECT_EQ(engine->downloads[0].datatype_id.value_or(""), "dt-3");
  ASSERT_EQ(events->completed.size(), 1u);
  EXPECT_EQ(events->completed_datatypes[0].value_or(""), "dt-3");
  EXPECT_TRUE(events->failed.empty());
  ASSERT_FALSE(events->statuses.empty());
  EXPECT_EQ(events->statuses.back().first, "Download completed for job job-1!");
  EXPECT_EQ(events->statuses.back().second, StatusLevel::Success);
}

TEST_F(TransferTaskTest, DownloadDetailFailureSkipsEngine) {
  api->push_fetch_error(JobError::FatalServer(404, "Job not found"));

  auto result = task.download_job("job-2", CancelToken::create());

  ASSERT_TRUE(result.is_err());
  EXPECT_TRUE(engine->downloads.empty());
  ASSERT_EQ(events->failed.size(), 1u);
  EXPECT_EQ(events->failed[0], "Job not found");
  EXPECT_EQ(events->statuses.back().second, StatusLevel::Error);
}

TEST_F(TransferTaskTest, CancelledDownloadReportsOnce) {
  auto token = CancelToken::create();
  token->request_cancel();

  auto result = task.download_job("job-3", token);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::Cancelled);
  EXPECT_EQ(api->fetch_calls(), 0);
  ASSERT_EQ(events->failed.size(), 1u);
  EXPECT_EQ(events->failed[0], "Download cancelled");
  EXPECT_EQ(events->terminal_count(), 1);
}

TEST_F(TransferTaskTest, UploadSuccess) {
  UploadRequest request{"/data/scene.tif", "dt-1", "sentinel2", "scene.tif"};

  auto result = task.upload_file(request, CancelToken::create());

  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(engine->uploads.size(), 1u);
  EXPECT_EQ(engine->uploads[0].image_type, "sentinel2");
  ASSERT_EQ(events->completed.size(), 1u);
  EXPECT_EQ(events->completed[0], "/tmp/result.tif");
  EXPECT_EQ(events->statuses.back().first, "Inference completed successfully!");
}

TEST_F(TransferTaskTest, UploadCancelledMessage) {
  engine->upload_outcome = FakeTransferEngine::Outcome::Err(JobError::Cancelled());
  UploadRequest request{"/data/scene.tif", "dt-1", "sentinel2", ""};

  auto result = task.upload_file(request, CancelToken::create());

  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(events->failed.size(), 1u);
  EXPECT_EQ(events->failed[0], "Inference cancelled");
  EXPECT_TRUE(events->completed.empty());
}

TEST_F(TransferTaskTest, UploadTooLargeKeepsEngineMessage) {
  engine->upload_outcome = FakeTransferEngine::Outcome::Err(
      JobError::TooLarge("File too large: 1025.0 MB. Maximum allowed size is 1 GB (1024 MB)."));
  UploadRequest request{"/data/huge.tif", "dt-1", "sentinel2", ""};

  auto result = task.upload_file(request, nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::TooLarge);
  ASSERT_EQ(events->failed.size(), 1u);
  EXPECT_EQ(events->failed[0].rfind("File too large", 0), 0u);
}
