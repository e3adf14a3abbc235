#include <gtest/gtest.h>
#include "common/job.hpp"
#include "common/result.hpp"
#include "common/utils.hpp"
#include "common/thread_utils.hpp"
#include <set>

using json = nlohmann::json;

class JobTest : public ::testing::Test {
protected:
    void SetUp() override {
        job_.id = "job-1";
        job_.name = "photos";
        job_.source = "/data/photos";
        job_.destination = "backup:photos";
        job_.kind = JobKind::RCLONE;
        job_.status = JobStatus::RUNNING;
        job_.settings.bandwidthLimitKbps = 2048;
        job_.settings.deleteSourceAfter = true;
        job_.settings.deletionMode = DeletionMode::PER_FILE;
        job_.settings.deletionConfirmed = true;
        job_.progress.bytesTransferred = 500;
        job_.progress.percent = 50;
        job_.progress.deletion.phase = DeletionPhase::TRANSFERRING;
        job_.progress.deletion.filesDeleted = 3;
        job_.revision = 7;
    }

    Job job_;
};

TEST_F(JobTest, SerializesWithPersistedFieldNames) {
    json j = job_;
    EXPECT_EQ(j.at("dest"), "backup:photos");
    EXPECT_EQ(j.at("type"), "rclone");
    EXPECT_EQ(j.at("status"), "running");
    EXPECT_EQ(j.at("settings").at("deletion_mode"), "per_file");
    EXPECT_EQ(j.at("settings").at("bandwidth_limit_kbps"), 2048);
    EXPECT_TRUE(j.at("progress").at("total_bytes").is_null());
    EXPECT_EQ(j.at("progress").at("deletion").at("phase"), "transferring");
}

TEST_F(JobTest, DeserializesWhatItSerializes) {
    job_.progress.totalBytes = 1000;
    json j = job_;
    Job loaded = j.get<Job>();

    EXPECT_EQ(loaded.id, job_.id);
    EXPECT_EQ(loaded.kind, JobKind::RCLONE);
    EXPECT_EQ(loaded.status, JobStatus::RUNNING);
    ASSERT_TRUE(loaded.progress.totalBytes.has_value());
    EXPECT_EQ(*loaded.progress.totalBytes, 1000u);
    EXPECT_EQ(loaded.progress.deletion.filesDeleted, 3u);
    EXPECT_EQ(loaded.revision, 7u);
    ASSERT_TRUE(loaded.settings.bandwidthLimitKbps.has_value());
    EXPECT_EQ(*loaded.settings.bandwidthLimitKbps, 2048u);
}

TEST_F(JobTest, MissingOptionalFieldsTakeDefaults) {
    json j = {{"id", "x"}, {"name", "n"}, {"source", "/a"}, {"dest", "/b"}};
    Job loaded = j.get<Job>();
    EXPECT_EQ(loaded.kind, JobKind::RSYNC);
    EXPECT_EQ(loaded.status, JobStatus::PENDING);
    EXPECT_FALSE(loaded.settings.bandwidthLimitKbps.has_value());
    EXPECT_FALSE(loaded.progress.totalBytes.has_value());
    EXPECT_EQ(loaded.progress.deletion.phase, DeletionPhase::NONE);
}

TEST_F(JobTest, RejectsUnknownEnumValues) {
    json j = job_;
    j["status"] = "exploded";
    EXPECT_THROW(j.get<Job>(), std::invalid_argument);

    json k = job_;
    k.erase("source");
    EXPECT_THROW(k.get<Job>(), json::exception);
}

TEST_F(JobTest, TouchBumpsRevision) {
    job_.updatedAt.clear();
    job_.touch();
    EXPECT_EQ(job_.revision, 8u);
    EXPECT_FALSE(job_.updatedAt.empty());
}

TEST_F(JobTest, DeletionHelpers) {
    EXPECT_TRUE(job_.usesMoveMode());
    EXPECT_FALSE(job_.isDeleting());

    job_.settings.deletionMode = DeletionMode::VERIFY_THEN_DELETE;
    EXPECT_FALSE(job_.usesMoveMode());

    job_.progress.deletion.phase = DeletionPhase::VERIFYING;
    EXPECT_TRUE(job_.isDeleting());
    job_.progress.deletion.phase = DeletionPhase::DELETING;
    EXPECT_TRUE(job_.isDeleting());
    job_.progress.deletion.phase = DeletionPhase::FAILED;
    EXPECT_FALSE(job_.isDeleting());
}

TEST(JobIdTest, GeneratesDistinctIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(generateJobId());
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(EnumTextTest, ParsesPersistedNames) {
    DeletionMode mode;
    EXPECT_TRUE(parseDeletionMode("verify_then_delete", mode));
    EXPECT_EQ(mode, DeletionMode::VERIFY_THEN_DELETE);
    EXPECT_FALSE(parseDeletionMode("verify-then-delete", mode));

    JobKind kind;
    EXPECT_TRUE(parseJobKind("rsync", kind));
    EXPECT_FALSE(parseJobKind("scp", kind));
}

TEST(ResultTest, CarriesCodeAndMessage) {
    Result ok = Result::success("done");
    EXPECT_TRUE(ok);
    EXPECT_EQ(ok.message(), "done");

    Result failed = Result::failure(ErrorCode::NOT_FOUND, "missing");
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(toString(failed.code()), "not_found");
}

TEST(UtilsTest, RecognisesRemotePaths) {
    EXPECT_TRUE(utils::isRemotePath("gdrive:backup"));
    EXPECT_TRUE(utils::isRemotePath("s3:bucket/dir"));
    EXPECT_FALSE(utils::isRemotePath("/data/photos"));
    EXPECT_FALSE(utils::isRemotePath("./local:odd"));
    EXPECT_FALSE(utils::isRemotePath("C:\\Users"));
    EXPECT_FALSE(utils::isRemotePath("dir/with:colon"));
    EXPECT_FALSE(utils::isRemotePath(""));
}

TEST(UtilsTest, FormatsBytes) {
    EXPECT_EQ(utils::formatBytes(512), "512 B");
    EXPECT_EQ(utils::formatBytes(1536), "1.50 KB");
    EXPECT_EQ(utils::formatBytes(1024ULL * 1024 * 1024), "1.00 GB");
}

TEST(UtilsTest, ParsesUnsignedStrictly) {
    uint64_t value = 7;
    EXPECT_TRUE(utils::parseUnsigned("2048", value));
    EXPECT_EQ(value, 2048u);
    EXPECT_TRUE(utils::parseUnsigned("18446744073709551615", value));
    EXPECT_EQ(value, UINT64_MAX);

    value = 7;
    EXPECT_FALSE(utils::parseUnsigned("-5", value));
    EXPECT_FALSE(utils::parseUnsigned("+5", value));
    EXPECT_FALSE(utils::parseUnsigned(" 5", value));
    EXPECT_FALSE(utils::parseUnsigned("5k", value));
    EXPECT_FALSE(utils::parseUnsigned("", value));
    EXPECT_FALSE(utils::parseUnsigned("18446744073709551616", value));
    EXPECT_EQ(value, 7u);
}

TEST(ThreadUtilsTest, BackoffDoublesUpToCap) {
    using std::chrono::milliseconds;
    EXPECT_EQ(ThreadUtils::backoffDelay(0, milliseconds(100), milliseconds(1000)), milliseconds(100));
    EXPECT_EQ(ThreadUtils::backoffDelay(2, milliseconds(100), milliseconds(1000)), milliseconds(400));
    EXPECT_EQ(ThreadUtils::backoffDelay(10, milliseconds(100), milliseconds(1000)), milliseconds(1000));
}
