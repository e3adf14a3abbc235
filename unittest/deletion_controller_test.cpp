#include <gtest/gtest.h>
#include "deletion/deletion_controller.hpp"
#include "test_helpers.hpp"
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace {

// In-memory store whose removals can be made to fail per path
class MemoryFileStore : public FileStore {
public:
    explicit MemoryFileStore(const std::string& root, bool remote = false)
        : root_(root), remote_(remote) {
    }

    std::string root() const override { return root_; }
    bool isRemote() const override { return remote_; }

    bool listFiles(std::vector<FileEntry>& files) override {
        files.clear();
        for (const auto& pair : files_) {
            files.push_back({pair.first, pair.second.size()});
        }
        return true;
    }

    bool checksum(const std::string& relativePath, std::string& hex) override {
        auto it = files_.find(relativePath);
        if (it == files_.end()) {
            setLastError("missing " + relativePath);
            return false;
        }
        hex = std::to_string(std::hash<std::string>()(it->second));
        return true;
    }

    bool removeFile(const std::string& relativePath) override {
        if (failRemoval_.count(relativePath)) {
            setLastError("Failed to remove " + relativePath + ": device busy");
            return false;
        }
        return files_.erase(relativePath) > 0;
    }

    bool removeEmptyDirectories() override {
        ++cleanups_;
        return true;
    }

    std::map<std::string, std::string> files_;
    std::set<std::string> failRemoval_;
    int cleanups_{0};

private:
    std::string root_;
    bool remote_;
};

} // namespace

class DeletionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = dir_.path() / "source";
        destination_ = dir_.path() / "destination";
        writeFile(source_ / "a.txt", "alpha");
        writeFile(source_ / "sub" / "b.txt", "bravo!");
        writeFile(destination_ / "a.txt", "alpha");
        writeFile(destination_ / "sub" / "b.txt", "bravo!");
        logger_ = std::make_shared<DeletionLogger>(dir_.file("logs"), "job-1");
    }

    std::unique_ptr<DeletionController> makeController(DeletionMode mode,
                                                       VerificationMode verification = VerificationMode::SIZE) {
        auto controller = std::make_unique<DeletionController>(
            "job-1",
            std::make_shared<LocalFileStore>(source_.string()),
            std::make_shared<LocalFileStore>(destination_.string()),
            mode, verification, logger_);
        controller->setProgressThrottle(std::chrono::milliseconds(0), 1);
        controller->setProgressCallback([this](const DeletionProgress& progress) {
            std::lock_guard<std::mutex> lock(mutex_);
            reported_.push_back(progress);
        });
        return controller;
    }

    std::vector<DeletionPhase> reportedPhases() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DeletionPhase> phases;
        for (const auto& progress : reported_) {
            if (phases.empty() || phases.back() != progress.phase) {
                phases.push_back(progress.phase);
            }
        }
        return phases;
    }

    TempDir dir_;
    fs::path source_;
    fs::path destination_;
    std::shared_ptr<DeletionLogger> logger_;
    std::vector<DeletionProgress> reported_;
    std::mutex mutex_;
};

TEST_F(DeletionControllerTest, VerifiedSourcesAreRemoved) {
    auto controller = makeController(DeletionMode::VERIFY_THEN_DELETE);

    Result result = controller->verifyThenDelete();
    ASSERT_TRUE(result) << result.message();

    DeletionProgress progress = controller->getProgress();
    EXPECT_EQ(progress.phase, DeletionPhase::COMPLETED);
    EXPECT_EQ(progress.filesDeleted, 2u);
    EXPECT_EQ(progress.bytesDeleted, 11u);
    EXPECT_EQ(progress.errors, 0u);

    EXPECT_FALSE(fs::exists(source_ / "a.txt"));
    EXPECT_FALSE(fs::exists(source_ / "sub"));
    EXPECT_TRUE(fs::exists(source_));
    EXPECT_TRUE(fs::exists(destination_ / "sub" / "b.txt"));

    EXPECT_EQ(logger_->getDeletionCount(), 2u);
    std::string log = readFile(logger_->getLogPath());
    EXPECT_NE(log.find("VERIFICATION PASSED"), std::string::npos);
    EXPECT_NE(log.find("DELETION COMPLETED"), std::string::npos);

    EXPECT_EQ(reportedPhases(), (std::vector<DeletionPhase>{
        DeletionPhase::VERIFYING, DeletionPhase::DELETING, DeletionPhase::COMPLETED}));
}

TEST_F(DeletionControllerTest, SizeMismatchBlocksAllDeletion) {
    writeFile(destination_ / "sub" / "b.txt", "bra");
    auto controller = makeController(DeletionMode::VERIFY_THEN_DELETE);

    Result result = controller->verifyThenDelete();
    EXPECT_FALSE(result);
    EXPECT_EQ(result.code(), ErrorCode::VERIFICATION);

    DeletionProgress progress = controller->getProgress();
    EXPECT_EQ(progress.phase, DeletionPhase::FAILED);
    EXPECT_EQ(progress.filesDeleted, 0u);
    EXPECT_EQ(progress.errors, 1u);
    EXPECT_NE(progress.lastError.find("1 of 2"), std::string::npos);

    EXPECT_TRUE(fs::exists(source_ / "a.txt"));
    EXPECT_TRUE(fs::exists(source_ / "sub" / "b.txt"));
    EXPECT_EQ(logger_->getDeletionCount(), 0u);
    EXPECT_NE(readFile(logger_->getLogPath()).find("MISMATCH: sub/b.txt"), std::string::npos);
}

TEST_F(DeletionControllerTest, MissingDestinationFileBlocksDeletion) {
    fs::remove(destination_ / "a.txt");
    auto controller = makeController(DeletionMode::VERIFY_THEN_DELETE);

    EXPECT_FALSE(controller->verifyThenDelete());
    EXPECT_TRUE(fs::exists(source_ / "sub" / "b.txt"));
    EXPECT_NE(readFile(logger_->getLogPath()).find("missing in destination"), std::string::npos);
}

TEST_F(DeletionControllerTest, ChecksumModeCatchesSameSizeDifferences) {
    writeFile(destination_ / "a.txt", "alphA");

    auto sizeOnly = makeController(DeletionMode::VERIFY_THEN_DELETE, VerificationMode::SIZE);
    auto checksum = makeController(DeletionMode::VERIFY_THEN_DELETE, VerificationMode::CHECKSUM);

    Result result = checksum->verifyThenDelete();
    EXPECT_EQ(result.code(), ErrorCode::VERIFICATION);
    EXPECT_TRUE(fs::exists(source_ / "a.txt"));

    EXPECT_TRUE(sizeOnly->verifyThenDelete());
    EXPECT_FALSE(fs::exists(source_ / "a.txt"));
}

TEST_F(DeletionControllerTest, RemovalErrorsAreCounted) {
    auto source = std::make_shared<MemoryFileStore>("remote:src", true);
    auto destination = std::make_shared<MemoryFileStore>("remote:dst", true);
    source->files_ = {{"a", "1"}, {"b", "22"}, {"c", "333"}};
    destination->files_ = source->files_;
    source->failRemoval_.insert("b");

    DeletionController controller("job-2", source, destination, DeletionMode::VERIFY_THEN_DELETE,
                                  VerificationMode::CHECKSUM, logger_);
    Result result = controller.verifyThenDelete();
    EXPECT_EQ(result.code(), ErrorCode::VERIFICATION);
    EXPECT_NE(result.message().find("1 files could not be removed"), std::string::npos);

    DeletionProgress progress = controller.getProgress();
    EXPECT_EQ(progress.filesDeleted, 2u);
    EXPECT_EQ(progress.bytesDeleted, 4u);
    EXPECT_EQ(progress.errors, 1u);
    EXPECT_EQ(source->files_.size(), 1u);
    EXPECT_EQ(source->cleanups_, 1);
}

TEST_F(DeletionControllerTest, CancelStopsBeforeDeleting) {
    auto controller = makeController(DeletionMode::VERIFY_THEN_DELETE);
    controller->cancel();

    Result result = controller->verifyThenDelete();
    EXPECT_EQ(result.code(), ErrorCode::CONCURRENCY);
    EXPECT_TRUE(fs::exists(source_ / "a.txt"));
    EXPECT_EQ(controller->getProgress().phase, DeletionPhase::FAILED);
}

TEST_F(DeletionControllerTest, WrongModeIsRejected) {
    auto perFile = makeController(DeletionMode::PER_FILE);
    EXPECT_EQ(perFile->verifyThenDelete().code(), ErrorCode::VALIDATION);

    auto verify = makeController(DeletionMode::VERIFY_THEN_DELETE);
    EXPECT_EQ(verify->beginPerFile().code(), ErrorCode::VALIDATION);
}

TEST_F(DeletionControllerTest, PerFileAccountsReportedRemovals) {
    auto controller = makeController(DeletionMode::PER_FILE);
    ASSERT_TRUE(controller->beginPerFile());
    EXPECT_EQ(controller->getProgress().phase, DeletionPhase::TRANSFERRING);

    controller->recordRemoval("sub/b.txt");
    controller->recordRemoval("unknown.bin");

    DeletionProgress progress = controller->getProgress();
    EXPECT_EQ(progress.filesDeleted, 2u);
    EXPECT_EQ(progress.bytesDeleted, 6u);

    ASSERT_TRUE(controller->finishPerFile(true));
    EXPECT_EQ(controller->getProgress().phase, DeletionPhase::COMPLETED);
    EXPECT_EQ(logger_->getDeletionCount(), 2u);
}

TEST_F(DeletionControllerTest, PerFileFailureKeepsCounts) {
    DeletionProgress carried;
    carried.phase = DeletionPhase::TRANSFERRING;
    carried.filesDeleted = 5;
    carried.bytesDeleted = 500;
    carried.lastError = "old";

    DeletionController controller("job-1",
        std::make_shared<LocalFileStore>(source_.string()),
        std::make_shared<LocalFileStore>(destination_.string()),
        DeletionMode::PER_FILE, VerificationMode::SIZE, logger_, carried);
    EXPECT_TRUE(controller.getProgress().lastError.empty());

    ASSERT_TRUE(controller.beginPerFile());
    controller.recordRemoval("a.txt");

    Result result = controller.finishPerFile(false);
    EXPECT_EQ(result.code(), ErrorCode::FATAL_ENGINE);

    DeletionProgress progress = controller.getProgress();
    EXPECT_EQ(progress.phase, DeletionPhase::FAILED);
    EXPECT_EQ(progress.filesDeleted, 6u);
    EXPECT_EQ(progress.bytesDeleted, 505u);
}

TEST_F(DeletionControllerTest, PerFileCleansRemoteSourceDirectories) {
    auto source = std::make_shared<MemoryFileStore>("remote:src", true);
    auto destination = std::make_shared<MemoryFileStore>("remote:dst", true);
    source->files_["x/y.txt"] = "remote data";
    DeletionController controller("job-3", source, destination, DeletionMode::PER_FILE,
                                  VerificationMode::SIZE, logger_);

    ASSERT_TRUE(controller.beginPerFile());
    controller.recordRemoval("x/y.txt");
    ASSERT_TRUE(controller.finishPerFile(true));
    EXPECT_EQ(source->cleanups_, 1);
    EXPECT_EQ(controller.getProgress().filesDeleted, 1u);
    EXPECT_EQ(controller.getProgress().bytesDeleted, 11u);
    EXPECT_NE(readFile(logger_->getLogPath()).find("DELETED: remote:src/x/y.txt"), std::string::npos);
}

TEST(LocalFileStoreTest, ListsAndHashesFiles) {
    TempDir dir;
    writeFile(dir.path() / "data" / "abc.txt", "abc");
    writeFile(dir.path() / "data" / "nested" / "deep" / "z.bin", "");

    LocalFileStore store(dir.file("data"));
    std::vector<FileEntry> files;
    ASSERT_TRUE(store.listFiles(files));
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].relativePath, "abc.txt");
    EXPECT_EQ(files[0].size, 3u);
    EXPECT_EQ(files[1].relativePath, "nested/deep/z.bin");

    std::string hex;
    ASSERT_TRUE(store.checksum("abc.txt", hex));
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_FALSE(store.checksum("missing.txt", hex));

    ASSERT_TRUE(store.removeFile("nested/deep/z.bin"));
    ASSERT_TRUE(store.removeEmptyDirectories());
    EXPECT_FALSE(fs::exists(dir.path() / "data" / "nested"));
    EXPECT_TRUE(fs::exists(dir.path() / "data"));
    EXPECT_FALSE(store.removeFile("nested/deep/z.bin"));
}

TEST(LocalFileStoreTest, SingleFileRoot) {
    TempDir dir;
    writeFile(dir.path() / "report.pdf", "12345");

    LocalFileStore store(dir.file("report.pdf"));
    std::vector<FileEntry> files;
    ASSERT_TRUE(store.listFiles(files));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].relativePath, "report.pdf");
    EXPECT_EQ(files[0].size, 5u);

    LocalFileStore missing(dir.file("nothing"));
    EXPECT_FALSE(missing.listFiles(files));
}

class RcloneFileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        calls_ = dir_.file("calls.log");
        binary_ = writeScript(dir_.path() / "fake-rclone",
            "case \"$1\" in\n"
            "  lsjson)\n"
            "    for arg in \"$@\"; do\n"
            "      if [ \"$arg\" = \"--hash\" ]; then\n"
            "        echo '[{\"Path\":\"a.txt\",\"Size\":5,\"Hashes\":{\"sha256\":\"ABCDEF\"}}]'\n"
            "        exit 0\n"
            "      fi\n"
            "    done\n"
            "    echo 'NOTICE: listing remote' >&2\n"
            "    echo '[{\"Path\":\"a.txt\",\"Size\":5},'\n"
            "    echo ' {\"Path\":\"d/b.txt\",\"Size\":-1}]'\n"
            "    exit 0;;\n"
            "  deletefile)\n"
            "    echo \"deletefile $2\" >> '" + calls_ + "'\n"
            "    case \"$2\" in *locked*) echo 'ERROR : permission denied'; exit 4;; esac\n"
            "    exit 0;;\n"
            "  rmdirs)\n"
            "    echo \"rmdirs $2 $3\" >> '" + calls_ + "'\n"
            "    exit 0;;\n"
            "esac\n"
            "exit 1\n");
    }

    TempDir dir_;
    std::string calls_;
    std::string binary_;
};

TEST_F(RcloneFileStoreTest, ListsRemoteFiles) {
    RcloneFileStore store(binary_, "gdrive:photos");
    EXPECT_TRUE(store.isRemote());

    std::vector<FileEntry> files;
    ASSERT_TRUE(store.listFiles(files)) << store.getLastError();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].relativePath, "a.txt");
    EXPECT_EQ(files[0].size, 5u);
    EXPECT_EQ(files[1].relativePath, "d/b.txt");
    EXPECT_EQ(files[1].size, 0u);
}

TEST_F(RcloneFileStoreTest, ReadsSha256FromHashListing) {
    RcloneFileStore store(binary_, "gdrive:photos");
    std::string hex;
    ASSERT_TRUE(store.checksum("a.txt", hex)) << store.getLastError();
    EXPECT_EQ(hex, "abcdef");
    EXPECT_FALSE(store.checksum("d/b.txt", hex));
    EXPECT_NE(store.getLastError().find("gdrive:photos/d/b.txt"), std::string::npos);
}

TEST_F(RcloneFileStoreTest, RemovesFilesAndDirectories) {
    RcloneFileStore store(binary_, "gdrive:");
    EXPECT_TRUE(store.removeFile("a.txt"));
    EXPECT_FALSE(store.removeFile("locked.txt"));
    EXPECT_NE(store.getLastError().find("exited with code 4"), std::string::npos);
    EXPECT_TRUE(store.removeEmptyDirectories());

    std::string calls = readFile(calls_);
    EXPECT_NE(calls.find("deletefile gdrive:a.txt"), std::string::npos);
    EXPECT_NE(calls.find("rmdirs gdrive: --leave-root"), std::string::npos);
}

TEST_F(RcloneFileStoreTest, MissingBinaryIsReported) {
    RcloneFileStore store(dir_.file("no-rclone"), "gdrive:photos");
    std::vector<FileEntry> files;
    EXPECT_FALSE(store.listFiles(files));
    EXPECT_FALSE(store.getLastError().empty());
}
