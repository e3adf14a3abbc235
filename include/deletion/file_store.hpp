#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <cstdint>

struct FileEntry {
    std::string relativePath;
    uint64_t size{0};
};

// One side of a transfer as seen by the deletion workflow. Paths are
// relative to root() and use '/' separators.
class FileStore {
public:
    virtual ~FileStore() = default;

    virtual std::string root() const = 0;
    virtual bool isRemote() const = 0;

    // Regular files below root, recursively
    virtual bool listFiles(std::vector<FileEntry>& files) = 0;
    // Lowercase hex SHA-256
    virtual bool checksum(const std::string& relativePath, std::string& hex) = 0;
    virtual bool removeFile(const std::string& relativePath) = 0;
    // Removes empty directories below root, keeping root itself
    virtual bool removeEmptyDirectories() = 0;

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(errorMutex_);
        return lastError_;
    }

protected:
    void setLastError(const std::string& error) {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = error;
    }

private:
    std::string lastError_;
    mutable std::mutex errorMutex_;
};

class LocalFileStore : public FileStore {
public:
    explicit LocalFileStore(const std::string& root);

    std::string root() const override { return root_; }
    bool isRemote() const override { return false; }

    bool listFiles(std::vector<FileEntry>& files) override;
    bool checksum(const std::string& relativePath, std::string& hex) override;
    bool removeFile(const std::string& relativePath) override;
    bool removeEmptyDirectories() override;

private:
    std::string root_;
};

// Remote side driven through the rclone command line
class RcloneFileStore : public FileStore {
public:
    RcloneFileStore(const std::string& binary, const std::string& root);

    std::string root() const override { return root_; }
    bool isRemote() const override { return true; }

    bool listFiles(std::vector<FileEntry>& files) override;
    bool checksum(const std::string& relativePath, std::string& hex) override;
    bool removeFile(const std::string& relativePath) override;
    bool removeEmptyDirectories() override;

private:
    bool runCommand(const std::vector<std::string>& args, std::string& output);
    bool loadHashes();
    std::string remotePath(const std::string& relativePath) const;

    std::string binary_;
    std::string root_;
    bool hashesLoaded_{false};
    std::map<std::string, std::string> hashes_;
};
