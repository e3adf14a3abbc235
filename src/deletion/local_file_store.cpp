#include "deletion/file_store.hpp"
#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace fs = std::filesystem;

LocalFileStore::LocalFileStore(const std::string& root)
    : root_(root) {
}

bool LocalFileStore::listFiles(std::vector<FileEntry>& files) {
    files.clear();
    std::error_code ec;
    fs::path base(root_);

    if (fs::is_regular_file(base, ec)) {
        files.push_back({base.filename().string(), fs::file_size(base, ec)});
        return !ec;
    }
    if (!fs::is_directory(base, ec)) {
        setLastError("Not a directory: " + root_);
        return false;
    }

    try {
        for (fs::recursive_directory_iterator it(base), end; it != end; ++it) {
            if (!it->is_regular_file()) {
                continue;
            }
            files.push_back({fs::relative(it->path(), base).generic_string(), it->file_size()});
        }
    } catch (const fs::filesystem_error& e) {
        setLastError(std::string("Failed to list ") + root_ + ": " + e.what());
        return false;
    }

    std::sort(files.begin(), files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.relativePath < b.relativePath; });
    return true;
}

bool LocalFileStore::checksum(const std::string& relativePath, std::string& hex) {
    std::error_code ec;
    fs::path path = fs::is_regular_file(root_, ec) ? fs::path(root_) : fs::path(root_) / relativePath;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        setLastError("Failed to open " + path.string());
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        setLastError("Failed to create OpenSSL context");
        return false;
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        setLastError("Failed to initialize digest");
        return false;
    }

    char buffer[65536];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
                EVP_MD_CTX_free(ctx);
                setLastError("Failed to update digest");
                return false;
            }
        }
    }
    if (file.bad()) {
        EVP_MD_CTX_free(ctx);
        setLastError("Read error on " + path.string());
        return false;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        setLastError("Failed to finalize digest");
        return false;
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    hex = ss.str();
    return true;
}

bool LocalFileStore::removeFile(const std::string& relativePath) {
    std::error_code ec;
    fs::path path = fs::is_regular_file(root_, ec) ? fs::path(root_) : fs::path(root_) / relativePath;
    if (!fs::remove(path, ec)) {
        setLastError("Failed to remove " + path.string() + ": " +
                     (ec ? ec.message() : std::string("file not found")));
        return false;
    }
    return true;
}

bool LocalFileStore::removeEmptyDirectories() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return true;
    }

    std::vector<fs::path> directories;
    try {
        for (fs::recursive_directory_iterator it(root_), end; it != end; ++it) {
            if (it->is_directory() && !it->is_symlink()) {
                directories.push_back(it->path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        setLastError(std::string("Failed to scan ") + root_ + ": " + e.what());
        return false;
    }

    // Deepest first so parents become empty before they are checked
    std::sort(directories.begin(), directories.end(),
              [](const fs::path& a, const fs::path& b) { return a.string().size() > b.string().size(); });
    bool ok = true;
    for (const auto& dir : directories) {
        if (fs::is_empty(dir, ec) && !ec) {
            if (!fs::remove(dir, ec)) {
                setLastError("Failed to remove directory " + dir.string() + ": " + ec.message());
                ok = false;
            }
        }
    }
    return ok;
}
