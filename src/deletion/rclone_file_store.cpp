#include "deletion/file_store.hpp"
#include "transfer/child_process.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Log lines rclone writes to stderr share the pipe with the JSON listing
std::string listingText(const std::string& output) {
    auto begin = output.find('[');
    auto end = output.rfind(']');
    if (begin == std::string::npos || end == std::string::npos || end < begin) {
        return output;
    }
    return output.substr(begin, end - begin + 1);
}

} // namespace

RcloneFileStore::RcloneFileStore(const std::string& binary, const std::string& root)
    : binary_(binary.empty() ? "rclone" : binary)
    , root_(root) {
}

std::string RcloneFileStore::remotePath(const std::string& relativePath) const {
    if (relativePath.empty()) {
        return root_;
    }
    if (!root_.empty() && (root_.back() == ':' || root_.back() == '/')) {
        return root_ + relativePath;
    }
    return root_ + "/" + relativePath;
}

bool RcloneFileStore::runCommand(const std::vector<std::string>& args, std::string& output) {
    std::vector<std::string> command = {binary_};
    command.insert(command.end(), args.begin(), args.end());
    Logger::debug("Running " + utils::joinCommand(command));

    ChildProcess process;
    if (!process.spawn(command)) {
        setLastError(process.getLastError());
        return false;
    }

    output.clear();
    std::string line;
    while (process.readLine(line)) {
        output += line;
        output += '\n';
    }

    int exitCode = process.wait();
    if (exitCode != 0) {
        std::string detail = output.size() > 512 ? output.substr(output.size() - 512) : output;
        setLastError(utils::joinCommand(command) + " exited with code " +
                     std::to_string(exitCode) + ": " + detail);
        return false;
    }
    return true;
}

bool RcloneFileStore::listFiles(std::vector<FileEntry>& files) {
    files.clear();
    std::string output;
    if (!runCommand({"lsjson", "--recursive", "--files-only", root_}, output)) {
        return false;
    }

    try {
        json listing = json::parse(listingText(output));
        for (const auto& item : listing) {
            FileEntry entry;
            entry.relativePath = item.at("Path").get<std::string>();
            int64_t size = item.value("Size", static_cast<int64_t>(-1));
            entry.size = size < 0 ? 0 : static_cast<uint64_t>(size);
            files.push_back(entry);
        }
    } catch (const json::exception& e) {
        setLastError(std::string("Failed to parse rclone listing of ") + root_ + ": " + e.what());
        return false;
    }
    return true;
}

bool RcloneFileStore::loadHashes() {
    std::string output;
    if (!runCommand({"lsjson", "--recursive", "--files-only", "--hash", "--hash-type", "SHA256", root_},
                    output)) {
        return false;
    }

    try {
        json listing = json::parse(listingText(output));
        hashes_.clear();
        for (const auto& item : listing) {
            if (!item.contains("Hashes")) {
                continue;
            }
            const auto& hashes = item.at("Hashes");
            auto it = hashes.find("sha256");
            if (it != hashes.end()) {
                hashes_[item.at("Path").get<std::string>()] = utils::toLower(it->get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        setLastError(std::string("Failed to parse rclone hash listing of ") + root_ + ": " + e.what());
        return false;
    }
    hashesLoaded_ = true;
    return true;
}

bool RcloneFileStore::checksum(const std::string& relativePath, std::string& hex) {
    if (!hashesLoaded_ && !loadHashes()) {
        return false;
    }
    auto it = hashes_.find(relativePath);
    if (it == hashes_.end()) {
        setLastError("No SHA-256 available for " + remotePath(relativePath));
        return false;
    }
    hex = it->second;
    return true;
}

bool RcloneFileStore::removeFile(const std::string& relativePath) {
    std::string output;
    return runCommand({"deletefile", remotePath(relativePath)}, output);
}

bool RcloneFileStore::removeEmptyDirectories() {
    std::string output;
    return runCommand({"rmdirs", root_, "--leave-root"}, output);
}
