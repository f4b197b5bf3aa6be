#include "content_store.hpp"
#include "crypto.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>

namespace promfile {

bool ContentStore::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::error("[ContentStore] Failed to open " + path + ": " + std::string(strerror(errno)));
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        Logger::error("[ContentStore] Failed to read " + path);
        return false;
    }

    std::string data = buffer.str();
    // Only a very basic check: the file must not be empty
    if (data.empty()) {
        Logger::error("[ContentStore] " + path + " is empty, keeping previous content");
        return false;
    }

    std::string digest = crypto::sha256_hex(data);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (content_ && !digest.empty() && digest == digest_) {
        Logger::debug("[ContentStore] " + path + " unchanged (" + digest.substr(0, 12) + ")");
        return true;
    }

    content_ = std::make_shared<const std::string>(std::move(data));
    digest_ = digest;
    ++generation_;

    Logger::info("[ContentStore] Loaded " + std::to_string(content_->size()) + " bytes from " + path +
                 " (generation " + std::to_string(generation_) + ")");
    return true;
}

ContentStore::Snapshot ContentStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Snapshot snap;
    snap.data = content_;
    snap.digest = digest_;
    snap.generation = generation_;
    return snap;
}

bool ContentStore::has_content() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return content_ != nullptr;
}

} // namespace promfile
