#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

namespace promfile {

/**
 * Last valid copy of the served file.
 *
 * Written by the follower thread, read by HTTP worker threads. A failed
 * load (unreadable or empty file) keeps the previous content.
 */
class ContentStore {
public:
    struct Snapshot {
        std::shared_ptr<const std::string> data;   // null until the first successful load
        std::string digest;                        // SHA-256 hex of data
        uint64_t generation = 0;                   // bumped each time the bytes change
    };

    // Reads `path` fully; returns false and keeps the old content on failure
    bool load(const std::string& path);

    Snapshot snapshot() const;
    bool has_content() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const std::string> content_;
    std::string digest_;
    uint64_t generation_ = 0;
};

} // namespace promfile
