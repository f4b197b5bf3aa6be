#pragma once

#include "content_store.hpp"
#include "file_watch.hpp"

#include <gio/gio.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace promfile {

/**
 * File Follower
 *
 * Keeps a ContentStore in step with a file on disk:
 * - reloads on every change signal of the current FileWatch
 * - re-establishes the watch whenever it ends on its own (removal,
 *   rename, repointed symlink)
 * - reloads once each time a watch is established, covering changes made
 *   while no watch was active
 * - retries every `rewatch_delay` while the path is missing
 * - starts at most one watch per `rewatch_delay` when watches keep ending
 *   right after they start (overflowing queue, flapping link)
 */
class FileFollower {
public:
    FileFollower(ContentStore& store,
                 std::string path,
                 WatchOptions options = WatchOptions(),
                 std::chrono::milliseconds rewatch_delay = std::chrono::milliseconds(1000));
    ~FileFollower();

    FileFollower(const FileFollower&) = delete;
    FileFollower& operator=(const FileFollower&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_.load(); }

    // Watches successfully established so far
    uint64_t watch_count() const { return watch_count_.load(); }

    // Reload attempts so far (successful or not)
    uint64_t reload_count() const { return reload_count_.load(); }

private:
    void follow_loop();
    void reload();

    ContentStore& store_;
    const std::string path_;
    const WatchOptions options_;
    const std::chrono::milliseconds rewatch_delay_;

    GCancellable* cancellable_;
    std::thread follow_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> watch_count_{0};
    std::atomic<uint64_t> reload_count_{0};
};

} // namespace promfile
