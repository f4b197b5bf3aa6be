#include "file_follower.hpp"
#include "logger.hpp"
#include "signal_channel.hpp"

#include <chrono>
#include <system_error>

namespace promfile {

FileFollower::FileFollower(ContentStore& store,
                           std::string path,
                           WatchOptions options,
                           std::chrono::milliseconds rewatch_delay)
    : store_(store)
    , path_(std::move(path))
    , options_(options)
    , rewatch_delay_(rewatch_delay)
    , cancellable_(g_cancellable_new()) {
}

FileFollower::~FileFollower() {
    stop();
    g_object_unref(cancellable_);
}

bool FileFollower::start() {
    if (running_.load()) {
        return true;
    }
    if (g_cancellable_is_cancelled(cancellable_)) {
        g_cancellable_reset(cancellable_);
    }

    running_.store(true);
    try {
        follow_thread_ = std::thread(&FileFollower::follow_loop, this);
    } catch (const std::system_error& e) {
        Logger::error("[Follower] Failed to create follow thread: " + std::string(e.what()));
        running_.store(false);
        return false;
    }

    Logger::info("[Follower] Following " + path_);
    return true;
}

void FileFollower::stop() {
    g_cancellable_cancel(cancellable_);
    if (follow_thread_.joinable()) {
        follow_thread_.join();
    }
}

void FileFollower::reload() {
    reload_count_++;
    if (!store_.load(path_)) {
        Logger::warn("[Follower] Reload of " + path_ + " failed, still serving previous content");
    }
}

void FileFollower::follow_loop() {
    while (!g_cancellable_is_cancelled(cancellable_)) {
        GError* error = nullptr;
        auto watch = FileWatch::watch(cancellable_, path_, &error, options_);
        if (!watch) {
            Logger::warn("[Follower] Cannot watch " + path_ + ": " +
                         std::string(error ? error->message : "unknown error") +
                         ", retrying in " + std::to_string(rewatch_delay_.count()) + "ms");
            g_clear_error(&error);
            if (wait_for_cancel(cancellable_, rewatch_delay_)) {
                break;
            }
            continue;
        }

        // The file may have changed while no watch was active
        const auto established = std::chrono::steady_clock::now();
        watch_count_++;
        reload();

        while (watch->next()) {
            reload();
        }
        watch.reset();

        if (g_cancellable_is_cancelled(cancellable_)) {
            break;
        }

        // At most one watch per rewatch_delay_ when watches keep ending at once
        auto lifetime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - established);
        if (lifetime < rewatch_delay_) {
            Logger::info("[Follower] Watch on " + path_ + " ended after " + std::to_string(lifetime.count()) +
                         "ms, re-establishing in " + std::to_string((rewatch_delay_ - lifetime).count()) + "ms");
            if (wait_for_cancel(cancellable_, rewatch_delay_ - lifetime)) {
                break;
            }
        } else {
            Logger::info("[Follower] Watch on " + path_ + " ended, re-establishing");
        }
    }

    running_.store(false);
    Logger::debug("[Follower] Follow loop ended for " + path_);
}

} // namespace promfile
