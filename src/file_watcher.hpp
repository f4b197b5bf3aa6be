// file_watcher.hpp - inotify-based watcher for a single file
// Uses native Linux inotify API (kernel 2.6.13+, universally available)

#ifndef PROMFILE_FILE_WATCHER_HPP
#define PROMFILE_FILE_WATCHER_HPP

#include "signal_channel.hpp"

#include <gio/gio.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace promfile {

class FileWatcher {
public:
    // What the watcher does with one raw inotify event
    enum class EventAction {
        Forward,    // content or metadata changed
        Ignore,     // creation; some writers recreate instead of writing
        Terminal    // removed, renamed, or the notifier failed
    };

    // The cancellable must not be null; stop() cancels it.
    explicit FileWatcher(GCancellable* cancellable,
                         std::shared_ptr<SignalGroup> group = std::make_shared<SignalGroup>());
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    // Subscribes to the literal path (symlinks followed by the kernel) and
    // starts the watcher thread. On failure nothing keeps running. A watcher
    // whose output closed or whose cancellable fired cannot be started again.
    bool start(const std::string& path, GError** error);

    // Cancels and waits for the watcher thread; the inotify fd is released
    void stop();

    bool is_running() const { return running_.load(); }

    // One signal per forwarded event; closed on a terminal event
    SignalChannel& output() { return output_; }

    const std::string& path() const { return path_; }

    // Decides the fate of one event mask for the watched path
    EventAction classify(uint32_t mask) const;

private:
    // Main watcher loop
    void watch_loop();

    // Releases the watch and the inotify instance
    void close_notifier();

    // True once the watched path no longer resolves to anything
    bool path_gone() const;

    int inotify_fd_;
    int wd_;
    std::string path_;
    GCancellable* cancellable_;
    SignalChannel output_;
    std::thread watcher_thread_;
    std::atomic<bool> running_;
};

} // namespace promfile

#endif // PROMFILE_FILE_WATCHER_HPP
