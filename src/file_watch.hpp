// file_watch.hpp - watch handle for one file, symlink chain included
//
// Combines the inotify watcher (content changes, removal, rename) with the
// symlink chain poller (repointed links) into a single stream of
// "re-read the file" signals.

#ifndef PROMFILE_FILE_WATCH_HPP
#define PROMFILE_FILE_WATCH_HPP

#include "file_watcher.hpp"
#include "signal_channel.hpp"
#include "symlink_watcher.hpp"

#include <gio/gio.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace promfile {

struct WatchOptions {
    // Symlink drift is noticed at most this long after it happens
    std::chrono::milliseconds symlink_poll_interval = SymlinkWatcher::DEFAULT_INTERVAL;
};

/**
 * A running watch on one file.
 *
 * next() returns true each time the content may have changed and false once
 * the watch has ended. The watch ends, exactly once, when:
 * - the file is removed or renamed, or inotify fails,
 * - a symlink used to reach the file is repointed or removed,
 * - the cancellable passed to watch() is cancelled.
 * The handle does not say which. To keep following the file after an end
 * that the caller did not trigger, call watch() again with the same path.
 *
 * Signals are handed over unbuffered: a consumer that does not call next()
 * promptly holds back the inotify reader.
 */
class FileWatch {
public:
    // Fails with PROMFILE_WATCH_ERROR_NOT_FOUND when `path` does not exist,
    // PROMFILE_WATCH_ERROR_NOTIFIER or _THREAD when the watch cannot be set up.
    static std::unique_ptr<FileWatch> watch(GCancellable* cancellable,
                                            const std::string& path,
                                            GError** error,
                                            const WatchOptions& options = WatchOptions());

    // Stops and joins every thread of the watch
    ~FileWatch();

    FileWatch(const FileWatch&) = delete;
    FileWatch& operator=(const FileWatch&) = delete;

    // Blocks until the next change signal (true) or the end of the watch (false)
    bool next();

    bool is_closed() const { return handle_.is_closed(); }
    const std::string& path() const { return path_; }
    const SymlinkChain& chain() const { return symlink_watcher_->chain(); }

private:
    FileWatch(GCancellable* cancellable, const std::string& path, const WatchOptions& options);

    bool start(GError** error);
    void multiplex_loop();

    std::string path_;
    WatchOptions options_;

    GCancellable* external_;        // caller's token, may be null
    gulong external_handler_ = 0;
    GCancellable* scope_;           // cancelled on any end of the watch

    std::shared_ptr<SignalGroup> sources_;
    std::unique_ptr<FileWatcher> file_watcher_;
    std::unique_ptr<SymlinkWatcher> symlink_watcher_;

    SignalChannel handle_;          // shares sources_ so a drift can withdraw a pending send
    std::thread multiplex_thread_;
};

} // namespace promfile

#endif // PROMFILE_FILE_WATCH_HPP
