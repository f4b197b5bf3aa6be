// symlink_watcher.hpp - symlink chain tracing and drift polling
// inotify cannot report a change of a symlink's target, so the links that
// resolve a watched path are recorded once and re-read on a fixed interval.

#ifndef PROMFILE_SYMLINK_WATCHER_HPP
#define PROMFILE_SYMLINK_WATCHER_HPP

#include "signal_channel.hpp"

#include <gio/gio.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace promfile {

// One hop of a resolution chain, as found at trace time.
struct SymlinkEdge {
    std::string link_path;
    std::string target;     // link value exactly as read, relative or absolute

    bool operator==(const SymlinkEdge& other) const {
        return link_path == other.link_path && target == other.target;
    }
};

// Leaf-most link first.
using SymlinkChain = std::vector<SymlinkEdge>;

/**
 * Collects every symlink involved in resolving `path`: links on the path
 * itself, links on the targets they point to, and links on any ancestor
 * directory. Relative targets are followed from the link's directory.
 * A link that shows up twice, under any spelling, ends the trace, and so
 * does a chain longer than the kernel would follow (40 links).
 *
 * Touches nothing; returns an empty chain when no link participates.
 */
SymlinkChain trace_symlinks(const std::string& path);

/**
 * Polls a recorded SymlinkChain and closes output() as soon as any link
 * can no longer be read or points somewhere else than when it was traced.
 * Every poll compares against the original snapshot.
 *
 * The cancellable must not be null and is shared with the caller.
 * Cancellation stops polling without closing output(). An empty chain
 * starts no thread at all, so output() only ends through cancellation.
 */
class SymlinkWatcher {
public:
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{1000};

    SymlinkWatcher(SymlinkChain chain,
                   GCancellable* cancellable,
                   std::shared_ptr<SignalGroup> group = std::make_shared<SignalGroup>(),
                   std::chrono::milliseconds interval = DEFAULT_INTERVAL);
    ~SymlinkWatcher();

    SymlinkWatcher(const SymlinkWatcher&) = delete;
    SymlinkWatcher& operator=(const SymlinkWatcher&) = delete;

    // False once cancelled or after a drift: a watcher runs at most once
    bool start();

    // Cancels the cancellable given at construction and joins the poll thread
    void stop();

    bool is_running() const { return running_.load(); }
    SignalChannel& output() { return output_; }
    const SymlinkChain& chain() const { return chain_; }

    // Empty string when every link still matches, otherwise why it does not
    std::string check_drift() const;

private:
    void poll_loop();

    const SymlinkChain chain_;
    GCancellable* cancellable_;
    std::chrono::milliseconds interval_;
    SignalChannel output_;
    std::thread poll_thread_;
    std::atomic<bool> running_{false};
};

} // namespace promfile

#endif // PROMFILE_SYMLINK_WATCHER_HPP
