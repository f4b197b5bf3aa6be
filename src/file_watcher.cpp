// file_watcher.cpp - inotify-based file watcher implementation
// Uses native Linux inotify API for maximum compatibility

#include "file_watcher.hpp"
#include "logger.hpp"
#include "watch_error.hpp"

#include <sys/inotify.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <poll.h>
#include <limits.h>
#include <system_error>

namespace promfile {

// Size of inotify event buffer
#define EVENT_BUF_LEN (64 * (sizeof(struct inotify_event) + NAME_MAX + 1))

// Events we subscribe to. IN_CLOSE_WRITE is left out so that one write
// yields one forwarded signal.
#define WATCH_EVENTS (IN_MODIFY | IN_ATTRIB | IN_CREATE | IN_DELETE | IN_DELETE_SELF | \
                      IN_MOVE_SELF | IN_MOVED_FROM | IN_MOVED_TO)

namespace {

std::string describe_mask(uint32_t mask) {
    std::string names;
    auto add = [&](uint32_t bit, const char* name) {
        if (mask & bit) {
            if (!names.empty()) names += "|";
            names += name;
        }
    };
    add(IN_MODIFY, "MODIFY");
    add(IN_ATTRIB, "ATTRIB");
    add(IN_CREATE, "CREATE");
    add(IN_DELETE, "DELETE");
    add(IN_DELETE_SELF, "DELETE_SELF");
    add(IN_MOVE_SELF, "MOVE_SELF");
    add(IN_MOVED_FROM, "MOVED_FROM");
    add(IN_MOVED_TO, "MOVED_TO");
    add(IN_IGNORED, "IGNORED");
    add(IN_UNMOUNT, "UNMOUNT");
    add(IN_Q_OVERFLOW, "Q_OVERFLOW");
    return names.empty() ? "OTHER" : names;
}

} // namespace

FileWatcher::FileWatcher(GCancellable* cancellable, std::shared_ptr<SignalGroup> group)
    : inotify_fd_(-1)
    , wd_(-1)
    , cancellable_(G_CANCELLABLE(g_object_ref(cancellable)))
    , output_(std::move(group))
    , running_(false) {
}

FileWatcher::~FileWatcher() {
    stop();
    close_notifier();
    g_object_unref(cancellable_);
}

bool FileWatcher::start(const std::string& path, GError** error) {
    if (running_.load()) {
        return true;  // Already running
    }

    // A loop that ended on its own still has to be joined
    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
    if (g_cancellable_is_cancelled(cancellable_) || output_.is_closed()) {
        g_set_error(error, G_IO_ERROR, G_IO_ERROR_CANCELLED,
                    "file watcher for %s has already ended", path_.c_str());
        return false;
    }

    path_ = path;

    // Initialize inotify
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        int saved_errno = errno;
        Logger::error("[FileWatcher] Failed to initialize inotify: " + std::string(strerror(saved_errno)));
        g_set_error(error, PROMFILE_WATCH_ERROR, PROMFILE_WATCH_ERROR_NOTIFIER,
                    "failed to create watcher: %s", g_strerror(saved_errno));
        return false;
    }

    wd_ = inotify_add_watch(inotify_fd_, path_.c_str(), WATCH_EVENTS);
    if (wd_ < 0) {
        int saved_errno = errno;
        if (saved_errno == ENOSPC) {
            Logger::error("[FileWatcher] inotify watch limit reached! Increase /proc/sys/fs/inotify/max_user_watches");
        } else {
            Logger::error("[FileWatcher] Failed to watch " + path_ + ": " + std::string(strerror(saved_errno)));
        }
        g_set_error(error, PROMFILE_WATCH_ERROR,
                    saved_errno == ENOENT ? PROMFILE_WATCH_ERROR_NOT_FOUND : PROMFILE_WATCH_ERROR_NOTIFIER,
                    "failed to watch file %s: %s", path_.c_str(), g_strerror(saved_errno));
        close_notifier();
        return false;
    }

    running_.store(true);

    try {
        watcher_thread_ = std::thread(&FileWatcher::watch_loop, this);
    } catch (const std::system_error& e) {
        Logger::error("[FileWatcher] Failed to create thread: " + std::string(e.what()));
        g_set_error(error, PROMFILE_WATCH_ERROR, PROMFILE_WATCH_ERROR_THREAD,
                    "failed to start file watcher thread: %s", e.what());
        running_.store(false);
        close_notifier();
        return false;
    }

    Logger::debug("[FileWatcher] Watching " + path_ + " (inotify fd=" + std::to_string(inotify_fd_) + ")");
    return true;
}

void FileWatcher::stop() {
    g_cancellable_cancel(cancellable_);

    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
}

void FileWatcher::close_notifier() {
    if (inotify_fd_ < 0) {
        return;
    }
    if (wd_ >= 0) {
        // Fails harmlessly with EINVAL once the kernel dropped the watch (IN_IGNORED)
        inotify_rm_watch(inotify_fd_, wd_);
        wd_ = -1;
    }
    close(inotify_fd_);
    inotify_fd_ = -1;
}

bool FileWatcher::path_gone() const {
    struct stat st;
    if (stat(path_.c_str(), &st) == 0) {
        // unlink() reports IN_ATTRIB before the name disappears
        return st.st_nlink == 0;
    }
    return errno == ENOENT || errno == ENOTDIR;
}

FileWatcher::EventAction FileWatcher::classify(uint32_t mask) const {
    if (mask & IN_Q_OVERFLOW) {
        return EventAction::Terminal;
    }
    if (mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_DELETE | IN_MOVED_FROM | IN_IGNORED | IN_UNMOUNT)) {
        return EventAction::Terminal;
    }
    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        return EventAction::Ignore;
    }
    // unlink() drops the link count first, which shows up as IN_ATTRIB
    // ahead of IN_DELETE_SELF
    if ((mask & IN_ATTRIB) && path_gone()) {
        return EventAction::Terminal;
    }
    return EventAction::Forward;
}

void FileWatcher::watch_loop() {
    alignas(struct inotify_event) char buffer[EVENT_BUF_LEN];

    // Cancellation wakes poll() through this fd; -1 falls back to a timeout
    int cancel_fd = g_cancellable_get_fd(cancellable_);
    bool terminal = false;
    bool done = false;

    while (!done) {
        struct pollfd fds[2];
        fds[0].fd = inotify_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = cancel_fd;  // ignored by poll() when negative
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int poll_result = poll(fds, 2, cancel_fd < 0 ? 500 : -1);

        if (g_cancellable_is_cancelled(cancellable_)) {
            break;
        }

        if (poll_result < 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, try again
            }
            Logger::error("[FileWatcher] poll() error: " + std::string(strerror(errno)));
            terminal = true;
            break;
        }

        if (poll_result == 0) {
            continue;
        }

        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            Logger::error("[FileWatcher] inotify fd reported an error condition");
            terminal = true;
            break;
        }

        // Read events
        ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            Logger::error("[FileWatcher] read() error: " + std::string(strerror(errno)));
            terminal = true;
            break;
        }

        // Process events
        ssize_t i = 0;
        while (i < len && !done) {
            struct inotify_event* event = reinterpret_cast<struct inotify_event*>(buffer + i);
            i += sizeof(struct inotify_event) + event->len;

            EventAction action = classify(event->mask);
            Logger::debug("[FileWatcher] Event: " + describe_mask(event->mask) + " - " + path_);

            switch (action) {
                case EventAction::Ignore:
                    break;
                case EventAction::Terminal:
                    Logger::info("[FileWatcher] " + path_ + " is gone or unwatchable (" +
                                 describe_mask(event->mask) + "), watch ended");
                    terminal = true;
                    done = true;
                    break;
                case EventAction::Forward:
                    // Blocks until the orchestrator takes it; false on cancellation
                    if (!output_.send(cancellable_)) {
                        done = true;
                    }
                    break;
            }
        }
    }

    if (terminal) {
        output_.close();
    }
    if (cancel_fd >= 0) {
        g_cancellable_release_fd(cancellable_);
    }
    close_notifier();
    running_.store(false);

    Logger::debug("[FileWatcher] Watch loop ended for " + path_);
}

} // namespace promfile
