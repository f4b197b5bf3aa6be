#include "signal_channel.hpp"

#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <thread>

namespace promfile {

namespace {

bool is_cancelled(GCancellable* cancellable) {
    return cancellable != nullptr && g_cancellable_is_cancelled(cancellable);
}

void wake_group(GCancellable* /*cancellable*/, gpointer user_data) {
    auto* group = static_cast<SignalGroup*>(user_data);
    std::lock_guard<std::mutex> lock(group->mutex);
    group->cond.notify_all();
}

// Wakes waiters of a group when the cancellable fires.
// Must be constructed before and destroyed after the group lock is held:
// g_cancellable_connect() runs the handler inline when already cancelled and
// g_cancellable_disconnect() waits for a handler running on another thread.
class CancelWakeup {
public:
    CancelWakeup(GCancellable* cancellable, SignalGroup& group)
        : cancellable_(cancellable) {
        if (cancellable_) {
            handler_ = g_cancellable_connect(cancellable_, G_CALLBACK(wake_group), &group, nullptr);
        }
    }

    ~CancelWakeup() {
        if (cancellable_ && handler_ != 0) {
            g_cancellable_disconnect(cancellable_, handler_);
        }
    }

    CancelWakeup(const CancelWakeup&) = delete;
    CancelWakeup& operator=(const CancelWakeup&) = delete;

private:
    GCancellable* cancellable_;
    gulong handler_ = 0;
};

} // namespace

SignalChannel::SignalChannel(std::shared_ptr<SignalGroup> group)
    : group_(std::move(group)) {
}

bool SignalChannel::send(GCancellable* cancellable, const SignalChannel* abort) {
    CancelWakeup wakeup(cancellable, *group_);
    std::unique_lock<std::mutex> lock(group_->mutex);

    auto given_up = [&] {
        return closed_ || is_cancelled(cancellable) || (abort && abort->closed_);
    };

    group_->cond.wait(lock, [&] { return !pending_ || given_up(); });
    if (given_up()) {
        return false;
    }

    pending_ = true;
    const uint64_t ticket = ++posted_;
    group_->cond.notify_all();

    group_->cond.wait(lock, [&] { return taken_ >= ticket || given_up(); });
    if (taken_ >= ticket) {
        return true;
    }

    // Not taken: withdraw it
    if (!closed_) {
        pending_ = false;
        group_->cond.notify_all();
    }
    return false;
}

bool SignalChannel::receive(GCancellable* cancellable) {
    auto selection = select_signal({this}, cancellable);
    return selection && selection->received;
}

bool SignalChannel::close() {
    std::lock_guard<std::mutex> lock(group_->mutex);
    if (closed_) {
        return false;
    }
    closed_ = true;
    pending_ = false;
    group_->cond.notify_all();
    return true;
}

bool SignalChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(group_->mutex);
    return closed_;
}

void SignalChannel::take_locked() {
    pending_ = false;
    taken_ = posted_;
    group_->cond.notify_all();
}

std::optional<SignalSelection> select_signal(std::initializer_list<SignalChannel*> channels,
                                             GCancellable* cancellable) {
    if (channels.size() == 0) {
        return std::nullopt;
    }

    SignalGroup& group = *(*channels.begin())->group_;
    CancelWakeup wakeup(cancellable, group);
    std::unique_lock<std::mutex> lock(group.mutex);

    std::optional<SignalSelection> selection;
    group.cond.wait(lock, [&] {
        if (is_cancelled(cancellable)) {
            return true;
        }
        size_t index = 0;
        for (SignalChannel* channel : channels) {
            if (channel->closed_) {
                selection = SignalSelection{index, false};
                return true;
            }
            if (channel->pending_) {
                channel->take_locked();
                selection = SignalSelection{index, true};
                return true;
            }
            ++index;
        }
        return false;
    });

    return selection;
}

bool wait_for_cancel(GCancellable* cancellable, std::chrono::milliseconds timeout) {
    if (cancellable == nullptr) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    if (g_cancellable_is_cancelled(cancellable)) {
        return true;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int fd = g_cancellable_get_fd(cancellable);

    if (fd >= 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        while (!g_cancellable_is_cancelled(cancellable)) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            int result = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (result < 0 && errno != EINTR) {
                break;
            }
            if (result > 0) {
                break;
            }
        }
        g_cancellable_release_fd(cancellable);
        return g_cancellable_is_cancelled(cancellable);
    }

    // No fd available (fd limit reached): check in short slices
    while (!g_cancellable_is_cancelled(cancellable)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(100));
        std::this_thread::sleep_for(slice);
    }
    return g_cancellable_is_cancelled(cancellable);
}

} // namespace promfile
