#include <gtest/gtest.h>

#include <future>
#include <sys/inotify.h>

#include "file_watcher.hpp"
#include "test_helpers.hpp"
#include "watch_error.hpp"

using namespace promfile;
using namespace std::chrono_literals;

class FileWatcherTest : public TempDirTest {
   protected:
    void SetUp() override {
        TempDirTest::SetUp();
        file = test_dir / "metrics.txt";
        write_file(file, "initial");
        cancellable = g_cancellable_new();
    }

    void TearDown() override {
        g_object_unref(cancellable);
        TempDirTest::TearDown();
    }

    fs::path file;
    GCancellable* cancellable = nullptr;
};

TEST_F(FileWatcherTest, ClassifiesEvents) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));

    using Action = FileWatcher::EventAction;
    EXPECT_EQ(watcher.classify(IN_MODIFY), Action::Forward);
    EXPECT_EQ(watcher.classify(IN_ATTRIB), Action::Forward);
    EXPECT_EQ(watcher.classify(IN_CREATE), Action::Ignore);
    EXPECT_EQ(watcher.classify(IN_MOVED_TO), Action::Ignore);
    EXPECT_EQ(watcher.classify(IN_DELETE_SELF), Action::Terminal);
    EXPECT_EQ(watcher.classify(IN_MOVE_SELF), Action::Terminal);
    EXPECT_EQ(watcher.classify(IN_DELETE), Action::Terminal);
    EXPECT_EQ(watcher.classify(IN_MOVED_FROM), Action::Terminal);
    EXPECT_EQ(watcher.classify(IN_IGNORED), Action::Terminal);
    EXPECT_EQ(watcher.classify(IN_Q_OVERFLOW), Action::Terminal);
    EXPECT_EQ(watcher.classify(IN_MODIFY | IN_Q_OVERFLOW), Action::Terminal);

    watcher.stop();
    fs::remove(file);
    EXPECT_EQ(watcher.classify(IN_ATTRIB), Action::Terminal);
    EXPECT_EQ(watcher.classify(IN_MODIFY), Action::Forward);
}

TEST_F(FileWatcherTest, MissingPathFailsWithNotFound) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    EXPECT_FALSE(watcher.start((test_dir / "missing.txt").string(), &error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, PROMFILE_WATCH_ERROR, PROMFILE_WATCH_ERROR_NOT_FOUND));
    EXPECT_FALSE(watcher.is_running());
    g_clear_error(&error);
}

TEST_F(FileWatcherTest, WriteForwardsSignal) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));

    auto received = std::async(std::launch::async, [&] { return watcher.output().receive(cancellable); });
    write_file(file, "updated");

    ASSERT_EQ(received.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(received.get());
    EXPECT_TRUE(watcher.is_running());

    watcher.stop();
    EXPECT_FALSE(watcher.is_running());
}

TEST_F(FileWatcherTest, MetadataChangeForwardsSignal) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));

    auto received = std::async(std::launch::async, [&] { return watcher.output().receive(cancellable); });
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write);

    ASSERT_EQ(received.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(received.get());
    EXPECT_FALSE(watcher.output().is_closed());
}

TEST_F(FileWatcherTest, RemovalClosesOutput) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));

    fs::remove(file);

    EXPECT_TRUE(eventually([&] { return watcher.output().is_closed(); }));
    EXPECT_TRUE(eventually([&] { return !watcher.is_running(); }));
}

TEST_F(FileWatcherTest, RenameClosesOutput) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));

    fs::rename(file, test_dir / "renamed.txt");

    EXPECT_TRUE(eventually([&] { return watcher.output().is_closed(); }));
}

TEST_F(FileWatcherTest, EndedWatcherRefusesRestart) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));

    fs::remove(file);
    ASSERT_TRUE(eventually([&] { return !watcher.is_running(); }));

    write_file(file, "recreated");
    EXPECT_FALSE(watcher.start(file.string(), &error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED));
    g_clear_error(&error);
    EXPECT_FALSE(watcher.is_running());
}

TEST_F(FileWatcherTest, CancelledWatcherRefusesRestart) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));
    watcher.stop();

    EXPECT_FALSE(watcher.start(file.string(), &error));
    EXPECT_NE(error, nullptr);
    g_clear_error(&error);
}

TEST_F(FileWatcherTest, CancelStopsPromptly) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));
    EXPECT_TRUE(watcher.is_running());

    g_cancellable_cancel(cancellable);

    EXPECT_TRUE(eventually([&] { return !watcher.is_running(); }, 2000ms));
    EXPECT_FALSE(watcher.output().is_closed());
}

TEST_F(FileWatcherTest, CancelWhileSignalPending) {
    FileWatcher watcher(cancellable);
    GError* error = nullptr;
    ASSERT_TRUE(watcher.start(file.string(), &error));

    // Nobody receives: the watcher thread blocks in send()
    write_file(file, "updated");
    std::this_thread::sleep_for(100ms);

    auto start = std::chrono::steady_clock::now();
    watcher.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_FALSE(watcher.is_running());
}
