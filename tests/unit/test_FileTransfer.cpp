#include "TempDirTest.hpp"
#include "transfer/FileTransfer.hpp"
#include "transfer/Strategy.hpp"
#include "progress/Tracker.hpp"
#include "runtime/Cancellation.hpp"

#include <sys/stat.h>

using namespace mvx::transfer;
using mvx::runtime::Cancellation;

namespace {

struct CountingSink : mvx::progress::Sink {
    std::vector<mvx::progress::Event> events;
    void onEvent(const mvx::progress::Event& e) override { events.push_back(e); }
};

}

class FileTransferTest : public TempDirTest {
protected:
    mvx::config::TransferConfig config;
    Cancellation cancellation;
    std::unique_ptr<Strategy> strategy;
    std::unique_ptr<FileTransfer> files;

    void SetUp() override {
        TempDirTest::SetUp();
        strategy = std::make_unique<Strategy>(config, cancellation);
        files = std::make_unique<FileTransfer>(*strategy, cancellation);
    }

    Outcome run(const fs::path& src, const fs::path& dst, const Mode mode, const Options& options = {}) const {
        return files->run({src, dst, mode, options});
    }
};

TEST_F(FileTransferTest, MoveIntoExistingDirectory) {
    const auto content = pattern(4096);
    writeTextFile(test_dir / "a.txt", content);
    fs::create_directory(test_dir / "b");

    const auto outcome = run(test_dir / "a.txt", test_dir / "b", Mode::Move);

    EXPECT_EQ(outcome.status, Outcome::Status::Done);
    EXPECT_EQ(outcome.method, Method::Rename);
    EXPECT_EQ(outcome.unit.destination, test_dir / "b" / "a.txt");
    EXPECT_EQ(readTextFile(test_dir / "b" / "a.txt"), content);
    EXPECT_FALSE(fs::exists(test_dir / "a.txt"));
}

TEST_F(FileTransferTest, TrailingSeparatorCreatesIntermediateDirectories) {
    writeTextFile(test_dir / "a.txt", "a");
    const auto outcome = run(test_dir / "a.txt", (test_dir / "x" / "y").string() + "/", Mode::Copy);

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(readTextFile(test_dir / "x" / "y" / "a.txt"), "a");
    EXPECT_TRUE(fs::exists(test_dir / "a.txt"));
}

TEST_F(FileTransferTest, ExistingDestinationWithoutForceFailsUntouched) {
    writeTextFile(test_dir / "a.txt", "new");
    writeTextFile(test_dir / "b.txt", "old");

    const auto outcome = run(test_dir / "a.txt", test_dir / "b.txt", Mode::Move);

    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorKind::DestinationExists);
    EXPECT_EQ(readTextFile(test_dir / "b.txt"), "old");
    EXPECT_EQ(readTextFile(test_dir / "a.txt"), "new");
}

TEST_F(FileTransferTest, ForceOverwritesAndIsIdempotent) {
    writeTextFile(test_dir / "a.txt", "new");
    writeTextFile(test_dir / "b.txt", "old but longer");
    const Options force{.force = true};

    EXPECT_TRUE(run(test_dir / "a.txt", test_dir / "b.txt", Mode::Copy, force).ok());
    EXPECT_TRUE(run(test_dir / "a.txt", test_dir / "b.txt", Mode::Copy, force).ok());
    EXPECT_EQ(readTextFile(test_dir / "b.txt"), "new");
    EXPECT_EQ(readTextFile(test_dir / "a.txt"), "new");
}

TEST_F(FileTransferTest, DryRunMutatesNothing) {
    writeTextFile(test_dir / "a.txt", "a");
    const Options dry{.dry_run = true};

    const auto first = run(test_dir / "a.txt", (test_dir / "out").string() + "/", Mode::Move, dry);
    const auto second = run(test_dir / "a.txt", (test_dir / "out").string() + "/", Mode::Move, dry);

    EXPECT_EQ(first.status, Outcome::Status::Planned);
    EXPECT_EQ(first.message, second.message);
    EXPECT_EQ(first.action, DestinationPlan::Action::Create);
    EXPECT_FALSE(fs::exists(test_dir / "out"));
    EXPECT_TRUE(fs::exists(test_dir / "a.txt"));
}

TEST_F(FileTransferTest, DryRunStillReportsConflicts) {
    writeTextFile(test_dir / "a.txt", "a");
    writeTextFile(test_dir / "b.txt", "b");

    const auto outcome = run(test_dir / "a.txt", test_dir / "b.txt", Mode::Copy, {.dry_run = true});
    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    EXPECT_EQ(*outcome.error, ErrorKind::DestinationExists);
}

TEST_F(FileTransferTest, DryRunWithForcePlansOverwrite) {
    writeTextFile(test_dir / "a.txt", "a");
    writeTextFile(test_dir / "b.txt", "b");

    const auto outcome = run(test_dir / "a.txt", test_dir / "b.txt", Mode::Copy, {.force = true, .dry_run = true});
    EXPECT_EQ(outcome.status, Outcome::Status::Planned);
    EXPECT_EQ(outcome.action, DestinationPlan::Action::Overwrite);
    EXPECT_EQ(readTextFile(test_dir / "b.txt"), "b");
}

TEST_F(FileTransferTest, MissingSourceFails) {
    const auto outcome = run(test_dir / "missing.txt", test_dir / "out/", Mode::Copy);
    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    EXPECT_EQ(*outcome.error, ErrorKind::SourceNotFound);
    EXPECT_FALSE(fs::exists(test_dir / "out"));
}

TEST_F(FileTransferTest, MoveOntoItselfIsNoop) {
    writeTextFile(test_dir / "a.txt", "a");
    const auto outcome = run(test_dir / "a.txt", test_dir / "a.txt", Mode::Move);
    EXPECT_EQ(outcome.status, Outcome::Status::Done);
    EXPECT_EQ(outcome.action, DestinationPlan::Action::Noop);
    EXPECT_EQ(readTextFile(test_dir / "a.txt"), "a");
}

TEST_F(FileTransferTest, DirectoryAtTargetFails) {
    writeTextFile(test_dir / "a.txt", "a");
    fs::create_directories(test_dir / "b" / "a.txt");
    const auto outcome = run(test_dir / "a.txt", test_dir / "b", Mode::Copy);
    EXPECT_EQ(*outcome.error, ErrorKind::DestinationNotAFile);
}

TEST_F(FileTransferTest, ProgressReachesTotal) {
    writeTextFile(test_dir / "a.bin", pattern(100000));
    CountingSink sink;

    const auto outcome = files->run({test_dir / "a.bin", test_dir / "b.bin", Mode::Copy, {}}, &sink);
    ASSERT_TRUE(outcome.ok());
    ASSERT_FALSE(sink.events.empty());
    EXPECT_EQ(sink.events.back().kind, mvx::progress::Event::Kind::Finished);
    EXPECT_EQ(sink.events.back().bytes_done, 100000u);
    EXPECT_EQ(sink.events.back().bytes_total, 100000u);
}

TEST_F(FileTransferTest, ForcedCancellationIsNotAFailure) {
    writeTextFile(test_dir / "a.txt", "a");
    cancellation.force();
    const auto outcome = run(test_dir / "a.txt", test_dir / "b.txt", Mode::Move);
    EXPECT_EQ(outcome.status, Outcome::Status::Cancelled);
    EXPECT_FALSE(fs::exists(test_dir / "b.txt"));
}

TEST_F(FileTransferTest, FifoSourceFailsWithoutBlocking) {
    ASSERT_EQ(::mkfifo((test_dir / "pipe").c_str(), 0644), 0);

    const auto outcome = run(test_dir / "pipe", test_dir / "out", Mode::Copy);

    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    EXPECT_EQ(outcome.error, ErrorKind::SourceNotSupported);
    EXPECT_FALSE(fs::exists(test_dir / "out"));
}

TEST_F(FileTransferTest, SymlinkToDirectoryIsNotAFileSource) {
    writeTextFile(test_dir / "real" / "f.txt", "f");
    fs::create_directory_symlink(test_dir / "real", test_dir / "link");

    const auto outcome = run(test_dir / "link", test_dir / "out", Mode::Copy);

    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    EXPECT_EQ(outcome.error, ErrorKind::InvalidRequest);
    EXPECT_FALSE(fs::exists(test_dir / "out"));
}

TEST_F(FileTransferTest, SymlinkToFileCopiesItsContent) {
    writeTextFile(test_dir / "real.txt", "real");
    fs::create_symlink(test_dir / "real.txt", test_dir / "link.txt");

    const auto outcome = run(test_dir / "link.txt", test_dir / "out.txt", Mode::Copy);

    EXPECT_TRUE(outcome.ok());
    EXPECT_FALSE(fs::is_symlink(test_dir / "out.txt"));
    EXPECT_EQ(readTextFile(test_dir / "out.txt"), "real");
}

TEST_F(FileTransferTest, WriteFailureMarksUnitFailed) {
    if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    config.reflink = false;
    const Strategy streaming(config, cancellation);
    const FileTransfer transfer(streaming, cancellation);
    writeTextFile(test_dir / "a.bin", pattern(64 * 1024));

    const auto outcome = transfer.run({test_dir / "a.bin", "/dev/full", Mode::Copy, {.force = true}});

    EXPECT_EQ(outcome.status, Outcome::Status::Failed);
    EXPECT_EQ(outcome.error, ErrorKind::StreamingIO);
    EXPECT_NE(outcome.message.find("/dev/full"), std::string::npos);
    EXPECT_EQ(readTextFile(test_dir / "a.bin"), pattern(64 * 1024));
}
