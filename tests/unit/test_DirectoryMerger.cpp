#include "TempDirTest.hpp"
#include "transfer/DirectoryMerger.hpp"
#include "transfer/FileTransfer.hpp"
#include "progress/Event.hpp"
#include "transfer/Strategy.hpp"
#include "transfer/Error.hpp"
#include "runtime/Cancellation.hpp"

#include <algorithm>

using namespace mvx::transfer;
using mvx::runtime::Cancellation;

namespace {

// Requests cancellation when the first unit finishes.
struct RequestAfterFirstSink : mvx::progress::Sink {
    Cancellation& cancellation;
    explicit RequestAfterFirstSink(Cancellation& c) : cancellation(c) {}
    void onEvent(const mvx::progress::Event& e) override {
        if (e.kind == mvx::progress::Event::Kind::Finished) cancellation.request();
    }
};

// Once the last unit has finished, swaps the source root for a plain file so
// pruning the directories below it fails.
struct ReplaceRootAfterLastSink : mvx::progress::Sink {
    fs::path root;
    size_t remaining;
    ReplaceRootAfterLastSink(fs::path r, const size_t units) : root(std::move(r)), remaining(units) {}
    void onEvent(const mvx::progress::Event& e) override {
        if (e.kind != mvx::progress::Event::Kind::Finished || --remaining != 0) return;
        fs::remove_all(root);
        std::ofstream(root) << "not a directory";
    }
};

}

class DirectoryMergerTest : public TempDirTest {
protected:
    mvx::config::TransferConfig config;
    Cancellation cancellation;
    std::unique_ptr<Strategy> strategy;
    std::unique_ptr<FileTransfer> files;
    std::unique_ptr<DirectoryMerger> merger;
    fs::path src, dst;

    void SetUp() override {
        TempDirTest::SetUp();
        strategy = std::make_unique<Strategy>(config, cancellation);
        files = std::make_unique<FileTransfer>(*strategy, cancellation);
        merger = std::make_unique<DirectoryMerger>(*files, cancellation);

        src = test_dir / "dir";
        dst = test_dir / "dir2";
        writeTextFile(src / "x.txt", "source x");
        writeTextFile(src / "y.txt", "source y");
        writeTextFile(src / "sub" / "z.txt", "source z");
        writeTextFile(dst / "x.txt", "dest x");
        writeTextFile(dst / "only_dest.txt", "keep me");
    }

    MergeReport merge(const Mode mode, const Options& options = {}, mvx::progress::Sink* sink = nullptr) const {
        return merger->merge({src, dst, mode, options}, sink);
    }
};

TEST_F(DirectoryMergerTest, ConflictWithoutForceLeavesDestinationAndCopiesRest) {
    const auto report = merge(Mode::Copy);

    EXPECT_EQ(report.failures(), 1u);
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(readTextFile(dst / "x.txt"), "dest x");
    EXPECT_EQ(readTextFile(dst / "y.txt"), "source y");
    EXPECT_EQ(readTextFile(dst / "sub" / "z.txt"), "source z");
    EXPECT_EQ(readTextFile(dst / "only_dest.txt"), "keep me");
}

TEST_F(DirectoryMergerTest, ForceOverwritesConflicts) {
    const auto report = merge(Mode::Copy, {.force = true});

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(readTextFile(dst / "x.txt"), "source x");
    EXPECT_EQ(readTextFile(dst / "only_dest.txt"), "keep me");
    EXPECT_TRUE(fs::exists(src / "x.txt"));
}

TEST_F(DirectoryMergerTest, UnitsRunInSortedOrder) {
    const auto report = merge(Mode::Copy, {.force = true});
    std::vector<fs::path> rels;
    for (const auto& o : report.outcomes) rels.push_back(o.unit.relative);
    EXPECT_TRUE(std::ranges::is_sorted(rels));
    EXPECT_EQ(rels.size(), 3u);
}

TEST_F(DirectoryMergerTest, MoveRemovesEmptiedSourceTree) {
    const auto report = merge(Mode::Move, {.force = true});

    EXPECT_TRUE(report.ok());
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(readTextFile(dst / "sub" / "z.txt"), "source z");
}

TEST_F(DirectoryMergerTest, MoveKeepsDirectoriesHoldingConflicts) {
    const auto report = merge(Mode::Move);

    EXPECT_EQ(report.failures(), 1u);
    EXPECT_TRUE(fs::exists(src / "x.txt"));
    EXPECT_FALSE(fs::exists(src / "y.txt"));
    EXPECT_FALSE(fs::exists(src / "sub"));
    EXPECT_TRUE(report.warnings.empty());
}

TEST_F(DirectoryMergerTest, DryRunIsANoop) {
    const auto before = snapshot();
    const auto report = merge(Mode::Move, {.dry_run = true});

    EXPECT_EQ(report.count(Outcome::Status::Planned), 2u);
    EXPECT_EQ(report.failures(), 1u);
    EXPECT_EQ(snapshot(), before);
}

TEST_F(DirectoryMergerTest, RequestedCancellationSkipsRemainingFiles) {
    RequestAfterFirstSink sink(cancellation);
    const auto report = merge(Mode::Copy, {.force = true}, &sink);

    EXPECT_TRUE(report.cancelled);
    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_TRUE(report.outcomes[0].ok());
    EXPECT_EQ(report.outcomes[1].status, Outcome::Status::Skipped);
    EXPECT_EQ(report.outcomes[2].status, Outcome::Status::Skipped);
}

TEST_F(DirectoryMergerTest, ForcedCancellationMutatesNothingFurther) {
    cancellation.force();
    const auto report = merge(Mode::Move, {.force = true});

    EXPECT_TRUE(report.cancelled);
    EXPECT_TRUE(fs::exists(src / "y.txt"));
    EXPECT_FALSE(fs::exists(dst / "y.txt"));
}

TEST_F(DirectoryMergerTest, RejectsMergeIntoItself) {
    try {
        (void)merger->merge({src, src / "sub", Mode::Copy, {}});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRequest);
    }
    EXPECT_FALSE(fs::exists(src / "sub" / "sub"));
}

TEST_F(DirectoryMergerTest, RejectsFileDestination) {
    writeTextFile(test_dir / "plain", "p");
    try {
        (void)merger->merge({src, test_dir / "plain", Mode::Copy, {}});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DestinationNotADirectory);
    }
}

TEST_F(DirectoryMergerTest, SymlinksAreSkippedAndBlockPruning) {
    fs::create_symlink(src / "y.txt", src / "sub" / "link");
    const auto report = merge(Mode::Move, {.force = true});

    EXPECT_EQ(report.warnings.size(), 1u);
    EXPECT_TRUE(fs::is_symlink(src / "sub" / "link"));
    EXPECT_TRUE(fs::exists(src / "sub"));
}

TEST_F(DirectoryMergerTest, CreatesMissingDestinationRoot) {
    fs::create_directories(test_dir / "empty");
    const auto report = merger->merge({test_dir / "empty", test_dir / "fresh", Mode::Copy, {}});
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(fs::is_directory(test_dir / "fresh"));
}

TEST_F(DirectoryMergerTest, CleanupFailureIsAWarningNotAFailure) {
    ReplaceRootAfterLastSink sink(src, 3);
    const auto report = merge(Mode::Move, {.force = true}, &sink);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.failures(), 0u);
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_NE(report.warnings[0].find("Cannot remove directory"), std::string::npos);
    EXPECT_EQ(readTextFile(dst / "sub" / "z.txt"), "source z");
}

TEST_F(DirectoryMergerTest, SymlinkedSourceMergesItsTarget) {
    fs::create_directory_symlink(src, test_dir / "link");
    const auto report = merger->merge({test_dir / "link", dst, Mode::Copy, {.force = true}});

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(readTextFile(dst / "sub" / "z.txt"), "source z");
    EXPECT_TRUE(fs::is_symlink(test_dir / "link"));
    EXPECT_EQ(readTextFile(src / "x.txt"), "source x");
}

TEST_F(DirectoryMergerTest, MoveThroughSymlinkRemovesTargetAndLink) {
    fs::create_directory_symlink(src, test_dir / "link");
    const auto report = merger->merge({test_dir / "link", dst, Mode::Move, {.force = true}});

    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(readTextFile(dst / "y.txt"), "source y");
    EXPECT_FALSE(fs::exists(src));
    EXPECT_FALSE(fs::exists(fs::symlink_status(test_dir / "link")));
}
