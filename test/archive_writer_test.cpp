//
// Created by the packrat authors on 18/10/26.
//

#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libpackrat/include/archive_writer.hpp"
#include "../libpackrat/include/errors.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace packrat;
using packrat::test::RecordingEntryWriter;
using packrat::test::TempDir;
using packrat::test::write_file;

namespace {

struct ProgressCall {
    double percent;
    std::string label;
};

// Runs a packaging request against an in-memory codec.
class ArchiveWriterTest : public ::testing::Test {
protected:
    void run(Options options, const std::vector<fs::path>& paths) {
        options.progressObserver([this](double p, const std::string& l) { progress.push_back({p, l}); });
        ArchiveWriter::run(options, paths, [this]() -> std::unique_ptr<IEntryWriter> {
            ++codecs_opened;
            auto codec = std::make_unique<RecordingEntryWriter>();
            recorder = codec.get();
            return codec;
        });
    }

    [[nodiscard]] std::vector<std::string> sorted_names() const {
        auto names = recorder->names();
        std::sort(names.begin(), names.end());
        return names;
    }

    [[nodiscard]] std::size_t index_of(const std::string& name) const {
        const auto names = recorder->names();
        return static_cast<std::size_t>(std::find(names.begin(), names.end(), name) - names.begin());
    }

    TempDir tmp;
    RecordingEntryWriter* recorder = nullptr;
    int codecs_opened = 0;
    std::vector<ProgressCall> progress;
};

} // namespace

TEST_F(ArchiveWriterTest, SingleFileIsNamedAfterItself) {
    const auto file = tmp / "a" / "file.txt";
    write_file(file, "0123456789");

    run(Options{}, {file});

    ASSERT_EQ(recorder->entries.size(), 1u);
    EXPECT_EQ(recorder->entries[0].entry.name, "file.txt");
    EXPECT_FALSE(recorder->entries[0].entry.is_directory);
    EXPECT_EQ(recorder->entries[0].entry.size, 10u);
    EXPECT_EQ(recorder->entries[0].data, "0123456789");
    EXPECT_TRUE(recorder->archive_closed);

    ASSERT_EQ(progress.size(), 1u);
    EXPECT_EQ(progress[0].percent, 100.0);
    EXPECT_EQ(progress[0].label, file.string());
}

TEST_F(ArchiveWriterTest, SingleFileIgnoresBaseFolderOption) {
    const auto file = tmp / "file.txt";
    write_file(file, "abc");

    run(Options{}.includeBaseFolderName(false), {file});

    EXPECT_EQ(recorder->names(), std::vector<std::string>{"file.txt"});
}

TEST_F(ArchiveWriterTest, FolderKeepsItsNameByDefault) {
    const auto dir = tmp / "a";
    write_file(dir / "x.txt", "hello");

    run(Options{}, {dir});

    EXPECT_EQ(recorder->names(), (std::vector<std::string>{"a/", "a/x.txt"}));
    EXPECT_TRUE(recorder->entries[0].entry.is_directory);
    EXPECT_TRUE(recorder->entries[0].data.empty());
    EXPECT_EQ(recorder->entries[1].data, "hello");
}

TEST_F(ArchiveWriterTest, FolderNameElidedWhenRequested) {
    const auto dir = tmp / "a";
    write_file(dir / "x.txt", "hello");
    write_file(dir / "sub" / "y.txt", "world");

    run(Options{}.includeBaseFolderName(false), {dir});

    EXPECT_EQ(sorted_names(), (std::vector<std::string>{"sub/", "sub/y.txt", "x.txt"}));
    EXPECT_LT(index_of("sub/"), index_of("sub/y.txt"));
}

TEST_F(ArchiveWriterTest, SeveralInputsKeepFolderNames) {
    const auto dir = tmp / "a";
    write_file(dir / "x.txt", "hello");
    const auto file = tmp / "b" / "c.txt";
    write_file(file, "see");

    run(Options{}.includeBaseFolderName(false), {dir, file});

    EXPECT_EQ(recorder->names(), (std::vector<std::string>{"a/", "a/x.txt", "c.txt"}));
}

TEST_F(ArchiveWriterTest, DepthFirstParentsBeforeChildren) {
    const auto dir = tmp / "root";
    write_file(dir / "one" / "two" / "three.txt", "3");
    write_file(dir / "one" / "uno.txt", "1");
    fs::create_directories(dir / "empty");

    run(Options{}, {dir});

    EXPECT_EQ(sorted_names(), (std::vector<std::string>{
        "root/", "root/empty/", "root/one/", "root/one/two/", "root/one/two/three.txt", "root/one/uno.txt"}));
    EXPECT_LT(index_of("root/"), index_of("root/one/"));
    EXPECT_LT(index_of("root/one/"), index_of("root/one/two/"));
    EXPECT_LT(index_of("root/one/two/"), index_of("root/one/two/three.txt"));
}

TEST_F(ArchiveWriterTest, CopiesThroughBufferOfConfiguredSize) {
    const auto file = tmp / "big.bin";
    std::string content;
    for (int i = 0; i < 10000; ++i) content.push_back(static_cast<char>(i % 251));
    write_file(file, content);

    run(Options{}.bufferSize(64), {file});

    ASSERT_EQ(recorder->entries.size(), 1u);
    EXPECT_EQ(recorder->entries[0].data, content);
    EXPECT_LE(recorder->max_write, 64u);
}

TEST_F(ArchiveWriterTest, ProgressIsMonotonicAndEndsAtHundred) {
    const auto dir = tmp / "data";
    write_file(dir / "a.txt", std::string(100, 'a'));
    write_file(dir / "b" / "c.txt", std::string(300, 'c'));
    write_file(dir / "b" / "d.txt", "");

    run(Options{}, {dir});

    ASSERT_EQ(progress.size(), recorder->entries.size());
    for (std::size_t i = 1; i < progress.size(); ++i) {
        EXPECT_LE(progress[i - 1].percent, progress[i].percent);
    }
    EXPECT_EQ(progress.back().percent, 100.0);
}

TEST_F(ArchiveWriterTest, EmptyFoldersReportHundredPercent) {
    const auto dir = tmp / "nothing";
    fs::create_directories(dir / "inner");

    run(Options{}, {dir});

    EXPECT_EQ(recorder->names(), (std::vector<std::string>{"nothing/", "nothing/inner/"}));
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_EQ(progress[0].percent, 100.0);
    EXPECT_EQ(progress[1].percent, 100.0);
}

TEST_F(ArchiveWriterTest, DuplicatePathsFailBeforeOpeningCodec) {
    const auto file = tmp / "x.txt";
    write_file(file, "x");

    try {
        run(Options{}, {file, tmp / "." / "x.txt"});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("x.txt"), std::string::npos);
    }
    EXPECT_EQ(codecs_opened, 0);
}

TEST_F(ArchiveWriterTest, TrailingSeparatorDoesNotHideDuplicate) {
    const auto dir = tmp / "d";
    fs::create_directories(dir);

    EXPECT_THROW(run(Options{}, {dir, fs::path(dir.string() + "/")}), ValidationError);
    EXPECT_EQ(codecs_opened, 0);
}

TEST_F(ArchiveWriterTest, EmptyInputIsRejected) {
    EXPECT_THROW(run(Options{}, {}), ValidationError);
    EXPECT_EQ(codecs_opened, 0);
}

TEST_F(ArchiveWriterTest, MissingInputFailsBeforeOpeningCodec) {
    EXPECT_THROW(run(Options{}, {tmp / "does-not-exist"}), IOError);
    EXPECT_EQ(codecs_opened, 0);
}
