//
// Created by the packrat authors on 18/10/26.
//

#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libpackrat/include/packrat.hpp"
#include <sstream>

namespace fs = std::filesystem;
using namespace packrat;
using packrat::test::TempDir;
using packrat::test::write_file;

TEST(OptionsTest, Defaults) {
    const Options opts;
    EXPECT_EQ(opts.buffer_size(), 4096u);
    EXPECT_TRUE(opts.include_base_folder_name());
    EXPECT_FALSE(opts.progress_observer());
    EXPECT_EQ(opts.compression(), Compression::Deflate);
    EXPECT_FALSE(opts.overwrite_existing());
}

TEST(OptionsTest, ZeroBufferSizeIsRejected) {
    EXPECT_THROW(Options{}.bufferSize(0).validate(), ConfigurationError);
    EXPECT_NO_THROW(Options{}.bufferSize(1).validate());
}

TEST(OptionsTest, PackWithZeroBufferCreatesNothing) {
    TempDir tmp;
    write_file(tmp / "a.txt", "abc");
    const auto archive = tmp / "out.zip";

    EXPECT_THROW(pack(archive, Options{}.bufferSize(0), {tmp / "a.txt"}), ConfigurationError);
    EXPECT_FALSE(fs::exists(archive));
}

TEST(OptionsTest, UnpackWithZeroBufferIsRejected) {
    TempDir tmp;
    std::stringstream empty;
    EXPECT_THROW(unpack(empty, tmp / "dest", Options{}.bufferSize(0)), ConfigurationError);
}
