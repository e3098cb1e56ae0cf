#include <range-transfer/errors.hpp>
#include <range-transfer/local_file.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

using test_support::TempDir;

class LocalFileTest : public ::testing::Test {
protected:
  LocalFileTest() : dir_("local_file_test") {}

  TempDir dir_;
};

TEST_F(LocalFileTest, CreatesMissingFileEmpty) {
  rangexfer::LocalFile file(dir_ / "new.bin");

  EXPECT_TRUE(std::filesystem::exists(dir_ / "new.bin"));
  EXPECT_EQ(file.size(), 0u);
}

TEST_F(LocalFileTest, OpensExistingFileWithoutTruncation) {
  test_support::writeFile(dir_ / "partial.bin", "0123456789");

  rangexfer::LocalFile file(dir_ / "partial.bin");

  EXPECT_EQ(file.size(), 10u);
  EXPECT_EQ(test_support::readFile(dir_ / "partial.bin"), "0123456789");
}

TEST_F(LocalFileTest, WritesAtSeekOffset) {
  test_support::writeFile(dir_ / "partial.bin", "hello");
  {
    rangexfer::LocalFile file(dir_ / "partial.bin");
    file.seek(file.size());
    file.write(" world", 6);
    EXPECT_EQ(file.size(), 11u);
  }
  EXPECT_EQ(test_support::readFile(dir_ / "partial.bin"), "hello world");
}

TEST_F(LocalFileTest, FailsInMissingDirectory) {
  EXPECT_THROW(rangexfer::LocalFile(dir_ / "no" / "such" / "file"),
               rangexfer::IoError);
}

TEST_F(LocalFileTest, BufferedWriterHoldsBytesUntilFlush) {
  rangexfer::LocalFile file(dir_ / "buffered.bin");
  rangexfer::BufferedFileWriter writer(file, 16);

  writer.write("abcdef", 6);
  EXPECT_EQ(writer.pending(), 6u);
  EXPECT_EQ(file.size(), 0u);

  writer.flush();
  EXPECT_EQ(writer.pending(), 0u);
  EXPECT_EQ(file.size(), 6u);
  EXPECT_EQ(writer.bytesWritten(), 6u);
}

TEST_F(LocalFileTest, BufferedWriterSpillsWhenFull) {
  rangexfer::LocalFile file(dir_ / "spill.bin");
  rangexfer::BufferedFileWriter writer(file, 8);

  writer.write("0123", 4);
  writer.write("456789AB", 8);

  EXPECT_EQ(file.size(), 8u);
  EXPECT_EQ(writer.pending(), 4u);

  writer.flush();
  EXPECT_EQ(test_support::readFile(dir_ / "spill.bin"), "0123456789AB");
}

TEST_F(LocalFileTest, LargeWritesBypassEmptyBuffer) {
  auto data = test_support::makeBinary(100000);
  rangexfer::LocalFile file(dir_ / "large.bin");
  rangexfer::BufferedFileWriter writer(file, 4096);

  writer.write(data.data(), data.size());

  EXPECT_EQ(writer.pending(), 0u);
  EXPECT_EQ(file.size(), 100000u);
  EXPECT_TRUE(test_support::readFile(dir_ / "large.bin") == data);
}

TEST_F(LocalFileTest, DestructorDoesNotFlush) {
  {
    rangexfer::LocalFile file(dir_ / "unflushed.bin");
    rangexfer::BufferedFileWriter writer(file, 64);
    writer.write("lost", 4);
  }
  EXPECT_EQ(std::filesystem::file_size(dir_ / "unflushed.bin"), 0u);
}
