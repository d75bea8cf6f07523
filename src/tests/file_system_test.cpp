#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "store/file_system.hpp"
#include "error/metadata_error.hpp"
#include "test_utils.hpp"

using namespace pdfmeta;
using namespace pdfmeta::store;

class LocalFileSystemTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  LocalFileSystem file_system;

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() /
      ("pdfmeta_fs_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(test_dir);
    ASSERT_TRUE(std::filesystem::exists(test_dir));
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }
};

TEST_F(LocalFileSystemTest, WriteThenReadKeepsBinaryData) {
  std::string data;
  for (int i = 0; i < 10000; ++i) {
    data.push_back(static_cast<char>(i % 256));
  }
  const auto path = test_dir / "binary.pdf";

  file_system.write_file(path, data);
  EXPECT_TRUE(file_system.exists(path));
  EXPECT_EQ(file_system.read_file(path), data);
}

TEST_F(LocalFileSystemTest, WriteTruncatesExistingFile) {
  const auto path = test_dir / "file.pdf";
  file_system.write_file(path, "a much longer first version");
  file_system.write_file(path, "short");
  EXPECT_EQ(file_system.read_file(path), "short");
}

TEST_F(LocalFileSystemTest, EmptyFileReadsAsEmpty) {
  const auto path = test_dir / "empty.pdf";
  file_system.write_file(path, "");
  EXPECT_EQ(file_system.read_file(path), "");
}

TEST_F(LocalFileSystemTest, ReadMissingFileThrowsNotFound) {
  EXPECT_FALSE(file_system.exists(test_dir / "missing.pdf"));
  EXPECT_THROW(file_system.read_file(test_dir / "missing.pdf"), NotFoundError);
}

TEST_F(LocalFileSystemTest, WriteIntoMissingDirectoryThrowsIoError) {
  try {
    file_system.write_file(test_dir / "no_such_dir" / "file.pdf", "data");
    FAIL() << "Expected IoError";
  } catch (const IoError& e) {
    EXPECT_EQ(e.step(), IoStep::Write);
  }
}

TEST_F(LocalFileSystemTest, RenameReplacesTarget) {
  const auto from = test_dir / "new.pdf.tmp";
  const auto to = test_dir / "old.pdf";
  file_system.write_file(to, "old");
  file_system.write_file(from, "new");

  file_system.rename(from, to);
  EXPECT_FALSE(file_system.exists(from));
  EXPECT_EQ(file_system.read_file(to), "new");
}

TEST_F(LocalFileSystemTest, RenameMissingSourceThrowsIoError) {
  try {
    file_system.rename(test_dir / "absent.tmp", test_dir / "target.pdf");
    FAIL() << "Expected IoError";
  } catch (const IoError& e) {
    EXPECT_EQ(e.step(), IoStep::Rename);
  }
}

TEST_F(LocalFileSystemTest, RemoveIsBestEffort) {
  const auto path = test_dir / "doomed.pdf";
  file_system.write_file(path, "data");

  EXPECT_TRUE(file_system.remove(path));
  EXPECT_FALSE(file_system.exists(path));
  // Nothing to remove is not a failure
  EXPECT_TRUE(file_system.remove(path));
}
