#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include "cli/cli.hpp"
#include "store/metadata_store.hpp"
#include "test_utils.hpp"

using namespace pdfmeta;
using namespace pdfmeta::store;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Not;

class CLITest : public ::testing::Test {
protected:
  const std::string PDF_PATH = "/docs/cli.pdf";

  FakeFileSystem file_system;
  FixedClock clock{2024, 3, 15, 10, 30, 45, 0};
  std::unique_ptr<MetadataStore> store;

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    file_system.files[PDF_PATH] = empty_pdf_bytes();
    store = std::make_unique<MetadataStore>(file_system, clock);
  }

  // Runs the shell over `script` and returns everything it printed
  std::string run_script(const std::string& script) {
    std::istringstream in(script);
    std::ostringstream out;
    cli::CLI shell(*store, PDF_PATH, in, out);
    shell.run();
    return out.str();
  }

  std::vector<MetadataEntry> metadata() {
    return store->get_metadata(PDF_PATH);
  }

  static std::string padded(const std::string& key) {
    return key + std::string(20 - key.size(), ' ');
  }
};

TEST_F(CLITest, ListOnEmptyDocument) {
  std::istringstream in;
  std::ostringstream out;
  cli::CLI shell(*store, PDF_PATH, in, out);

  shell.list_metadata();
  EXPECT_EQ(out.str(), "No metadata found.\n");
}

TEST_F(CLITest, ListPrintsNumberedTable) {
  store->update_metadata_in_place(PDF_PATH, "Author", "Jane Doe");

  const std::string output = run_script("list\nquit\n");
  EXPECT_THAT(output, HasSubstr(" 1. " + padded("Author") + ": Jane Doe\n"));
  EXPECT_THAT(output, HasSubstr(" 2. " + padded("ModDate") + ": D:20240315103045+00'00'\n"));
  EXPECT_THAT(output, HasSubstr("Total: 2 entries\n"));
}

TEST_F(CLITest, AddCreatesEntry) {
  const std::string output = run_script("add Title Quarterly Report\nquit\n");

  EXPECT_THAT(output, HasSubstr("Metadata 'Title' created."));
  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Title", "Quarterly Report"}));
}

TEST_F(CLITest, AddRefusesExistingKey) {
  store->update_metadata_in_place(PDF_PATH, "Title", "Original");

  const std::string output = run_script("add Title Replacement\n");

  EXPECT_THAT(output, HasSubstr("Key 'Title' already exists."));
  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Title", "Original"}));
}

TEST_F(CLITest, AddWithoutKeyPrintsUsage) {
  EXPECT_THAT(run_script("add\n"), HasSubstr("Usage: add <key> <value>"));
}

TEST_F(CLITest, NonAsciiValueUsesTaggedEncodingByDefault) {
  const std::string value = "Jo\xC3\xA3o";
  const std::string output = run_script("add Author " + value + "\n\n");

  EXPECT_THAT(output, HasSubstr("[Y/n]"));
  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Author", value}));
  EXPECT_NE(file_system.files.at(PDF_PATH).find("UTF16BE:"), std::string::npos);
}

TEST_F(CLITest, NonAsciiValueStoredLiterallyWhenDeclined) {
  const std::string value = "Jo\xC3\xA3o";
  run_script("add Author " + value + "\nn\n");

  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Author", value}));
  EXPECT_EQ(file_system.files.at(PDF_PATH).find("UTF16BE:"), std::string::npos);
}

TEST_F(CLITest, EditChangesExistingValue) {
  store->update_metadata_in_place(PDF_PATH, "Subject", "Draft");

  const std::string output = run_script("edit Subject Final version\n");

  EXPECT_THAT(output, HasSubstr("Current value: Draft"));
  EXPECT_THAT(output, HasSubstr("Metadata 'Subject' updated."));
  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Subject", "Final version"}));
}

TEST_F(CLITest, EditRefusesUnknownKey) {
  const std::string output = run_script("edit Subject Anything\n");

  EXPECT_THAT(output, HasSubstr("Key 'Subject' not found."));
  EXPECT_TRUE(metadata().empty());
}

TEST_F(CLITest, RenameMovesEntry) {
  store->update_metadata_in_place(PDF_PATH, "Autor", "Jane Doe");

  const std::string output = run_script("rename Autor Author\n");

  EXPECT_THAT(output, HasSubstr("Renamed 'Autor' to 'Author'."));
  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Author", "Jane Doe"}));
  EXPECT_THAT(metadata(), Not(Contains(MetadataEntry{"Autor", "Jane Doe"})));
}

TEST_F(CLITest, RenameRefusesInvalidRequests) {
  store->update_metadata_in_place(PDF_PATH, "Author", "Jane Doe");
  store->update_metadata_in_place(PDF_PATH, "Title", "Report");

  EXPECT_THAT(run_script("rename Author Author\n"), HasSubstr("must differ"));
  EXPECT_THAT(run_script("rename Missing Other\n"), HasSubstr("Key 'Missing' not found."));
  EXPECT_THAT(run_script("rename Author Title\n"), HasSubstr("Key 'Title' already exists."));
  EXPECT_THAT(run_script("rename Author\n"), HasSubstr("Usage: rename"));

  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Author", "Jane Doe"}));
  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Title", "Report"}));
}

TEST_F(CLITest, DeleteAsksForConfirmation) {
  store->update_metadata_in_place(PDF_PATH, "Keywords", "alpha, beta");

  const std::string cancelled = run_script("delete Keywords\n\n");
  EXPECT_THAT(cancelled, HasSubstr("[y/N]"));
  EXPECT_THAT(cancelled, HasSubstr("Cancelled."));
  EXPECT_THAT(metadata(), Contains(MetadataEntry{"Keywords", "alpha, beta"}));

  const std::string confirmed = run_script("delete Keywords\ny\n");
  EXPECT_THAT(confirmed, HasSubstr("Metadata 'Keywords' deleted."));
  for (const auto& entry : metadata()) {
    EXPECT_NE(entry.key, "Keywords");
  }
}

TEST_F(CLITest, DeleteUnknownKey) {
  EXPECT_THAT(run_script("delete Keywords\n"), HasSubstr("Key 'Keywords' not found."));
}

TEST_F(CLITest, HelpAndUnknownCommands) {
  const std::string output = run_script("help\nfrobnicate\nquit\n");
  EXPECT_THAT(output, HasSubstr("Available commands:"));
  EXPECT_THAT(output, HasSubstr("rename <old> <new>"));
  EXPECT_THAT(output, HasSubstr("Unknown command."));
}

TEST_F(CLITest, QuitStopsReadingInput) {
  run_script("quit\nadd Title Ignored\n");
  EXPECT_TRUE(metadata().empty());
}

TEST_F(CLITest, ErrorsAreReportedAndLoopContinues) {
  file_system.files.erase(PDF_PATH);

  const std::string output = run_script("list\nhelp\n");
  EXPECT_THAT(output, HasSubstr("Error reading metadata: Not found:"));
  EXPECT_THAT(output, HasSubstr("Available commands:"));
}

TEST_F(CLITest, WriteFailureIsReported) {
  file_system.fail_writes = true;

  const std::string output = run_script("add Title Report\n");
  EXPECT_THAT(output, HasSubstr("Error creating metadata: Serialize error:"));
  EXPECT_TRUE(metadata().empty());
}

TEST_F(CLITest, TruncatesLongValues) {
  const std::string sixty(60, 'x');
  EXPECT_EQ(cli::CLI::truncate_for_display(sixty), sixty);
  EXPECT_EQ(cli::CLI::truncate_for_display(std::string(61, 'x')), std::string(57, 'x') + "...");

  // A two-byte character straddling the cut is dropped whole
  const std::string value = std::string(56, 'a') + "\xC3\xA9" + std::string(10, 'b');
  EXPECT_EQ(cli::CLI::truncate_for_display(value), std::string(56, 'a') + "...");
}
