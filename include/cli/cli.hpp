#pragma once

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include "store/metadata_store.hpp"

namespace pdfmeta {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(store::MetadataStore& store, std::filesystem::path pdf_path,
      std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Prompt loop until `quit` or end of input
  void run();
  // Prints the numbered metadata table of the current file
  void list_metadata();

  // Shortens values wider than the table column
  static std::string truncate_for_display(const std::string& value);

private:
  // ---- PARAMETERS ----
  bool running_;
  store::MetadataStore& store_;
  std::filesystem::path pdf_path_;
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::string& arguments);
  void handle_add_command(const std::string& arguments);
  void handle_edit_command(const std::string& arguments);
  void handle_rename_command(const std::string& arguments);
  void handle_delete_command(const std::string& arguments);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);


  // ---- INPUT SUPPORT ----
  std::optional<std::string> find_value(const std::string& key);
  // Offers the tagged encoding for non-ASCII values
  std::string prepare_value(const std::string& value);
  bool confirm(const std::string& question, bool default_answer);
};

} // namespace cli
} // namespace pdfmeta
