#include "cli/cli.hpp"
#include "codec/text_encoding.hpp"
#include "codec/value_codec.hpp"
#include <iomanip>
#include <sstream>
#include <utility>
#include <boost/log/trivial.hpp>

namespace pdfmeta {
namespace cli {

namespace {

constexpr size_t DISPLAY_WIDTH = 60;
constexpr size_t TRUNCATED_WIDTH = 57;

// Splits "<first> <rest...>" at the first run of whitespace
std::pair<std::string, std::string> split_first(const std::string& text) {
  std::istringstream iss(text);
  std::string first;
  iss >> first;
  std::string rest;
  std::getline(iss >> std::ws, rest);
  return {first, rest};
}

std::string strip_slash(const std::string& key) {
  return (!key.empty() && key.front() == '/') ? key.substr(1) : key;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::MetadataStore& store, std::filesystem::path pdf_path, std::istream& in, std::ostream& out)
  : running_(false)
  , store_(store)
  , pdf_path_(std::move(pdf_path))
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized for " << pdf_path_.string();
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting loop";
  out_ << "PDF metadata editor" << std::endl;
  out_ << "File: " << pdf_path_.string() << std::endl;
  out_ << "Type 'help' for the list of commands." << std::endl;
  out_ << "pdfmeta> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    auto [command, arguments] = split_first(line);

    if (command == "quit" || command == "exit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, arguments);
    }

    if (running_) {
      out_ << "pdfmeta> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Loop ended";
}

void CLI::list_metadata() {
  std::vector<store::MetadataEntry> entries;
  try {
    entries = store_.get_metadata(pdf_path_);
  } catch (const std::exception& e) {
    log_and_display_error("Error reading metadata", e.what());
    return;
  }

  if (entries.empty()) {
    out_ << "No metadata found." << std::endl;
    return;
  }

  for (size_t i = 0; i < entries.size(); ++i) {
    out_ << std::right << std::setw(2) << (i + 1) << ". "
         << std::left << std::setw(20) << entries[i].key << ": "
         << truncate_for_display(entries[i].value) << std::endl;
  }
  out_ << std::right << "Total: " << entries.size() << " entries" << std::endl;
}

std::string CLI::truncate_for_display(const std::string& value) {
  if (value.size() <= DISPLAY_WIDTH) {
    return value;
  }

  // Never cut inside a UTF-8 sequence
  size_t cut = TRUNCATED_WIDTH;
  while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return value.substr(0, cut) + "...";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& arguments) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with arguments: " << arguments;

  if (command == "list" || command == "ls") {
    list_metadata();
  }
  else if (command == "add") {
    handle_add_command(arguments);
  }
  else if (command == "edit") {
    handle_edit_command(arguments);
  }
  else if (command == "rename") {
    handle_rename_command(arguments);
  }
  else if (command == "delete") {
    handle_delete_command(arguments);
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    out_ << "Unknown command. Type 'help' for the list of commands." << std::endl;
  }
}

void CLI::handle_add_command(const std::string& arguments) {
  auto [raw_key, value] = split_first(arguments);
  const std::string key = strip_slash(raw_key);
  if (key.empty()) {
    out_ << "Usage: add <key> <value>" << std::endl;
    return;
  }

  try {
    if (find_value(key)) {
      out_ << "Key '" << key << "' already exists. Use 'edit' to change it." << std::endl;
      return;
    }
    store_.update_metadata_in_place(pdf_path_, key, prepare_value(value));
    out_ << "Metadata '" << key << "' created." << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error creating metadata", e.what());
  }
}

void CLI::handle_edit_command(const std::string& arguments) {
  auto [raw_key, value] = split_first(arguments);
  const std::string key = strip_slash(raw_key);
  if (key.empty()) {
    out_ << "Usage: edit <key> <value>" << std::endl;
    return;
  }

  try {
    auto current = find_value(key);
    if (!current) {
      out_ << "Key '" << key << "' not found." << std::endl;
      return;
    }
    out_ << "Current value: " << *current << std::endl;
    store_.update_metadata_in_place(pdf_path_, key, prepare_value(value));
    out_ << "Metadata '" << key << "' updated." << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error updating metadata", e.what());
  }
}

void CLI::handle_rename_command(const std::string& arguments) {
  auto [raw_old, rest] = split_first(arguments);
  auto [raw_new, extra] = split_first(rest);
  const std::string old_key = strip_slash(raw_old);
  const std::string new_key = strip_slash(raw_new);
  if (old_key.empty() || new_key.empty() || !extra.empty()) {
    out_ << "Usage: rename <old key> <new key>" << std::endl;
    return;
  }
  if (old_key == new_key) {
    out_ << "The new key must differ from the current key." << std::endl;
    return;
  }

  try {
    if (!find_value(old_key)) {
      out_ << "Key '" << old_key << "' not found." << std::endl;
      return;
    }
    if (find_value(new_key)) {
      out_ << "Key '" << new_key << "' already exists." << std::endl;
      return;
    }
    store_.rename_metadata_key_in_place(pdf_path_, old_key, new_key);
    out_ << "Renamed '" << old_key << "' to '" << new_key << "'." << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error renaming metadata key", e.what());
  }
}

void CLI::handle_delete_command(const std::string& arguments) {
  const std::string key = strip_slash(split_first(arguments).first);
  if (key.empty()) {
    out_ << "Usage: delete <key>" << std::endl;
    return;
  }

  try {
    auto current = find_value(key);
    if (!current) {
      out_ << "Key '" << key << "' not found." << std::endl;
      return;
    }
    out_ << "Value: " << *current << std::endl;
    if (!confirm("Delete '" + key + "'?", false)) {
      out_ << "Cancelled." << std::endl;
      return;
    }
    if (store_.remove_metadata_in_place(pdf_path_, key)) {
      out_ << "Metadata '" << key << "' deleted." << std::endl;
    } else {
      out_ << "Key '" << key << "' not found." << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting metadata", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  list                  List all metadata entries" << std::endl;
  out_ << "  add <key> <value>     Create a new entry" << std::endl;
  out_ << "  edit <key> <value>    Change the value of an entry" << std::endl;
  out_ << "  rename <old> <new>    Change the key of an entry" << std::endl;
  out_ << "  delete <key>          Remove an entry" << std::endl;
  out_ << "  help                  Display this help message" << std::endl;
  out_ << "  quit                  Exit the editor" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}


//==============================================
// INPUT SUPPORT
//==============================================

std::optional<std::string> CLI::find_value(const std::string& key) {
  for (const auto& entry : store_.get_metadata(pdf_path_)) {
    if (entry.key == key) {
      return entry.value;
    }
  }
  return std::nullopt;
}

std::string CLI::prepare_value(const std::string& value) {
  const bool use_tagged = codec::has_non_ascii(value)
    && confirm("Value contains non-ASCII characters. Use UTF16BE base64 encoding?", true);
  return codec::ValueCodec::encode_for_storage(value, use_tagged);
}

bool CLI::confirm(const std::string& question, bool default_answer) {
  out_ << question << (default_answer ? " [Y/n] " : " [y/N] ") << std::flush;

  std::string answer;
  if (!std::getline(in_, answer)) {
    return default_answer;
  }

  const std::string word = split_first(answer).first;
  if (word.empty()) {
    return default_answer;
  }
  if (word[0] == 'y' || word[0] == 'Y') {
    return true;
  }
  if (word[0] == 'n' || word[0] == 'N') {
    return false;
  }
  return default_answer;
}

} // namespace cli
} // namespace pdfmeta
