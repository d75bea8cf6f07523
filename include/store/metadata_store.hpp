#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "document/document.hpp"
#include "store/atomic_file_replacer.hpp"
#include "store/clock.hpp"
#include "store/file_system.hpp"

namespace pdfmeta {
namespace store {

struct MetadataEntry {
  std::string key;
  std::string value;

  bool operator==(const MetadataEntry& other) const {
    return key == other.key && value == other.value;
  }
};

class MetadataStore {
public:

  // ---- CONSTRUCTOR ----
  MetadataStore(FileSystem& file_system, const Clock& clock);


  // ---- DOCUMENT OPERATIONS ----
  // Decoded entries of the Info dictionary; empty when the document has none
  std::vector<MetadataEntry> list(document::Document& doc) const;
  // Sets `key` to the literal form of `value` and stamps ModDate, creating
  // the Info dictionary when missing
  void put(document::Document& doc, const std::string& key, const std::string& value) const;
  // Removes `key` and stamps ModDate. Returns false, leaving the document
  // untouched, when there is nothing to remove.
  bool remove(document::Document& doc, const std::string& key) const;
  // Moves the stored value of `old_key` to `new_key` unchanged and stamps ModDate
  void rename_key(document::Document& doc, const std::string& old_key, const std::string& new_key) const;


  // ---- PATH ENTRY POINTS ----
  std::vector<MetadataEntry> get_metadata(const std::filesystem::path& path) const;
  // Writes the updated document to `output_path`; `input_path` is not modified
  void set_metadata(const std::filesystem::path& input_path, const std::filesystem::path& output_path,
                    const std::string& key, const std::string& value);
  // Atomic replace of `path`. Throws NotFoundError before any work if `path` is missing.
  void update_metadata_in_place(const std::filesystem::path& path, const std::string& key,
                                const std::string& value);
  bool remove_metadata_in_place(const std::filesystem::path& path, const std::string& key);
  void rename_metadata_key_in_place(const std::filesystem::path& path, const std::string& old_key,
                                    const std::string& new_key);


  // ---- BUFFER ENTRY POINTS ----
  std::vector<MetadataEntry> get_metadata_from_bytes(const std::string& bytes) const;
  std::string set_metadata_in_bytes(const std::string& bytes, const std::string& key,
                                    const std::string& value) const;
  // Same transform as set_metadata_in_bytes
  std::string update_metadata_in_bytes(const std::string& bytes, const std::string& key,
                                       const std::string& value) const;
  std::string remove_metadata_in_bytes(const std::string& bytes, const std::string& key) const;
  std::string rename_metadata_key_in_bytes(const std::string& bytes, const std::string& old_key,
                                           const std::string& new_key) const;

private:
  // ---- PARAMETERS ----
  FileSystem& file_system_;
  const Clock& clock_;
  AtomicFileReplacer replacer_;


  // ---- INFO DICTIONARY SUPPORT ----
  // Info dictionary reachable through an indirect trailer reference, if any
  std::optional<QPDFObjectHandle> find_info_dictionary(document::Document& doc) const;
  QPDFObjectHandle find_or_create_info_dictionary(document::Document& doc) const;
  void stamp_modification_date(QPDFObjectHandle& info) const;


  // ---- SOURCE AND SINK SUPPORT ----
  document::Document load_from_path(const std::filesystem::path& path) const;
  // Loads `path`, applies `mutate`, and atomically replaces `path` when `mutate` returns true
  bool transform_in_place(const std::filesystem::path& path,
                          const std::function<bool(document::Document&)>& mutate);
  std::string transform_bytes(const std::string& bytes,
                              const std::function<void(document::Document&)>& mutate) const;
};

} // namespace store
} // namespace pdfmeta
