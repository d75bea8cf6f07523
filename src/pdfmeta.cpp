#include "pdfmeta.hpp"
#include "store/clock.hpp"
#include "store/file_system.hpp"

namespace pdfmeta {

namespace {

store::MetadataStore& default_store() {
  static store::LocalFileSystem file_system;
  static store::SystemClock clock;
  static store::MetadataStore metadata_store(file_system, clock);
  return metadata_store;
}

} // namespace

//==============================================
// PATH OPERATIONS
//==============================================

std::vector<MetadataEntry> get_metadata(const std::filesystem::path& path) {
  return default_store().get_metadata(path);
}

void set_metadata(const std::filesystem::path& input_path, const std::filesystem::path& output_path,
                  const std::string& key, const std::string& value) {
  default_store().set_metadata(input_path, output_path, key, value);
}

void update_metadata_in_place(const std::filesystem::path& path, const std::string& key,
                              const std::string& value) {
  default_store().update_metadata_in_place(path, key, value);
}

bool remove_metadata_in_place(const std::filesystem::path& path, const std::string& key) {
  return default_store().remove_metadata_in_place(path, key);
}

void rename_metadata_key_in_place(const std::filesystem::path& path, const std::string& old_key,
                                  const std::string& new_key) {
  default_store().rename_metadata_key_in_place(path, old_key, new_key);
}


//==============================================
// BUFFER OPERATIONS
//==============================================

std::vector<MetadataEntry> get_metadata_from_bytes(const std::string& bytes) {
  return default_store().get_metadata_from_bytes(bytes);
}

std::string set_metadata_in_bytes(const std::string& bytes, const std::string& key, const std::string& value) {
  return default_store().set_metadata_in_bytes(bytes, key, value);
}

std::string update_metadata_in_bytes(const std::string& bytes, const std::string& key, const std::string& value) {
  return default_store().update_metadata_in_bytes(bytes, key, value);
}

std::string remove_metadata_in_bytes(const std::string& bytes, const std::string& key) {
  return default_store().remove_metadata_in_bytes(bytes, key);
}

std::string rename_metadata_key_in_bytes(const std::string& bytes, const std::string& old_key,
                                         const std::string& new_key) {
  return default_store().rename_metadata_key_in_bytes(bytes, old_key, new_key);
}

} // namespace pdfmeta
