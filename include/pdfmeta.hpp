#ifndef PDFMETA_HPP
#define PDFMETA_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "error/metadata_error.hpp"
#include "store/metadata_store.hpp"

namespace pdfmeta {

using store::MetadataEntry;

// ---- PATH OPERATIONS ----
// Bound to the local filesystem and the system clock
std::vector<MetadataEntry> get_metadata(const std::filesystem::path& path);
void set_metadata(const std::filesystem::path& input_path, const std::filesystem::path& output_path,
                  const std::string& key, const std::string& value);
void update_metadata_in_place(const std::filesystem::path& path, const std::string& key,
                              const std::string& value);
bool remove_metadata_in_place(const std::filesystem::path& path, const std::string& key);
void rename_metadata_key_in_place(const std::filesystem::path& path, const std::string& old_key,
                                  const std::string& new_key);


// ---- BUFFER OPERATIONS ----
std::vector<MetadataEntry> get_metadata_from_bytes(const std::string& bytes);
std::string set_metadata_in_bytes(const std::string& bytes, const std::string& key, const std::string& value);
std::string update_metadata_in_bytes(const std::string& bytes, const std::string& key, const std::string& value);
std::string remove_metadata_in_bytes(const std::string& bytes, const std::string& key);
std::string rename_metadata_key_in_bytes(const std::string& bytes, const std::string& old_key,
                                         const std::string& new_key);

} // namespace pdfmeta

#endif // PDFMETA_HPP
