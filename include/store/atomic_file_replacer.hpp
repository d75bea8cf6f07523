#ifndef PDFMETA_ATOMIC_FILE_REPLACER_HPP
#define PDFMETA_ATOMIC_FILE_REPLACER_HPP

#include <filesystem>
#include <functional>
#include <string>
#include "store/file_system.hpp"

namespace pdfmeta {
namespace store {

// Write-to-temp-then-rename. The target is either left untouched or holds the
// complete new contents; the temporary file never outlives a call.
class AtomicFileReplacer {
public:
  // ---- CONSTRUCTOR ----
  explicit AtomicFileReplacer(FileSystem& file_system);


  // ---- REPLACEMENT ----
  // Writes the output of `serialize` to a temporary sibling of `target` and
  // renames it over `target`. Failures of either step remove the temporary
  // file and throw IoError naming the step.
  void replace(const std::filesystem::path& target, const std::function<std::string()>& serialize);

  // Temporary path in the target's directory: <stem>_<nanoseconds>.pdf.tmp
  static std::filesystem::path make_temp_path(const std::filesystem::path& target);

private:
  // ---- PARAMETERS ----
  FileSystem& file_system_;

  // Best-effort cleanup, failures are logged only
  void discard_temp(const std::filesystem::path& temp_path);
};

} // namespace store
} // namespace pdfmeta

#endif // PDFMETA_ATOMIC_FILE_REPLACER_HPP
