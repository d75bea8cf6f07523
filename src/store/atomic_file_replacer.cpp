#include "store/atomic_file_replacer.hpp"
#include "error/metadata_error.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>

namespace pdfmeta {
namespace store {

AtomicFileReplacer::AtomicFileReplacer(FileSystem& file_system)
  : file_system_(file_system) {
}

void AtomicFileReplacer::replace(const std::filesystem::path& target,
                                 const std::function<std::string()>& serialize) {
  const std::filesystem::path temp_path = make_temp_path(target);
  BOOST_LOG_TRIVIAL(info) << "Atomic replace: Updating " << target.string()
                          << " through " << temp_path.string();

  // Write the complete document next to the target
  try {
    const std::string data = serialize();
    file_system_.write_file(temp_path, data);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Atomic replace: Failed to save temporary file: " << e.what();
    discard_temp(temp_path);
    throw IoError(IoStep::Serialize,
                  "Error saving to temporary file '" + temp_path.string() + "': " + e.what());
  }

  // Same directory, so the rename stays on one filesystem
  try {
    file_system_.rename(temp_path, target);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Atomic replace: Failed to rename temporary file: " << e.what();
    discard_temp(temp_path);
    throw IoError(IoStep::Rename,
                  "Error renaming temporary file '" + temp_path.string() + "' to original '"
                  + target.string() + "': " + e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Atomic replace: Successfully replaced " << target.string();
}

std::filesystem::path AtomicFileReplacer::make_temp_path(const std::filesystem::path& target) {
  std::string stem = target.stem().string();
  if (stem.empty()) {
    stem = "temp_pdf_update";
  }

  const auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();

  return target.parent_path() / (stem + "_" + std::to_string(stamp) + ".pdf.tmp");
}

void AtomicFileReplacer::discard_temp(const std::filesystem::path& temp_path) {
  if (!file_system_.remove(temp_path)) {
    BOOST_LOG_TRIVIAL(warning) << "Atomic replace: Could not remove temporary file: " << temp_path.string();
  }
}

} // namespace store
} // namespace pdfmeta
