#include "store/file_system.hpp"
#include "error/metadata_error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <system_error>

namespace pdfmeta {
namespace store {

//==============================================
// QUERY OPERATIONS
//==============================================

bool LocalFileSystem::exists(const std::filesystem::path& path) const {
  std::error_code ec;
  bool found = std::filesystem::exists(path, ec);
  BOOST_LOG_TRIVIAL(debug) << "File system: " << path.string() << (found ? " exists" : " not found");
  return found && !ec;
}


//==============================================
// CORE FILE OPERATIONS
//==============================================

std::string LocalFileSystem::read_file(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(debug) << "File system: Reading " << path.string();

  if (!exists(path)) {
    BOOST_LOG_TRIVIAL(error) << "File system: File not found: " << path.string();
    throw NotFoundError(path.string());
  }

  // Open file in binary mode to keep PDF bytes intact
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw IoError(IoStep::Read, "Failed to open file: " + path.string());
  }

  std::string contents;
  char buffer[4096];

  // Read file in chunks to handle large files efficiently
  while (file.read(buffer, sizeof(buffer))) {
    contents.append(buffer, file.gcount());
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    contents.append(buffer, file.gcount());
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "File system: Read failed for " << path.string();
    throw IoError(IoStep::Read, "Failed to read file: " + path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "File system: Read " << contents.size() << " bytes from " << path.string();
  return contents;
}

void LocalFileSystem::write_file(const std::filesystem::path& path, const std::string& data) {
  BOOST_LOG_TRIVIAL(debug) << "File system: Writing " << data.size() << " bytes to " << path.string();

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "File system: Failed to create file: " << path.string();
    throw IoError(IoStep::Write, "Failed to create file: " + path.string());
  }

  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.flush();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "File system: Failed to write file: " << path.string();
    throw IoError(IoStep::Write, "Failed to write file: " + path.string());
  }

  // Close explicitly so that a failed close is reported
  file.close();
  if (file.fail()) {
    throw IoError(IoStep::Write, "Failed to close file: " + path.string());
  }
}

void LocalFileSystem::rename(const std::filesystem::path& from, const std::filesystem::path& to) {
  BOOST_LOG_TRIVIAL(debug) << "File system: Renaming " << from.string() << " to " << to.string();

  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File system: Rename failed: " << ec.message();
    throw IoError(IoStep::Rename, ec.message());
  }
}

bool LocalFileSystem::remove(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "File system: Failed to remove " << path.string() << ": " << ec.message();
    return false;
  }
  return true;
}

} // namespace store
} // namespace pdfmeta
