#ifndef PDFMETA_FILE_SYSTEM_HPP
#define PDFMETA_FILE_SYSTEM_HPP

#include <filesystem>
#include <string>

namespace pdfmeta {
namespace store {

// Filesystem side effects used by the metadata store
class FileSystem {
public:
  virtual ~FileSystem() = default;

  virtual bool exists(const std::filesystem::path& path) const = 0;
  // Throws NotFoundError if the file is missing, IoError on read failure
  virtual std::string read_file(const std::filesystem::path& path) const = 0;
  // Creates or truncates `path`. Throws IoError on failure.
  virtual void write_file(const std::filesystem::path& path, const std::string& data) = 0;
  // Replaces `to` with `from`. Throws IoError on failure.
  virtual void rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
  // Best-effort removal. Returns false only when an existing file could not be removed.
  virtual bool remove(const std::filesystem::path& path) = 0;
};

class LocalFileSystem : public FileSystem {
public:
  bool exists(const std::filesystem::path& path) const override;
  std::string read_file(const std::filesystem::path& path) const override;
  void write_file(const std::filesystem::path& path, const std::string& data) override;
  void rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
  bool remove(const std::filesystem::path& path) override;
};

} // namespace store
} // namespace pdfmeta

#endif // PDFMETA_FILE_SYSTEM_HPP
