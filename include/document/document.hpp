#ifndef PDFMETA_DOCUMENT_HPP
#define PDFMETA_DOCUMENT_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

namespace pdfmeta {
namespace document {

// Exclusively owned in-memory PDF. Thin boundary over qpdf: every qpdf
// load failure surfaces as MalformedContainerError and every write failure
// as IoError.
class Document {
public:
  // ---- CONSTRUCTION ----
  // Minimal valid PDF with a catalog, an empty page tree and no Info dictionary
  static Document create_empty();
  static Document load(const std::filesystem::path& path);
  // `description` names the source in qpdf messages
  static Document load_from_buffer(const std::string& bytes,
                                   const std::string& description = "memory buffer");

  Document(Document&&) noexcept = default;
  Document& operator=(Document&& other) noexcept;
  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;
  ~Document() = default;


  // ---- OBJECT GRAPH ----
  // Object behind trailer key `name`, only when that key holds an indirect reference
  std::optional<QPDFObjectHandle> get_trailer_reference(const std::string& name);
  // Adds `object` to the document's object table and returns the indirect handle
  QPDFObjectHandle add_object(QPDFObjectHandle object);
  void set_trailer(const std::string& name, QPDFObjectHandle value);


  // ---- PERSISTENCE ----
  void save(const std::filesystem::path& path);
  std::string save_to_buffer();

private:
  Document(std::unique_ptr<std::string> source, std::unique_ptr<QPDF> pdf);

  // ---- PARAMETERS ----
  // qpdf reads lazily from the source buffer, so it must outlive pdf_
  std::unique_ptr<std::string> source_;
  std::unique_ptr<QPDF> pdf_;
};

} // namespace document
} // namespace pdfmeta

#endif // PDFMETA_DOCUMENT_HPP
