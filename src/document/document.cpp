#include "document/document.hpp"
#include "error/metadata_error.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFWriter.hh>
#include <boost/log/trivial.hpp>

namespace pdfmeta {
namespace document {

//==============================================
// CONSTRUCTION
//==============================================

Document::Document(std::unique_ptr<std::string> source, std::unique_ptr<QPDF> pdf)
  : source_(std::move(source))
  , pdf_(std::move(pdf)) {
}

Document& Document::operator=(Document&& other) noexcept {
  // Release the old object graph before the buffer it reads from
  pdf_ = std::move(other.pdf_);
  source_ = std::move(other.source_);
  return *this;
}

Document Document::create_empty() {
  BOOST_LOG_TRIVIAL(debug) << "Document: Creating empty document";
  auto pdf = std::make_unique<QPDF>();
  pdf->emptyPDF();
  return Document(nullptr, std::move(pdf));
}

Document Document::load(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Document: Loading " << path.string();

  auto pdf = std::make_unique<QPDF>();
  pdf->setSuppressWarnings(true);
  try {
    pdf->processFile(path.string().c_str());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Document: Failed to load " << path.string() << ": " << e.what();
    throw MalformedContainerError(e.what());
  }
  return Document(nullptr, std::move(pdf));
}

Document Document::load_from_buffer(const std::string& bytes, const std::string& description) {
  BOOST_LOG_TRIVIAL(info) << "Document: Loading " << bytes.size() << " bytes from " << description;

  auto source = std::make_unique<std::string>(bytes);
  auto pdf = std::make_unique<QPDF>();
  pdf->setSuppressWarnings(true);
  try {
    pdf->processMemoryFile(description.c_str(), source->data(), source->size());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Document: Failed to load " << description << ": " << e.what();
    throw MalformedContainerError(e.what());
  }
  return Document(std::move(source), std::move(pdf));
}


//==============================================
// OBJECT GRAPH
//==============================================

std::optional<QPDFObjectHandle> Document::get_trailer_reference(const std::string& name) {
  QPDFObjectHandle trailer = pdf_->getTrailer();
  if (!trailer.hasKey(name)) {
    BOOST_LOG_TRIVIAL(debug) << "Document: Trailer has no " << name << " entry";
    return std::nullopt;
  }

  QPDFObjectHandle value = trailer.getKey(name);
  if (!value.isIndirect()) {
    BOOST_LOG_TRIVIAL(debug) << "Document: Trailer entry " << name << " is not an indirect reference";
    return std::nullopt;
  }
  return value;
}

QPDFObjectHandle Document::add_object(QPDFObjectHandle object) {
  QPDFObjectHandle reference = pdf_->makeIndirectObject(object);
  BOOST_LOG_TRIVIAL(debug) << "Document: Added object " << reference.getObjectID()
                           << " " << reference.getGeneration() << " R";
  return reference;
}

void Document::set_trailer(const std::string& name, QPDFObjectHandle value) {
  pdf_->getTrailer().replaceKey(name, value);
}


//==============================================
// PERSISTENCE
//==============================================

void Document::save(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Document: Writing " << path.string();
  try {
    QPDFWriter writer(*pdf_, path.string().c_str());
    writer.write();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Document: Failed to write " << path.string() << ": " << e.what();
    throw IoError(IoStep::Serialize, "Failed to write '" + path.string() + "': " + e.what());
  }
}

std::string Document::save_to_buffer() {
  try {
    QPDFWriter writer(*pdf_);
    writer.setOutputMemory();
    writer.write();

    // QPDFWriter hands ownership of the buffer to the caller
    std::unique_ptr<Buffer> buffer(writer.getBuffer());
    std::string bytes(reinterpret_cast<const char*>(buffer->getBuffer()), buffer->getSize());
    BOOST_LOG_TRIVIAL(debug) << "Document: Serialized " << bytes.size() << " bytes to memory";
    return bytes;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Document: Failed to serialize to memory: " << e.what();
    throw IoError(IoStep::Serialize, std::string("Failed to serialize document: ") + e.what());
  }
}

} // namespace document
} // namespace pdfmeta
