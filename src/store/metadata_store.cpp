#include "store/metadata_store.hpp"
#include "codec/text_encoding.hpp"
#include "codec/value_codec.hpp"
#include "error/metadata_error.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace pdfmeta {
namespace store {

namespace {

const char* const INFO_KEY = "/Info";
const char* const MOD_DATE_KEY = "/ModDate";

// Dictionary key for a caller supplied name, accepting an optional leading '/'
std::string to_pdf_key(const std::string& key) {
  std::string pdf_key = (!key.empty() && key.front() == '/') ? key : "/" + key;
  if (pdf_key.size() < 2) {
    throw std::invalid_argument("Metadata store: Metadata key must not be empty");
  }
  return pdf_key;
}

codec::InfoValue to_info_value(QPDFObjectHandle value) {
  if (value.isString()) {
    return codec::TextValue{value.getStringValue()};
  }
  if (value.isName()) {
    return codec::NameValue{value.getName().substr(1)};
  }
  if (value.isInteger()) {
    return static_cast<int64_t>(value.getIntValue());
  }
  if (value.isReal()) {
    return codec::RealValue{value.getRealValue()};
  }
  if (value.isBool()) {
    return value.getBoolValue();
  }
  if (value.isNull()) {
    return codec::NullValue{};
  }
  return codec::OtherValue{value.getTypeName()};
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

MetadataStore::MetadataStore(FileSystem& file_system, const Clock& clock)
  : file_system_(file_system)
  , clock_(clock)
  , replacer_(file_system) {
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Initialized";
}


//==============================================
// DOCUMENT OPERATIONS
//==============================================

std::vector<MetadataEntry> MetadataStore::list(document::Document& doc) const {
  std::vector<MetadataEntry> entries;

  auto info = find_info_dictionary(doc);
  if (!info) {
    BOOST_LOG_TRIVIAL(info) << "Metadata store: No Info dictionary, returning no entries";
    return entries;
  }

  for (auto item : info->ditems()) {
    // Dictionary keys keep their leading '/'
    const std::string key = codec::utf8_lossy(item.first.substr(1));
    entries.push_back({key, codec::ValueCodec::to_text(to_info_value(item.second))});
  }

  BOOST_LOG_TRIVIAL(info) << "Metadata store: Read " << entries.size() << " entries";
  return entries;
}

void MetadataStore::put(document::Document& doc, const std::string& key, const std::string& value) const {
  const std::string pdf_key = to_pdf_key(key);
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Setting " << pdf_key;

  QPDFObjectHandle info = find_or_create_info_dictionary(doc);
  info.replaceKey(pdf_key, QPDFObjectHandle::newString(codec::ValueCodec::encode(value)));
  stamp_modification_date(info);
}

bool MetadataStore::remove(document::Document& doc, const std::string& key) const {
  const std::string pdf_key = to_pdf_key(key);

  auto info = find_info_dictionary(doc);
  if (!info || !info->hasKey(pdf_key)) {
    BOOST_LOG_TRIVIAL(info) << "Metadata store: Nothing to remove for " << pdf_key;
    return false;
  }

  info->removeKey(pdf_key);
  stamp_modification_date(*info);
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Removed " << pdf_key;
  return true;
}

void MetadataStore::rename_key(document::Document& doc, const std::string& old_key,
                               const std::string& new_key) const {
  const std::string old_pdf_key = to_pdf_key(old_key);
  const std::string new_pdf_key = to_pdf_key(new_key);
  if (old_pdf_key == new_pdf_key) {
    throw std::invalid_argument("Metadata store: New key must differ from the current key");
  }

  auto info = find_info_dictionary(doc);
  if (!info || !info->hasKey(old_pdf_key)) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Cannot rename missing key " << old_pdf_key;
    throw NotFoundError("metadata key '" + old_key + "'");
  }
  if (info->hasKey(new_pdf_key)) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Rename target already exists: " << new_pdf_key;
    throw DuplicateKeyError(new_key);
  }

  QPDFObjectHandle value = info->getKey(old_pdf_key);
  info->replaceKey(new_pdf_key, value);
  info->removeKey(old_pdf_key);
  stamp_modification_date(*info);
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Renamed " << old_pdf_key << " to " << new_pdf_key;
}


//==============================================
// PATH ENTRY POINTS
//==============================================

std::vector<MetadataEntry> MetadataStore::get_metadata(const std::filesystem::path& path) const {
  document::Document doc = load_from_path(path);
  return list(doc);
}

void MetadataStore::set_metadata(const std::filesystem::path& input_path,
                                 const std::filesystem::path& output_path,
                                 const std::string& key, const std::string& value) {
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Writing updated copy of " << input_path.string()
                          << " to " << output_path.string();

  document::Document doc = load_from_path(input_path);
  put(doc, key, value);
  file_system_.write_file(output_path, doc.save_to_buffer());
}

void MetadataStore::update_metadata_in_place(const std::filesystem::path& path, const std::string& key,
                                             const std::string& value) {
  transform_in_place(path, [this, &key, &value](document::Document& doc) {
    put(doc, key, value);
    return true;
  });
}

bool MetadataStore::remove_metadata_in_place(const std::filesystem::path& path, const std::string& key) {
  return transform_in_place(path, [this, &key](document::Document& doc) {
    return remove(doc, key);
  });
}

void MetadataStore::rename_metadata_key_in_place(const std::filesystem::path& path,
                                                 const std::string& old_key, const std::string& new_key) {
  transform_in_place(path, [this, &old_key, &new_key](document::Document& doc) {
    rename_key(doc, old_key, new_key);
    return true;
  });
}


//==============================================
// BUFFER ENTRY POINTS
//==============================================

std::vector<MetadataEntry> MetadataStore::get_metadata_from_bytes(const std::string& bytes) const {
  document::Document doc = document::Document::load_from_buffer(bytes);
  return list(doc);
}

std::string MetadataStore::set_metadata_in_bytes(const std::string& bytes, const std::string& key,
                                                 const std::string& value) const {
  return transform_bytes(bytes, [this, &key, &value](document::Document& doc) {
    put(doc, key, value);
  });
}

std::string MetadataStore::update_metadata_in_bytes(const std::string& bytes, const std::string& key,
                                                    const std::string& value) const {
  // A buffer has no original file to protect
  return set_metadata_in_bytes(bytes, key, value);
}

std::string MetadataStore::remove_metadata_in_bytes(const std::string& bytes, const std::string& key) const {
  return transform_bytes(bytes, [this, &key](document::Document& doc) {
    remove(doc, key);
  });
}

std::string MetadataStore::rename_metadata_key_in_bytes(const std::string& bytes, const std::string& old_key,
                                                        const std::string& new_key) const {
  return transform_bytes(bytes, [this, &old_key, &new_key](document::Document& doc) {
    rename_key(doc, old_key, new_key);
  });
}


//==============================================
// INFO DICTIONARY SUPPORT
//==============================================

std::optional<QPDFObjectHandle> MetadataStore::find_info_dictionary(document::Document& doc) const {
  auto info = doc.get_trailer_reference(INFO_KEY);
  if (!info) {
    return std::nullopt;
  }
  if (!info->isDictionary()) {
    BOOST_LOG_TRIVIAL(warning) << "Metadata store: Info reference does not resolve to a dictionary";
    return std::nullopt;
  }
  return info;
}

QPDFObjectHandle MetadataStore::find_or_create_info_dictionary(document::Document& doc) const {
  if (auto info = find_info_dictionary(doc)) {
    return *info;
  }

  BOOST_LOG_TRIVIAL(info) << "Metadata store: Creating Info dictionary";
  QPDFObjectHandle info = doc.add_object(QPDFObjectHandle::newDictionary());
  doc.set_trailer(INFO_KEY, info);
  return info;
}

void MetadataStore::stamp_modification_date(QPDFObjectHandle& info) const {
  const std::string date = format_pdf_date(clock_.now());
  info.replaceKey(MOD_DATE_KEY, QPDFObjectHandle::newString(date));
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Stamped ModDate " << date;
}


//==============================================
// SOURCE AND SINK SUPPORT
//==============================================

document::Document MetadataStore::load_from_path(const std::filesystem::path& path) const {
  const std::string bytes = file_system_.read_file(path);
  return document::Document::load_from_buffer(bytes, path.string());
}

bool MetadataStore::transform_in_place(const std::filesystem::path& path,
                                       const std::function<bool(document::Document&)>& mutate) {
  // Checked before loading so nothing is created for a missing target
  if (!file_system_.exists(path)) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Original file not found: " << path.string();
    throw NotFoundError("original file " + path.string());
  }

  document::Document doc = load_from_path(path);
  if (!mutate(doc)) {
    BOOST_LOG_TRIVIAL(info) << "Metadata store: No changes, leaving " << path.string() << " untouched";
    return false;
  }

  replacer_.replace(path, [&doc]() { return doc.save_to_buffer(); });
  return true;
}

std::string MetadataStore::transform_bytes(const std::string& bytes,
                                           const std::function<void(document::Document&)>& mutate) const {
  document::Document doc = document::Document::load_from_buffer(bytes);
  mutate(doc);
  return doc.save_to_buffer();
}

} // namespace store
} // namespace pdfmeta
