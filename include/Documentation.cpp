// ---- CODEC ----
// EncodeContext Documentation
/*
DOCUMENTATION:
CLASS: EncodeContext (RAII Wrapper, base64.cpp)

VARIABLES:
  . EVP_ENCODE_CTX* ctx
      - OpenSSL base64 context pointer
      - nullptr when allocation failed

CONSTRUCTOR:
  . EncodeContext()
      - Allocates a new EVP encode context

METHODS:
  . ~EncodeContext()
      - Frees the context
  . EVP_ENCODE_CTX* get()
      - Returns the underlying context pointer
*/

// Base64 Documentation
/*
DOCUMENTATION:
CLASS: Base64

METHODS:
Public:
  . static std::string encode(const std::string& bytes)
      - Standard alphabet, '=' padding, no line breaks
      - Uses EVP_EncodeBlock
  . static std::optional<std::string> decode(const std::string& text)
      - Uses EVP_DecodeInit/Update/Final
      - Empty input decodes to an empty string
      - Returns nullopt on invalid characters or a truncated final quantum
*/

// Text encoding Documentation
/*
DOCUMENTATION:
FUNCTIONS: text_encoding.hpp

  UTF-8:
  . std::string utf8_lossy(const std::string& bytes)
      - Replaces each maximal invalid subpart with U+FFFD
  . bool has_non_ascii(const std::string& text)
  . void append_utf8(std::string& output, uint32_t code_point)

  UTF-16:
  . std::optional<std::string> utf16_to_utf8(const std::string& bytes, Utf16Order order)
      - Code units loaded with Boost.Endian
      - nullopt on odd length or unpaired surrogates
  . std::string utf8_to_utf16be(const std::string& text)
      - Emits surrogate pairs for supplementary code points
      - Writes no byte-order mark

  Hex:
  . std::optional<std::string> hex_to_bytes(const std::string& hex)
      - nullopt on empty input, odd length or non-hex characters
*/

// ValueCodec Documentation
/*
DOCUMENTATION:
CLASS: ValueCodec

VARIABLES:
. static constexpr const char* TAGGED_UTF16BE_PREFIX = "UTF16BE:"
    - Marks the tagged base64 convention

METHODS:
Public:
  Decoding:
  . static std::string decode(const std::string& raw_bytes)
      - Stages, first success wins:
          1. UTF-16BE byte-order mark (FE FF)
          2. UTF-16LE byte-order mark (FF FE)
          3. <hex> wrapper, then byte-order mark detection on the bytes,
             else lossy UTF-8
          4. UTF16BE:<base64> with optional FE FF inside the payload
          5. Lossy UTF-8
      - A stage that does not fully validate falls through
      - Never throws
  . static std::string to_text(const InfoValue& value)
      - Text is decoded, names are lossy UTF-8
      - Integers, reals and booleans use their decimal or literal form
      - Null becomes "null"
      - Other kinds become "<unprocessed type KIND>"

  Encoding:
  . static std::string encode(const std::string& text)
      - Plain literal bytes, used by every store write
  . static std::string encode_tagged_utf16be(const std::string& text)
      - "UTF16BE:" + base64(FE FF + UTF-16BE units)
  . static std::string encode_for_storage(const std::string& text, bool use_tagged)

Private:
  . decode_with_bom, decode_hex_wrapped, decode_tagged_base64
      - One per decoding stage, nullopt when the input does not match
*/


// ---- DOCUMENT ----
// Document Documentation
/*
DOCUMENTATION:
CLASS: Document

VARIABLES:
. std::unique_ptr<std::string> source_
    - Copy of the buffer a document was loaded from
    - qpdf reads it lazily, so it is released after pdf_
. std::unique_ptr<QPDF> pdf_
    - The qpdf object graph

CONSTRUCTION:
. static Document create_empty()
    - Catalog and empty page tree, no Info dictionary
. static Document load(const std::filesystem::path& path)
. static Document load_from_buffer(const std::string& bytes, const std::string& description)
    - Both loads throw MalformedContainerError carrying qpdf's message
. Move-only

METHODS:
Public:
  Object Graph:
  . std::optional<QPDFObjectHandle> get_trailer_reference(const std::string& name)
      - nullopt when the key is missing or holds a direct object
  . QPDFObjectHandle add_object(QPDFObjectHandle object)
      - Returns the new indirect handle
  . void set_trailer(const std::string& name, QPDFObjectHandle value)

  Persistence:
  . void save(const std::filesystem::path& path)
  . std::string save_to_buffer()
      - Both throw IoError(IoStep::Serialize) on failure
*/


// ---- ERROR ----
/*
DOCUMENTATION:
CLASS: MetadataError
  - Base of every error raised by the library, derives from std::runtime_error

CLASS: NotFoundError
  - Missing input file, or missing key for a rename
  - Message prefixed with "Not found: "

CLASS: MalformedContainerError
  - qpdf load failure, message passed through unchanged

CLASS: IoError
  - Carries IoStep (Read, Write, Serialize, Rename)
  - Message prefixed with "<Step> error: "

CLASS: DuplicateKeyError
  - Rename target already present
*/


// ---- LOGGER ----
/*
DOCUMENTATION:
FUNCTIONS: logger.hpp

. void init_logging(const std::string& log_file, severity_level min_level)
    - Replaces all sinks with a synchronous text file sink
    - File truncated on start, auto-flushed
    - Format: "<timestamp> [<severity>] <message>"
    - Rethrows after printing to stderr if setup fails
. severity_level parse_severity(const std::string& text)
    - Throws std::invalid_argument for unknown names
*/


// ---- STORE ----
// FileSystem Documentation
/*
DOCUMENTATION:
CLASS: FileSystem (interface) / LocalFileSystem

METHODS:
  . bool exists(const std::filesystem::path& path) const
  . std::string read_file(const std::filesystem::path& path) const
      - Reads in 4096 byte chunks
      - Throws NotFoundError if missing, IoError(Read) on failure
  . void write_file(const std::filesystem::path& path, const std::string& data)
      - Creates or truncates, flushes and closes before returning
      - Throws IoError(Write)
  . void rename(const std::filesystem::path& from, const std::filesystem::path& to)
      - Throws IoError(Rename)
  . bool remove(const std::filesystem::path& path)
      - Returns false only when removal failed
*/

// AtomicFileReplacer Documentation
/*
DOCUMENTATION:
CLASS: AtomicFileReplacer

VARIABLES:
. FileSystem& file_system_

METHODS:
Public:
  . void replace(const std::filesystem::path& target, const std::function<std::string()>& serialize)
      1. Serializes and writes to a temporary sibling of target
      2. On failure removes the temporary file and throws IoError(Serialize)
      3. Renames the temporary file over target
      4. On failure removes the temporary file and throws IoError(Rename)
      - Cleanup failures are logged, never thrown
  . static std::filesystem::path make_temp_path(const std::filesystem::path& target)
      - <parent>/<stem>_<nanoseconds>.pdf.tmp
      - Stem falls back to "temp_pdf_update"
*/

// Clock Documentation
/*
DOCUMENTATION:
CLASS: Clock (interface) / SystemClock
  . LocalTime now() const
      - Calendar fields plus UTC offset in seconds

FUNCTION:
  . std::string format_pdf_date(const LocalTime& time)
      - D:YYYYMMDDHHMMSS+HH'MM', '+' for a zero offset
*/

// MetadataStore Documentation
/*
DOCUMENTATION:
CLASS: MetadataStore

VARIABLES:
. FileSystem& file_system_
. const Clock& clock_
    - Source of every ModDate stamp
. AtomicFileReplacer replacer_

CONSTRUCTOR:
. MetadataStore(FileSystem& file_system, const Clock& clock)

METHODS:
Public:
  Document Operations:
  . std::vector<MetadataEntry> list(document::Document& doc) const
      - Empty when /Info is missing, direct, or not a dictionary
  . void put(document::Document& doc, const std::string& key, const std::string& value) const
      - Creates /Info as a new indirect dictionary when needed
      - Always stamps ModDate afterwards, including for key "ModDate"
  . bool remove(document::Document& doc, const std::string& key) const
      - false and no change when the key is absent
  . void rename_key(document::Document& doc, const std::string& old_key, const std::string& new_key) const
      - Moves the raw value object unchanged
      - NotFoundError, DuplicateKeyError, std::invalid_argument
  - Keys may be given with or without the leading '/'; empty keys throw std::invalid_argument

  Path Entry Points:
  . get_metadata(path)
  . set_metadata(input_path, output_path, key, value)
  . update_metadata_in_place(path, key, value)
  . remove_metadata_in_place(path, key)
      - Writes only when something was removed
  . rename_metadata_key_in_place(path, old_key, new_key)
  - In-place variants check the target exists before loading

  Buffer Entry Points:
  . get_metadata_from_bytes, set_metadata_in_bytes, update_metadata_in_bytes,
    remove_metadata_in_bytes, rename_metadata_key_in_bytes
      - No filesystem access
*/


// ---- CLI ----
/*
DOCUMENTATION:
CLASS: CLI

VARIABLES:
. bool running_
. store::MetadataStore& store_
. std::filesystem::path pdf_path_
. std::istream& in_ / std::ostream& out_

METHODS:
Public:
  . void run()
      - "pdfmeta> " prompt until quit or end of input
  . void list_metadata()
      - " N. <key padded to 20>: <value>" then "Total: N entries"
  . static std::string truncate_for_display(const std::string& value)
      - Values over 60 bytes shortened to 57 plus "..."

Private:
  . handle_add_command, handle_edit_command, handle_rename_command,
    handle_delete_command, handle_help_command
  . prepare_value
      - Offers the tagged encoding for non-ASCII values, default yes
  . confirm
      - Empty answer selects the default
*/
