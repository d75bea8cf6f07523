#ifndef PDFMETA_METADATA_ERROR_HPP
#define PDFMETA_METADATA_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pdfmeta {

// Step of a file operation that failed
enum class IoStep {
    Read,
    Write,
    Serialize,
    Rename
};

inline const char* io_step_to_string(IoStep step) {
    switch (step) {
        case IoStep::Read: return "Read";
        case IoStep::Write: return "Write";
        case IoStep::Serialize: return "Serialize";
        case IoStep::Rename: return "Rename";
        default: return "Undefined step";
    }
}

class MetadataError : public std::runtime_error {
public:
    explicit MetadataError(const std::string& message)
        : std::runtime_error(message) {}
};

class NotFoundError : public MetadataError {
public:
    explicit NotFoundError(const std::string& message)
        : MetadataError("Not found: " + message) {}
};

// Carries the PDF library's load/parse message unchanged
class MalformedContainerError : public MetadataError {
public:
    explicit MalformedContainerError(const std::string& message)
        : MetadataError(message) {}
};

class IoError : public MetadataError {
public:
    IoError(IoStep step, const std::string& message)
        : MetadataError(std::string(io_step_to_string(step)) + " error: " + message)
        , step_(step) {}

    IoStep step() const { return step_; }

private:
    IoStep step_;
};

class DuplicateKeyError : public MetadataError {
public:
    explicit DuplicateKeyError(const std::string& key)
        : MetadataError("Duplicate key: " + key) {}
};

} // namespace pdfmeta

#endif // PDFMETA_METADATA_ERROR_HPP
