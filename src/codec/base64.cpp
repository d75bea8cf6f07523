#include "codec/base64.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <climits>
#include <vector>

namespace pdfmeta::codec {

//=================================================
// RAII WRAPPER TO MANAGE ENCODE CONTEXT LIFECYCLE
//=================================================

namespace {

struct EncodeContext {
  EVP_ENCODE_CTX* ctx = nullptr;

  // Allocation failure is reported through get()
  EncodeContext() : ctx(EVP_ENCODE_CTX_new()) {}

  ~EncodeContext() {
    if (ctx) {
      EVP_ENCODE_CTX_free(ctx);
    }
  }

  EncodeContext(const EncodeContext&) = delete;
  EncodeContext& operator=(const EncodeContext&) = delete;

  EVP_ENCODE_CTX* get() { return ctx; }
};

} // namespace


//==============================================
// ENCODING
//==============================================

std::string Base64::encode(const std::string& bytes) {
  if (bytes.empty()) {
    return std::string();
  }

  // 4 output characters per 3 input bytes, plus the terminating NUL written by OpenSSL
  std::vector<unsigned char> buffer(((bytes.size() + 2) / 3) * 4 + 1);
  const int written = EVP_EncodeBlock(buffer.data(),
                                      reinterpret_cast<const unsigned char*>(bytes.data()),
                                      static_cast<int>(bytes.size()));
  return std::string(reinterpret_cast<const char*>(buffer.data()), written);
}


//==============================================
// DECODING
//==============================================

std::optional<std::string> Base64::decode(const std::string& text) {
  if (text.empty()) {
    return std::string();
  }
  if (text.size() > static_cast<size_t>(INT_MAX) - 80) {
    BOOST_LOG_TRIVIAL(warning) << "Base64: Input too large to decode: " << text.size() << " bytes";
    return std::nullopt;
  }

  EncodeContext context;
  if (!context.get()) {
    BOOST_LOG_TRIVIAL(error) << "Base64: Failed to create decode context";
    return std::nullopt;
  }
  EVP_DecodeInit(context.get());

  // The decoder buffers at most one 80 character line before flushing
  std::vector<unsigned char> buffer((text.size() / 4) * 3 + 80);
  int decoded_length = 0;
  if (EVP_DecodeUpdate(context.get(), buffer.data(), &decoded_length,
                       reinterpret_cast<const unsigned char*>(text.data()),
                       static_cast<int>(text.size())) < 0) {
    BOOST_LOG_TRIVIAL(debug) << "Base64: Rejected input with invalid characters";
    return std::nullopt;
  }

  int final_length = 0;
  if (EVP_DecodeFinal(context.get(), buffer.data() + decoded_length, &final_length) < 0) {
    BOOST_LOG_TRIVIAL(debug) << "Base64: Rejected truncated input";
    return std::nullopt;
  }

  return std::string(reinterpret_cast<const char*>(buffer.data()), decoded_length + final_length);
}

} // namespace pdfmeta::codec
