#include <labscan/core/base64.hpp>
#include <openssl/evp.h>
#include <cctype>
#include <string>

namespace labscan::core {

std::string base64_encode(std::span<const std::byte> bytes) {
  if (bytes.empty()) return {};
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      reinterpret_cast<const unsigned char*>(bytes.data()),
                                      static_cast<int>(bytes.size()));
  out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
  return out;
}

std::optional<std::vector<std::byte>> base64_decode(std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (const char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
  }
  if (compact.empty() || compact.size() % 4 != 0) return std::nullopt;

  std::vector<std::byte> out(3 * (compact.size() / 4));
  const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      reinterpret_cast<const unsigned char*>(compact.data()),
                                      static_cast<int>(compact.size()));
  if (written < 0) return std::nullopt;

  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
  std::size_t size = static_cast<std::size_t>(written);
  if (compact.ends_with("==")) {
    size -= 2;
  } else if (compact.ends_with('=')) {
    size -= 1;
  }
  out.resize(size);
  return out;
}

}  // namespace labscan::core
