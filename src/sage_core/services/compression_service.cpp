#include "sage_core/services/compression_service.hpp"

#include <zstd.h>

namespace sage_core {

std::vector<char> CompressionService::compress(std::string_view text, int level) {
  if (text.empty()) {
    return {};
  }

  std::vector<char> blob(ZSTD_compressBound(text.size()));
  const size_t written = ZSTD_compress(blob.data(), blob.size(), text.data(), text.size(), level);
  if (ZSTD_isError(written)) {
    throw CompressionError("Failed to compress chunk content: " +
                           std::string(ZSTD_getErrorName(written)));
  }

  blob.resize(written);
  return blob;
}

bool CompressionService::is_compressed(const std::vector<char> &blob) {
  if (blob.size() < 4) {
    return false;
  }
  const auto byte = [&blob](size_t i) { return static_cast<unsigned char>(blob[i]); };
  const unsigned int magic = byte(0) | (byte(1) << 8) | (byte(2) << 16) | (byte(3) << 24);
  return magic == ZSTD_MAGICNUMBER;
}

std::string CompressionService::decompress(const std::vector<char> &blob) {
  if (blob.empty()) {
    return "";
  }

  const unsigned long long expected = ZSTD_getFrameContentSize(blob.data(), blob.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Stored chunk content is not a zstd frame");
  }

  std::string text(expected, '\0');
  const size_t read = ZSTD_decompress(text.data(), text.size(), blob.data(), blob.size());
  if (ZSTD_isError(read)) {
    throw CompressionError("Failed to decompress chunk content: " +
                           std::string(ZSTD_getErrorName(read)));
  }
  if (read != expected) {
    throw CompressionError("Decompressed chunk content is truncated");
  }

  return text;
}

}  // namespace sage_core
