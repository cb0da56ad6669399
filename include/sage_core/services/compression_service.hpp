#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sage_core/errors.hpp"

namespace sage_core {

class CompressionError : public SageError {
 public:
  using SageError::SageError;
};

// Chunk text is stored as zstd frames so a collection of long documents
// stays small on disk.
class CompressionService {
 public:
  /**
   * @brief Compresses chunk text into a single zstd frame.
   * @param text The text to compress. Empty input yields an empty blob.
   * @param level The zstd compression level.
   */
  static std::vector<char> compress(std::string_view text, int level = 3);

  /**
   * @brief Restores text written by compress().
   * @throws CompressionError when the blob is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &blob);

  // Blobs written before compression was enabled are plain UTF-8
  static bool is_compressed(const std::vector<char> &blob);
};

}  // namespace sage_core
