#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sage_core {

/**
 * @class TextChunker
 * @brief Splits document text into fixed-size, overlapping windows.
 *
 * Sizes are counted in Unicode code points, never in bytes, so a window boundary
 * cannot land inside a multi-byte UTF-8 sequence. Window i starts at
 * i * (chunk_size - chunk_overlap) and spans at most chunk_size code points; the
 * last window ends exactly at the end of the text.
 */
class TextChunker {
 public:
  /**
   * @throw ValidationError if chunk_size is zero or chunk_overlap >= chunk_size.
   */
  TextChunker(std::size_t chunk_size, std::size_t chunk_overlap);

  std::vector<std::string> chunk(const std::string& text) const;

  // Assumes chunk_size > 0 and chunk_overlap < chunk_size.
  static std::vector<std::string> split(const std::string& text,
                                        std::size_t chunk_size,
                                        std::size_t chunk_overlap);

  std::size_t chunk_size() const {
    return chunk_size_;
  }
  std::size_t chunk_overlap() const {
    return chunk_overlap_;
  }

 private:
  std::size_t chunk_size_;
  std::size_t chunk_overlap_;
};

}  // namespace sage_core
