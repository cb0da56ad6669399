#include "sage_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

#include "sage_core/errors.hpp"

namespace sage_core {

TextChunker::TextChunker(std::size_t chunk_size, std::size_t chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap) {
  if (chunk_size_ == 0) {
    throw ValidationError("chunk_size must be greater than 0");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw ValidationError("chunk_overlap (" + std::to_string(chunk_overlap_) +
                          ") must be less than chunk_size (" + std::to_string(chunk_size_) +
                          ")");
  }
}

std::vector<std::string> TextChunker::chunk(const std::string& text) const {
  return split(text, chunk_size_, chunk_overlap_);
}

std::vector<std::string> TextChunker::split(const std::string& text,
                                            std::size_t chunk_size,
                                            std::size_t chunk_overlap) {
  std::vector<std::string> out;
  if (text.empty())
    return out;

  std::string clean;
  if (utf8::is_valid(text.begin(), text.end())) {
    clean = text;
  } else {
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));
  }

  // Byte offset of every code point, plus the end of the string
  std::vector<std::size_t> offsets;
  offsets.reserve(clean.size() + 1);
  for (auto it = clean.begin(); it != clean.end(); utf8::next(it, clean.end())) {
    offsets.push_back(static_cast<std::size_t>(it - clean.begin()));
  }
  const std::size_t code_points = offsets.size();
  offsets.push_back(clean.size());

  if (code_points <= chunk_size) {
    out.push_back(std::move(clean));
    return out;
  }

  const std::size_t step = chunk_size - chunk_overlap;
  for (std::size_t start = 0;; start += step) {
    const std::size_t end = std::min(start + chunk_size, code_points);
    out.emplace_back(clean, offsets[start], offsets[end] - offsets[start]);
    if (end == code_points)
      break;
  }
  return out;
}

}  // namespace sage_core
