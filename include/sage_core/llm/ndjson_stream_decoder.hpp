#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sage_core {

/**
 * @class NdjsonStreamDecoder
 * @brief Reassembles Ollama's newline-delimited JSON chat stream.
 *
 * Network reads split lines arbitrarily; feed() buffers the incomplete tail and
 * returns the message fragments of every complete line, in arrival order.
 * Unparseable lines are skipped with a warning.
 */
class NdjsonStreamDecoder {
 public:
  std::vector<std::string> feed(std::string_view bytes);

  // Decodes whatever is left in the buffer once the transfer has ended
  std::vector<std::string> finish();

  // True once a line with "done": true has been decoded
  bool done() const {
    return done_;
  }

  // Error text reported inside the stream, if any
  const std::string &error() const {
    return error_;
  }

 private:
  void decode_line(const std::string &line, std::vector<std::string> &fragments);

  std::string buffer_;
  bool done_ = false;
  std::string error_;
};

}  // namespace sage_core
