#include "sage_core/llm/ndjson_stream_decoder.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace sage_core {

std::vector<std::string> NdjsonStreamDecoder::feed(std::string_view bytes) {
  std::vector<std::string> fragments;
  buffer_.append(bytes.data(), bytes.size());

  std::size_t line_start = 0;
  std::size_t newline = buffer_.find('\n', line_start);
  while (newline != std::string::npos && !done_) {
    decode_line(buffer_.substr(line_start, newline - line_start), fragments);
    line_start = newline + 1;
    newline = buffer_.find('\n', line_start);
  }
  buffer_.erase(0, line_start);
  return fragments;
}

std::vector<std::string> NdjsonStreamDecoder::finish() {
  std::vector<std::string> fragments;
  if (!done_ && !buffer_.empty()) {
    decode_line(buffer_, fragments);
  }
  buffer_.clear();
  return fragments;
}

void NdjsonStreamDecoder::decode_line(const std::string &line, std::vector<std::string> &fragments) {
  if (line.find_first_not_of(" \t\r") == std::string::npos) {
    return;
  }

  nlohmann::json chunk = nlohmann::json::parse(line, nullptr, /*allow_exceptions*/ false);
  if (chunk.is_discarded() || !chunk.is_object()) {
    std::cerr << "Warning: Failed to parse Ollama stream chunk: " << line << std::endl;
    return;
  }

  if (chunk.contains("error") && chunk["error"].is_string()) {
    error_ = chunk["error"].get<std::string>();
    done_ = true;
    return;
  }

  auto message = chunk.find("message");
  if (message != chunk.end() && message->is_object()) {
    auto content = message->find("content");
    if (content != message->end() && content->is_string()) {
      std::string text = content->get<std::string>();
      if (!text.empty()) {
        fragments.push_back(std::move(text));
      }
    }
  }

  auto done = chunk.find("done");
  if (done != chunk.end() && done->is_boolean() && done->get<bool>()) {
    done_ = true;
  }
}

}  // namespace sage_core
