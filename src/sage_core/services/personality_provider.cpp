#include "sage_core/services/personality_provider.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace sage_core {

const char *const FilePersonalityProvider::DEFAULT_PROMPT =
    "You are an AI assistant that answers questions based on the provided documents. \n"
    "Use only the information from the context to answer. If you cannot find the answer in "
    "the context, say that you don't have enough information.\n"
    "Cite sources when possible (e.g., [Source, Page X]).";

namespace {

std::string trim(const std::string &text) {
  const char *whitespace = " \t\r\n";
  const auto begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

}  // namespace

FilePersonalityProvider::FilePersonalityProvider(std::filesystem::path path)
    : path_(std::move(path)), cached_prompt_(DEFAULT_PROMPT) {}

std::string FilePersonalityProvider::system_prompt() {
  std::lock_guard<std::mutex> lock(mtx_);

  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    // No file: fall back and reload as soon as one shows up
    loaded_mtime_.reset();
    cached_prompt_ = DEFAULT_PROMPT;
    return cached_prompt_;
  }
  if (loaded_mtime_ && *loaded_mtime_ == mtime) {
    return cached_prompt_;
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    std::cerr << "Warning: Could not load personality from " << path_ << ", using default."
              << std::endl;
    cached_prompt_ = DEFAULT_PROMPT;
    return cached_prompt_;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  const std::string content = trim(buffer.str());
  cached_prompt_ = content.empty() ? DEFAULT_PROMPT : content;
  loaded_mtime_ = mtime;
  std::cout << "Loaded RAG personality from " << path_ << std::endl;
  return cached_prompt_;
}

}  // namespace sage_core
