#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace sage_core {

class PersonalityProvider {
 public:
  virtual ~PersonalityProvider() = default;

  // System instruction sent ahead of every RAG prompt
  virtual std::string system_prompt() = 0;
};

/**
 * @class FilePersonalityProvider
 * @brief Reads the system instruction from a text file, re-reading it whenever its
 * modification time changes.
 *
 * A missing, unreadable or blank file yields DEFAULT_PROMPT.
 */
class FilePersonalityProvider : public PersonalityProvider {
 public:
  static const char *const DEFAULT_PROMPT;

  explicit FilePersonalityProvider(std::filesystem::path path);

  std::string system_prompt() override;

  const std::filesystem::path &path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  std::mutex mtx_;
  std::optional<std::filesystem::file_time_type> loaded_mtime_;
  std::string cached_prompt_;
};

}  // namespace sage_core
