#include "sage_core/store/vector_store.hpp"

namespace sage_core {

namespace {
constexpr size_t kMaxCollectionNameLength = 63;

bool is_name_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_' || c == '-' || c == '.';
}
}  // namespace

void validate_collection_name(const std::string &name) {
  if (name.empty()) {
    throw ValidationError("Collection name must not be empty");
  }
  if (name.size() > kMaxCollectionNameLength) {
    throw ValidationError("Collection name is longer than " +
                          std::to_string(kMaxCollectionNameLength) + " characters: " + name);
  }
  for (char c : name) {
    if (!is_name_char(c)) {
      throw ValidationError("Collection name may only contain letters, digits, '_', '-' and '.': " +
                            name);
    }
  }
}

}  // namespace sage_core
