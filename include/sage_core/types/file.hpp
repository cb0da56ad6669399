#pragma once

#include <string>

namespace sage_core {

// Formats the extractors can read; Unknown marks anything else
enum class FileType { Text, Markdown, Unknown };

// Short tag stored as documentType in chunk metadata ("txt", "md")
std::string document_type_tag(FileType type);
FileType file_type_from_tag(const std::string& tag);

}  // namespace sage_core
