#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "common/utilities_test.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/extractors/markdown_extractor.hpp"

namespace sage_core {

class MarkdownExtractorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = sage_tests::TestUtilities::create_temp_dir("markdown_tests");
  }

  void TearDown() override {
    // Clean up test files
    std::filesystem::remove_all(test_dir_);
  }

  std::filesystem::path create_test_file(const std::string &filename, const std::string &content) {
    return sage_tests::TestUtilities::write_file(test_dir_ / filename, content);
  }

  MarkdownExtractor extractor_;
  std::filesystem::path test_dir_;
};

TEST_F(MarkdownExtractorTest, HandlesMarkdownExtensions) {
  EXPECT_TRUE(extractor_.can_handle("guide.md"));
  EXPECT_TRUE(extractor_.can_handle("guide.markdown"));
  EXPECT_TRUE(extractor_.can_handle("GUIDE.MD"));
  EXPECT_FALSE(extractor_.can_handle("guide.txt"));
  EXPECT_EQ(extractor_.get_file_type(), FileType::Markdown);
}

TEST_F(MarkdownExtractorTest, TitleComesFromFirstTopLevelHeading) {
  auto path = create_test_file("guide.md",
                               "Intro paragraph.\n\n## Not this one\n\n# Getting Started\n\nBody.\n"
                               "# Second Title\n");
  auto result = extractor_.extract(path);
  EXPECT_EQ(result.title, "Getting Started");
  EXPECT_EQ(result.file_type, FileType::Markdown);
}

TEST_F(MarkdownExtractorTest, ClosingHashesAndCarriageReturnsAreTrimmed) {
  auto path = create_test_file("closing.md", "# Release Notes ##\r\nText\r\n");
  EXPECT_EQ(extractor_.extract(path).title, "Release Notes");
}

TEST_F(MarkdownExtractorTest, FallsBackToFileStem) {
  auto path = create_test_file("no-heading.md", "Just a paragraph.\n\n## Subsection\n");
  EXPECT_EQ(extractor_.extract(path).title, "no-heading");
}

TEST_F(MarkdownExtractorTest, KeepsMarkdownSourceAsText) {
  const std::string content = "# Title\n\n- item *one*\n- item `two`\n";
  auto path = create_test_file("list.md", content);
  EXPECT_EQ(extractor_.extract(path).text, content);
}

TEST_F(MarkdownExtractorTest, RejectsEmptyFile) {
  auto path = create_test_file("empty.md", "");
  EXPECT_THROW(extractor_.extract(path), ValidationError);
}

}  // namespace sage_core
