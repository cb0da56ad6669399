#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sage_core/llm/ndjson_stream_decoder.hpp"

namespace sage_core {

namespace {
std::string line(const std::string &content, bool done = false) {
  return R"({"model":"qwen3","message":{"role":"assistant","content":")" + content +
         R"("},"done":)" + (done ? "true" : "false") + "}\n";
}
}  // namespace

TEST(NdjsonStreamDecoderTest, DecodesCompleteLinesInOrder) {
  NdjsonStreamDecoder decoder;
  auto fragments = decoder.feed(line("Hel") + line("lo") + line(" world"));
  EXPECT_EQ(fragments, (std::vector<std::string>{"Hel", "lo", " world"}));
  EXPECT_FALSE(decoder.done());
}

TEST(NdjsonStreamDecoderTest, BuffersLinesSplitAcrossReads) {
  NdjsonStreamDecoder decoder;
  const std::string payload = line("first") + line("second");
  const size_t cut = payload.find("sec");

  auto head = decoder.feed(payload.substr(0, cut));
  auto tail = decoder.feed(payload.substr(cut));

  EXPECT_EQ(head, std::vector<std::string>{"first"});
  EXPECT_EQ(tail, std::vector<std::string>{"second"});
}

TEST(NdjsonStreamDecoderTest, ByteAtATimeFeedStillDecodes) {
  NdjsonStreamDecoder decoder;
  const std::string payload = line("a") + line("b", true);
  std::vector<std::string> fragments;
  for (char c : payload) {
    for (auto &fragment : decoder.feed(std::string(1, c))) {
      fragments.push_back(fragment);
    }
  }
  EXPECT_EQ(fragments, (std::vector<std::string>{"a", "b"}));
  EXPECT_TRUE(decoder.done());
}

TEST(NdjsonStreamDecoderTest, StopsAtDoneLine) {
  NdjsonStreamDecoder decoder;
  auto fragments = decoder.feed(line("last", true) + line("ignored"));
  EXPECT_EQ(fragments, std::vector<std::string>{"last"});
  EXPECT_TRUE(decoder.done());
}

TEST(NdjsonStreamDecoderTest, SkipsEmptyContentAndBlankLines) {
  NdjsonStreamDecoder decoder;
  auto fragments = decoder.feed("\n" + line("") + "  \r\n" + line("x"));
  EXPECT_EQ(fragments, std::vector<std::string>{"x"});
}

TEST(NdjsonStreamDecoderTest, SkipsMalformedLines) {
  NdjsonStreamDecoder decoder;
  auto fragments = decoder.feed("{not json\n" + line("ok"));
  EXPECT_EQ(fragments, std::vector<std::string>{"ok"});
}

TEST(NdjsonStreamDecoderTest, FinishDecodesUnterminatedTail) {
  NdjsonStreamDecoder decoder;
  std::string last = line("tail", true);
  last.pop_back();  // no trailing newline

  EXPECT_TRUE(decoder.feed(last).empty());
  EXPECT_EQ(decoder.finish(), std::vector<std::string>{"tail"});
  EXPECT_TRUE(decoder.done());
}

TEST(NdjsonStreamDecoderTest, ReportsErrorLines) {
  NdjsonStreamDecoder decoder;
  auto fragments = decoder.feed(R"({"error":"model not found"})" "\n");
  EXPECT_TRUE(fragments.empty());
  EXPECT_TRUE(decoder.done());
  EXPECT_EQ(decoder.error(), "model not found");
}

TEST(NdjsonStreamDecoderTest, NonBooleanDoneIsNotTheEnd) {
  NdjsonStreamDecoder decoder;
  std::vector<std::string> fragments;
  EXPECT_NO_THROW(fragments = decoder.feed(
                      R"({"message":{"content":"a"},"done":null})" "\n"
                      R"({"message":{"content":"b"},"done":"yes"})" "\n" + line("c")));
  EXPECT_EQ(fragments, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_FALSE(decoder.done());
}

TEST(NdjsonStreamDecoderTest, KeepsUnicodeEscapes) {
  NdjsonStreamDecoder decoder;
  auto fragments = decoder.feed(line("caf\\u00e9"));
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0], "caf\xC3\xA9");
}

}  // namespace sage_core
