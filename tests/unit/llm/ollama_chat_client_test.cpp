#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "sage_core/errors.hpp"
#include "sage_core/llm/ollama_chat_client.hpp"

namespace sage_core {

class OllamaChatClientTest : public ::testing::Test {
 protected:
  std::vector<ChatMessage> messages_{{"system", "Be brief."}, {"user", "Hi?"}};
};

TEST_F(OllamaChatClientTest, BuildsChatRequest) {
  OllamaChatClient client("http://localhost:11434", "qwen3:1.7b");
  GenerationOptions options;
  options.temperature = 0.2;

  auto body = client.build_request(messages_, options, /*stream*/ false);

  EXPECT_EQ(body["model"], "qwen3:1.7b");
  EXPECT_EQ(body["stream"], false);
  EXPECT_EQ(body["think"], false);
  ASSERT_EQ(body["messages"].size(), 2u);
  EXPECT_EQ(body["messages"][0]["role"], "system");
  EXPECT_EQ(body["messages"][0]["content"], "Be brief.");
  EXPECT_EQ(body["messages"][1]["role"], "user");
  EXPECT_DOUBLE_EQ(body["options"]["temperature"].get<double>(), 0.2);
  EXPECT_FALSE(body["options"].contains("num_predict"));
}

TEST_F(OllamaChatClientTest, StreamingRequestAndTokenLimit) {
  OllamaChatClient client("http://localhost:11434", "llama3", /*enable_thinking*/ true);
  GenerationOptions options;
  options.max_tokens = 256;

  auto body = client.build_request(messages_, options, /*stream*/ true);

  EXPECT_EQ(body["stream"], true);
  EXPECT_EQ(body["think"], true);
  EXPECT_EQ(body["options"]["num_predict"], 256);
}

TEST_F(OllamaChatClientTest, ReportsModelName) {
  OllamaChatClient client("http://localhost:11434/", "qwen3:1.7b");
  EXPECT_EQ(client.model_name(), "qwen3:1.7b");
}

TEST_F(OllamaChatClientTest, UnreachableServerFailsHealthCheck) {
  // Port 9 (discard) on localhost is not an Ollama server
  OllamaChatClient client("http://127.0.0.1:9", "qwen3:1.7b", false, 2);
  EXPECT_FALSE(client.health_check());
}

TEST_F(OllamaChatClientTest, UnreachableServerFailsGeneration) {
  OllamaChatClient client("http://127.0.0.1:9", "qwen3:1.7b", false, 2);
  EXPECT_THROW(client.generate(messages_, {}), GenerationError);
  EXPECT_THROW(client.generate_stream(messages_, {}, [](const std::string &) { return true; }),
               GenerationError);
}

TEST_F(OllamaChatClientTest, ParsesChatResponseContent) {
  EXPECT_EQ(OllamaChatClient::parse_chat_response(
                R"({"model":"qwen3","message":{"role":"assistant","content":"Hi there"},"done":true})"),
            "Hi there");
}

TEST_F(OllamaChatClientTest, MalformedChatResponsesAreGenerationErrors) {
  EXPECT_THROW(OllamaChatClient::parse_chat_response("not json"), GenerationError);
  EXPECT_THROW(OllamaChatClient::parse_chat_response("[1,2]"), GenerationError);
  EXPECT_THROW(OllamaChatClient::parse_chat_response(R"({"done":true})"), GenerationError);
  EXPECT_THROW(OllamaChatClient::parse_chat_response(R"({"message":"text"})"), GenerationError);
  EXPECT_THROW(OllamaChatClient::parse_chat_response(R"({"message":{"content":42}})"),
               GenerationError);
  EXPECT_THROW(OllamaChatClient::parse_chat_response(R"({"message":{"content":null}})"),
               GenerationError);
}

namespace {
std::string chunk(const std::string &content, bool done = false) {
  return R"({"message":{"role":"assistant","content":")" + content + R"("},"done":)" +
         (done ? "true" : "false") + "}\n";
}
}  // namespace

TEST(ChatStreamSinkTest, ForwardsFragmentsAndStopsAtDone) {
  std::vector<std::string> received;
  FragmentCallback on_fragment = [&](const std::string &fragment) {
    received.push_back(fragment);
    return true;
  };
  ChatStreamSink sink(on_fragment);

  const std::string first = chunk("Hel");
  EXPECT_EQ(sink.consume(first, 200), first.size());
  EXPECT_EQ(sink.consume(chunk("lo", true), 200), 0u);

  EXPECT_TRUE(sink.stopped());
  EXPECT_NO_THROW(sink.rethrow_if_failed());
  EXPECT_EQ(received, (std::vector<std::string>{"Hel", "lo"}));
}

TEST(ChatStreamSinkTest, CallbackExceptionIsHeldUntilRethrown) {
  int calls = 0;
  FragmentCallback on_fragment = [&](const std::string &) -> bool {
    ++calls;
    throw std::runtime_error("client went away");
  };
  ChatStreamSink sink(on_fragment);

  size_t accepted = 1;
  EXPECT_NO_THROW(accepted = sink.consume(chunk("a") + chunk("b"), 200));
  EXPECT_EQ(accepted, 0u);
  // Later deliveries are refused without touching the callback again
  EXPECT_EQ(sink.consume(chunk("c"), 200), 0u);
  EXPECT_EQ(calls, 1);

  try {
    sink.rethrow_if_failed();
    ADD_FAILURE() << "Expected the callback's exception";
  } catch (const std::runtime_error &e) {
    EXPECT_STREQ(e.what(), "client went away");
  }
}

TEST(ChatStreamSinkTest, DecliningCallbackStopsWithoutError) {
  FragmentCallback on_fragment = [](const std::string &) { return false; };
  ChatStreamSink sink(on_fragment);

  EXPECT_EQ(sink.consume(chunk("a"), 200), 0u);
  EXPECT_TRUE(sink.stopped());
  EXPECT_NO_THROW(sink.rethrow_if_failed());
}

TEST(ChatStreamSinkTest, ErrorStatusCollectsTheBody) {
  FragmentCallback on_fragment = [](const std::string &) { return true; };
  ChatStreamSink sink(on_fragment);

  const std::string body = R"({"error":"model 'nope' not found"})";
  EXPECT_EQ(sink.consume(body, 404), body.size());
  EXPECT_EQ(sink.error_body(), body);
}

TEST(ChatStreamSinkTest, FinishDeliversTheUnterminatedTail) {
  std::vector<std::string> received;
  FragmentCallback on_fragment = [&](const std::string &fragment) {
    received.push_back(fragment);
    return true;
  };
  ChatStreamSink sink(on_fragment);

  std::string tail = chunk("end");
  tail.pop_back();
  const std::string payload = chunk("start") + tail;
  EXPECT_EQ(sink.consume(payload, 200), payload.size());
  sink.finish();

  EXPECT_EQ(received, (std::vector<std::string>{"start", "end"}));
}

}  // namespace sage_core
