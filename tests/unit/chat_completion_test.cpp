#include "codetyper/generation/ChatCompletion.hpp"
#include "codetyper/generation/GenerationErrors.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <rapidjson/document.h>

using namespace codetyper::generation;
using ::testing::HasSubstr;

TEST(ChatCompletion, PromptNamesLanguageAndBand)
{
    const auto prompt{ detail::buildPrompt(Language::Cpp, LengthBand{ 175, 200 }) };
    EXPECT_THAT(prompt, HasSubstr("C++"));
    EXPECT_THAT(prompt, HasSubstr("175-200 lines"));
}

TEST(ChatCompletion, RequestBodyIsSingleUserMessage)
{
    const auto body{ detail::buildChatRequestBody("some/model", "say \"hi\"\n") };

    rapidjson::Document doc{};
    doc.Parse(body.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["model"].GetString(), "some/model");
    ASSERT_TRUE(doc["messages"].IsArray());
    ASSERT_EQ(doc["messages"].Size(), 1U);
    EXPECT_STREQ(doc["messages"][0]["role"].GetString(), "user");
    EXPECT_STREQ(doc["messages"][0]["content"].GetString(), "say \"hi\"\n");
}

TEST(ChatCompletion, ParsesFirstChoiceContent)
{
    const std::string body{
        R"({"id":"x","choices":[{"index":0,"message":{"role":"assistant","content":"```py\nx = 1\n```"}}]})"
    };
    EXPECT_EQ(detail::parseChatResponseContent(body), "```py\nx = 1\n```");
}

TEST(ChatCompletion, MalformedJsonThrows)
{
    EXPECT_THROW((void)detail::parseChatResponseContent("{not json"), ProviderError);
    EXPECT_THROW((void)detail::parseChatResponseContent("[1,2]"), ProviderError);
}

TEST(ChatCompletion, MissingFieldsThrow)
{
    EXPECT_THROW((void)detail::parseChatResponseContent(R"({"choices":[]})"), ProviderError);
    EXPECT_THROW((void)detail::parseChatResponseContent(R"({"choices":[{"index":0}]})"), ProviderError);
    EXPECT_THROW((void)detail::parseChatResponseContent(R"({"choices":[{"message":{"content":null}}]})"),
                 ProviderError);
}

TEST(ChatCompletion, ErrorPayloadMessageIsReported)
{
    try
    {
        (void)detail::parseChatResponseContent(R"({"error":{"message":"model overloaded"}})");
        FAIL() << "expected ProviderError";
    }
    catch (const ProviderError& e)
    {
        EXPECT_THAT(e.what(), HasSubstr("model overloaded"));
    }
}
