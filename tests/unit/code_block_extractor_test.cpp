#include "codetyper/generation/CodeBlockExtractor.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace codetyper::generation;

TEST(CodeBlockExtractor, ResponseWithoutFencesIsReturnedUnchanged)
{
    EXPECT_EQ(extractCodeBlock("print('hi')\n", Language::Python), "print('hi')\n");
}

TEST(CodeBlockExtractor, InfoLineIsDropped)
{
    const std::string response{ "Here you go:\n```python\nx = 1\ny = 2\n```\nEnjoy." };
    EXPECT_EQ(extractCodeBlock(response, Language::Python), "x = 1\ny = 2\n");
}

TEST(CodeBlockExtractor, PrefersBlockTaggedWithLanguage)
{
    const std::string response{ "```bash\npip install x\n```\n\n```py\nimport x\n```\n" };
    EXPECT_EQ(extractCodeBlock(response, Language::Python), "import x\n");
}

TEST(CodeBlockExtractor, AcceptsAliasesAndDisplayNames)
{
    EXPECT_EQ(extractCodeBlock("```text\nnope\n```\n```C++\nint x;\n```", Language::Cpp), "int x;\n");
    EXPECT_EQ(extractCodeBlock("```text\nnope\n```\n```rs\nlet x = 1;\n```", Language::Rust), "let x = 1;\n");
    EXPECT_EQ(extractCodeBlock("```text\nnope\n```\n```JS\nlet x;\n```", Language::JavaScript), "let x;\n");
}

TEST(CodeBlockExtractor, FallsBackToFirstBlock)
{
    const std::string response{ "```\nfirst\n```\n```go\nsecond\n```\n" };
    EXPECT_EQ(extractCodeBlock(response, Language::Java), "first\n");
}

TEST(CodeBlockExtractor, TagMatchIsExactNotSubstring)
{
    // "javascript" must not be picked for Java.
    const std::string response{ "```text\nplain\n```\n```javascript\nlet a;\n```\n" };
    EXPECT_EQ(extractCodeBlock(response, Language::Java), "plain\n");
}

TEST(CodeBlockExtractor, UnterminatedFenceRunsToEnd)
{
    EXPECT_EQ(extractCodeBlock("```java\nclass A {}\n", Language::Java), "class A {}\n");
}

TEST(CodeBlockExtractor, ReasoningIsStripped)
{
    EXPECT_EQ(stripReasoning("<think>plan ```py\nbad\n``` </think>code"), "code");
    EXPECT_EQ(stripReasoning("a<think>x</think>b<think>y</think>c"), "abc");
    EXPECT_EQ(stripReasoning("no reasoning"), "no reasoning");
}

TEST(CodeBlockExtractor, UnmatchedReasoningTags)
{
    // Closing tag without opener drops everything before it.
    EXPECT_EQ(stripReasoning("thinking...</think>result"), "result");
    // Opener without closer drops everything after it.
    EXPECT_EQ(stripReasoning("result<think>never finished"), "result");
}

TEST(CodeBlockExtractor, ReasoningBlocksDoNotLeakIntoExtraction)
{
    const std::string response{ "<think>\n```py\ndraft\n```\n</think>\n```py\nfinal\n```" };
    EXPECT_EQ(extractCodeBlock(response, Language::Python), "final\n");
}
