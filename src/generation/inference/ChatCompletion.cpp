#include "codetyper/generation/ChatCompletion.hpp"
#include "codetyper/generation/GenerationErrors.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>

namespace codetyper::generation::detail
{
namespace
{

rapidjson::SizeType jsonSize(std::string_view s)
{
    return static_cast<rapidjson::SizeType>(s.size());
}

} // namespace

std::string buildPrompt(Language language, const LengthBand& band)
{
    std::string prompt{ "Write a " };
    prompt += displayName(language);
    prompt += " program that demonstrates a useful algorithm or data structure. ";
    prompt += "The code should be well-commented, educational, and between ";
    prompt += std::to_string(band.minLines);
    prompt += "-";
    prompt += std::to_string(band.maxLines);
    prompt += " lines long. Do not include any explanations outside the code.";
    return prompt;
}

std::string buildChatRequestBody(std::string_view model, std::string_view prompt)
{
    rapidjson::StringBuffer buffer{};
    rapidjson::Writer<rapidjson::StringBuffer> writer{ buffer };

    writer.StartObject();
    writer.Key("model");
    writer.String(model.data(), jsonSize(model));
    writer.Key("messages");
    writer.StartArray();
    writer.StartObject();
    writer.Key("role");
    writer.String("user");
    writer.Key("content");
    writer.String(prompt.data(), jsonSize(prompt));
    writer.EndObject();
    writer.EndArray();
    writer.EndObject();

    return std::string{ buffer.GetString(), buffer.GetSize() };
}

std::string parseChatResponseContent(std::string_view body)
{
    rapidjson::Document doc{};
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError())
    {
        throw ProviderError(std::string{ "malformed response: " } + rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject())
    {
        throw ProviderError("malformed response: not an object");
    }

    if (doc.HasMember("error"))
    {
        const auto& error{ doc["error"] };
        if (error.IsString())
        {
            throw ProviderError(std::string{ "generator error: " } + error.GetString());
        }
        if (error.IsObject() && error.HasMember("message") && error["message"].IsString())
        {
            throw ProviderError(std::string{ "generator error: " } + error["message"].GetString());
        }
        throw ProviderError("generator error");
    }

    if (!doc.HasMember("choices") || !doc["choices"].IsArray() || doc["choices"].Empty())
    {
        throw ProviderError("malformed response: no choices");
    }

    const auto& choice{ doc["choices"][0] };
    if (!choice.IsObject() || !choice.HasMember("message") || !choice["message"].IsObject())
    {
        throw ProviderError("malformed response: no message");
    }

    const auto& message{ choice["message"] };
    if (!message.HasMember("content") || !message["content"].IsString())
    {
        throw ProviderError("malformed response: no content");
    }

    const auto& content{ message["content"] };
    return std::string{ content.GetString(), content.GetStringLength() };
}

} // namespace codetyper::generation::detail
