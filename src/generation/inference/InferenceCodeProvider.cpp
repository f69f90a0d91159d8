#include "codetyper/generation/ChatCompletion.hpp"
#include "codetyper/generation/CodeBlockExtractor.hpp"
#include "codetyper/generation/GenerationErrors.hpp"
#include "codetyper/generation/providers/InferenceProviderFactory.hpp"
#include <httplib.h>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace codetyper::generation::providers
{
namespace
{

constexpr int g_httpOk{ 200 };
constexpr int g_httpUnauthorized{ 401 };
constexpr int g_httpForbidden{ 403 };

class InferenceCodeProvider final : public codetyper::generation::ICodeProvider
{
public:
    explicit InferenceCodeProvider(InferenceConfig config) : m_config(std::move(config))
    {
    }

    [[nodiscard]] std::string fetchCode(Language language) override
    {
        if (m_config.apiKey.empty())
        {
            throw ProviderUnavailable("no API key configured");
        }

        const std::string body{ detail::buildChatRequestBody(m_config.model,
                                                             detail::buildPrompt(language, m_config.band)) };

        httplib::SSLClient client{ m_config.host, m_config.port };
        client.enable_server_certificate_verification(true);
        client.set_connection_timeout(m_config.timeout.count(), 0);
        client.set_read_timeout(m_config.timeout.count(), 0);
        client.set_write_timeout(m_config.timeout.count(), 0);

        const httplib::Headers headers{ { "Authorization", "Bearer " + m_config.apiKey } };
        auto response{ client.Post(m_config.path, headers, body, "application/json") };
        if (!response)
        {
            std::stringstream s{};
            s << response.error();
            throw ProviderUnavailable("request to " + m_config.host + " failed with httplib error " + s.str());
        }

        if (response->status == g_httpUnauthorized || response->status == g_httpForbidden)
        {
            throw ProviderUnavailable("generator rejected the API key (HTTP " + std::to_string(response->status) +
                                      ")");
        }
        if (response->status != g_httpOk)
        {
            throw ProviderError("generator returned HTTP " + std::to_string(response->status));
        }

        return extractCodeBlock(detail::parseChatResponseContent(response->body), language);
    }

private:
    InferenceConfig m_config;
};

} // namespace

std::unique_ptr<codetyper::generation::ICodeProvider> makeInferenceCodeProvider(InferenceConfig config)
{
    return std::make_unique<InferenceCodeProvider>(std::move(config));
}

} // namespace codetyper::generation::providers
