#ifndef INCLUDE_CODETYPER_GENERATION_PROVIDERS_INFERENCEPROVIDERFACTORY_HPP
#define INCLUDE_CODETYPER_GENERATION_PROVIDERS_INFERENCEPROVIDERFACTORY_HPP

#include "codetyper/generation/CodeSourceService.hpp"
#include "codetyper/generation/ICodeProvider.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace codetyper::generation::providers
{

struct InferenceConfig final
{
    // Empty key: every fetch throws ProviderUnavailable.
    std::string apiKey;
    std::string host{ "router.huggingface.co" };
    int port{ 443 };
    std::string path{ "/sambanova/v1/chat/completions" };
    std::string model{ "deepseek-ai/DeepSeek-R1-0528" };
    std::chrono::seconds timeout{ 180 };
    LengthBand band{};
};

[[nodiscard]] std::unique_ptr<codetyper::generation::ICodeProvider> makeInferenceCodeProvider(InferenceConfig config);

} // namespace codetyper::generation::providers

#endif // INCLUDE_CODETYPER_GENERATION_PROVIDERS_INFERENCEPROVIDERFACTORY_HPP
