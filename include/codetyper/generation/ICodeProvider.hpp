#ifndef INCLUDE_CODETYPER_GENERATION_ICODEPROVIDER_HPP
#define INCLUDE_CODETYPER_GENERATION_ICODEPROVIDER_HPP

#include "codetyper/generation/Language.hpp"
#include <string>

namespace codetyper::generation
{

class ICodeProvider
{
public:
    ICodeProvider() = default;
    ICodeProvider(const ICodeProvider&) = delete;
    ICodeProvider& operator=(const ICodeProvider&) = delete;
    ICodeProvider(ICodeProvider&&) = delete;
    ICodeProvider& operator=(ICodeProvider&&) = delete;
    virtual ~ICodeProvider() = default;

    // Blocks until the snippet is available.
    // Throws ProviderUnavailable or ProviderError on failure.
    [[nodiscard]] virtual std::string fetchCode(Language language) = 0;
};

} // namespace codetyper::generation

#endif // INCLUDE_CODETYPER_GENERATION_ICODEPROVIDER_HPP
