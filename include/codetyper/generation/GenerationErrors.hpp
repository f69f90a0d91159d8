#ifndef INCLUDE_CODETYPER_GENERATION_GENERATIONERRORS_HPP
#define INCLUDE_CODETYPER_GENERATION_GENERATIONERRORS_HPP

#include <stdexcept>

namespace codetyper::generation
{

// Provider is not configured or cannot be reached.
class ProviderUnavailable final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Provider answered but the answer is unusable.
class ProviderError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace codetyper::generation

#endif // INCLUDE_CODETYPER_GENERATION_GENERATIONERRORS_HPP
