#ifndef INCLUDE_CODETYPER_CORE_COREERRORS_HPP
#define INCLUDE_CODETYPER_CORE_COREERRORS_HPP

#include <stdexcept>

namespace codetyper::core
{

// Reading the target at or past its end. Always a caller bug.
class InvalidPosition final : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

} // namespace codetyper::core

#endif // INCLUDE_CODETYPER_CORE_COREERRORS_HPP
