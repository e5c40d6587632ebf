#ifndef UNIQINT_ERROR_H_INCLUDED
#define UNIQINT_ERROR_H_INCLUDED

#include <stdexcept>
#include <string>

namespace UniqInt {

enum class ErrorType {
    InputDirectoryMissing,
    Io,
    Config
};

class Error : public std::runtime_error {
private:
    ErrorType type;

public:
    Error(ErrorType _type, const std::string& message)
        : runtime_error(message)
        , type(_type) {
    }

    ErrorType getType() const { return type; }
};

/**
 * Builds "<what> (errno=N: text)" from the current errno
 */
std::string errno_message(const std::string& what);

/**
 * Same as errno_message for an explicitly given error number
 */
std::string errno_message(const std::string& what, int errnum);

} // namespace UniqInt

#endif // UNIQINT_ERROR_H_INCLUDED
