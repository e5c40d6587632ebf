#include <cerrno>
#include <cstring>
#include <sstream>

#include <uniqint/error.h>

namespace UniqInt {

std::string errno_message(const std::string& what) {
    return errno_message(what, errno);
}

std::string errno_message(const std::string& what, int errnum) {
    std::ostringstream os;
    os << what << " (errno=" << errnum << ": " << strerror(errnum) << ")";
    return os.str();
}

} // namespace UniqInt
