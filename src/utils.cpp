#include "utils.hpp"

#include <cctype>

namespace Depfetch {

std::mutex& logMutex()
{
    static std::mutex mutex;
    return mutex;
}

/**
 * @brief Returns true for the characters encodeURIComponent leaves alone.
 */
static bool isUnreserved(unsigned char c)
{
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

std::string percentEncode(const std::string& input)
{
    static const char hexDigits[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(input.size());

    for (unsigned char c : input) {
        if (isUnreserved(c)) {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hexDigits[c >> 4]);
            encoded.push_back(hexDigits[c & 0x0F]);
        }
    }
    return encoded;
}

std::string stripScheme(const std::string& url)
{
    size_t pos = url.find("://");
    if (pos == std::string::npos) {
        return url;
    }
    return url.substr(pos + 3);
}

} // namespace Depfetch
