#include <sstream>
#include <cctype>
#include <climits>
#include <cerrno>
#include <cstdlib>

#include "util/string.hpp"

TError StringToUint64(const std::string &str, uint64_t &value) {
    const char *ptr = str.c_str();
    char *end;

    errno = 0;
    value = strtoull(ptr, &end, 10);
    if (errno || end == ptr || *ptr == '-')
        return TError(EError::InvalidValue, errno, "Bad uint64 value: " + str);
    while (isspace(*end))
        end++;
    if (*end)
        return TError(EError::InvalidValue, "Bad uint64 value: " + str);
    return OK;
}

TError StringToOct(const std::string &str, unsigned &value) {
    const char *ptr = str.c_str();
    char *end;

    errno = 0;
    uint64_t val = strtoull(ptr, &end, 8);
    if (errno || end == ptr || val > UINT32_MAX)
        return TError(EError::InvalidValue, errno, "Bad oct value: " + str);
    while (isspace(*end))
        end++;
    if (*end)
        return TError(EError::InvalidValue, "Bad oct value: " + str);
    value = val;
    return OK;
}

static char size_unit[] = {'B', 'K', 'M', 'G', 'T', 'P', 'E', 0};

std::string StringFormatSize(uint64_t value)
{
    int i = 0;

    while (value >= (1ull<<(10*(i+1))) && size_unit[i+1])
        i++;

    uint64_t div = 1ull << (10 * i);

    if (value % div == 0)
        return fmt::format("{}{}", value / div, size_unit[i]);

    return fmt::format("{:.1f}{}", (double)value / div, size_unit[i]);
}

TTuple SplitString(const std::string &str, const char sep, int max) {
    std::vector<std::string> tokens;
    std::istringstream ss(str);
    std::string tok;

    while(std::getline(ss, tok, sep)) {
        if (max && !--max) {
            std::string rem;
            std::getline(ss, rem);
            if (rem.length()) {
                tok += sep;
                tok += rem;
            }
        }
        tokens.push_back(tok);
    }

    return tokens;
}

std::string StringTrim(const std::string& s, const std::string &what) {
    std::size_t first = s.find_first_not_of(what);
    std::size_t last  = s.find_last_not_of(what);

    if (first == std::string::npos || last == std::string::npos)
        return "";

    return s.substr(first, last - first + 1);
}

bool StringStartsWith(const std::string &str, const std::string &prefix) {
    if (str.length() < prefix.length())
        return false;

    return !str.compare(0, prefix.length(), prefix);
}

bool StringEndsWith(const std::string &str, const std::string &sfx) {
    if (str.length() < sfx.length())
        return false;

    return !str.compare(str.length() - sfx.length(), sfx.length(), sfx);
}
