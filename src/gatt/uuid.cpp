#include <cctype>
#include <string>

#include "gatt/uuid.hpp"
#include "util/constants.hpp"

namespace gatt
{

static bool all_hex(std::string_view s)
{
    for (char c : s)
        if (!std::isxdigit((unsigned char)c))
            return false;
    return !s.empty();
}

static std::string lower(std::string_view s)
{
    std::string r(s);
    for (auto &c : r)
        c = (char)std::tolower((unsigned char)c);
    return r;
}

static std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace((unsigned char)s.front()))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace((unsigned char)s.back()))
        s.remove_suffix(1);
    return s;
}

// ======================================================================
// Function: normalize_uuid
// - In: token as typed by a caller (filter, command line, BlueZ property)
// - Out: Ok and `out` = "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" (lowercase)
// - Note: fails with InvalidUuid carrying the raw token; idempotent
// ======================================================================
webble::Status normalize_uuid(std::string_view token, std::string &out)
{
    std::string_view s = trim(token);

    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    {
        std::string_view hex = s.substr(2);
        if ((hex.size() == 4 || hex.size() == 8) && all_hex(hex))
            s = hex;
        else
            return webble::Status::invalid_uuid(std::string(token));
    }

    if (s.size() == 4 && all_hex(s))
    {
        out = "0000" + lower(s) + std::string(constants::BASE_UUID_SUFFIX);
        return webble::Status::Ok();
    }
    if (s.size() == 8 && all_hex(s))
    {
        out = lower(s) + std::string(constants::BASE_UUID_SUFFIX);
        return webble::Status::Ok();
    }

    if (s.size() == 38 && s.front() == '{' && s.back() == '}')
        s = s.substr(1, 36);

    if (s.size() == 32 && all_hex(s))
    {
        std::string h = lower(s);
        out = h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" + h.substr(16, 4) +
              "-" + h.substr(20, 12);
        return webble::Status::Ok();
    }

    if (s.size() == 36)
    {
        for (size_t i = 0; i < s.size(); ++i)
        {
            const bool dash_pos = i == 8 || i == 13 || i == 18 || i == 23;
            if (dash_pos ? s[i] != '-' : !std::isxdigit((unsigned char)s[i]))
                return webble::Status::invalid_uuid(std::string(token));
        }
        out = lower(s);
        return webble::Status::Ok();
    }

    return webble::Status::invalid_uuid(std::string(token));
}

bool uuid_eq(std::string_view a, std::string_view b)
{
    std::string na, nb;
    if (!normalize_uuid(a, na).ok() || !normalize_uuid(b, nb).ok())
        return false;
    return na == nb;
}

}  // namespace gatt
