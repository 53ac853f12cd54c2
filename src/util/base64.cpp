#include <cstddef>
#include <sodium.h>
#include <string>

#include "util/base64.hpp"
#include "util/log.hpp"

namespace b64
{

// The codec itself does not depend on the RNG; a failed init is only reported
static void ensure_sodium_init()
{
    static const bool ok = [] {
        if (sodium_init() < 0)
        {
            LOG_ERROR("sodium_init() failed");
            return false;
        }
        return true;
    }();
    (void)ok;
}

std::string encode(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.empty())
        return std::string();
    ensure_sodium_init();

    const std::size_t cap =
        sodium_base64_ENCODED_LEN(bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(cap, '\0');
    sodium_bin2base64(out.data(), cap, bytes.data(), bytes.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    // ENCODED_LEN counts the trailing NUL
    out.resize(std::char_traits<char>::length(out.c_str()));
    return out;
}

webble::Status decode(std::string_view text, std::vector<std::uint8_t> &out)
{
    out.clear();
    if (text.empty())
        return webble::Status::Ok();
    ensure_sodium_init();

    std::vector<std::uint8_t> buf(text.size() / 4 * 3 + 3);
    std::size_t               bin_len = 0;
    // b64_end == nullptr makes libsodium reject any trailing garbage
    int r = sodium_base642bin(buf.data(), buf.size(), text.data(), text.size(), nullptr,
                              &bin_len, nullptr, sodium_base64_VARIANT_ORIGINAL);
    if (r != 0)
    {
        LOG_DEBUG("base64 decode failed (len=%zu)", text.size());
        return webble::Status::invalid_request("Invalid base64 value");
    }
    buf.resize(bin_len);
    out = std::move(buf);
    return webble::Status::Ok();
}

}  // namespace b64
