#pragma once
#include <string>
#include <nlohmann/json.hpp>

class MagnetUtils {
public:
    // %XX escapes; '+' becomes a space for form-encoded values
    static std::string urlDecode(const std::string& encoded, bool plus_as_space = false);
    static std::string urlEncode(const std::string& value);

    // Returns {"info_hash", "display_name", "trackers"}. The info hash is
    // normalized to 40 lowercase hex digits. Throws BadRequestError.
    static nlohmann::json parseMagnetLink(const std::string& magnet_link);

private:
    static std::string normalizeInfoHash(const std::string& hash);
    static std::string base32ToHex(const std::string& encoded);
};
