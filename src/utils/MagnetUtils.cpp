#include "MagnetUtils.hpp"
#include "../engine/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>

std::string MagnetUtils::urlDecode(const std::string& encoded, bool plus_as_space) {
    std::string decoded;
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%') {
            if (i + 2 < encoded.size() && std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
                std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
                int value;
                std::istringstream iss(encoded.substr(i + 1, 2));
                if (iss >> std::hex >> value) {
                    decoded += static_cast<char>(value);
                    i += 2;
                    continue;
                }
            }
            decoded += encoded[i];
        } else if (plus_as_space && encoded[i] == '+') {
            decoded += ' ';
        } else {
            decoded += encoded[i];
        }
    }
    return decoded;
}

std::string MagnetUtils::urlEncode(const std::string& value) {
    std::stringstream ss;
    for (unsigned char c : value) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            ss << c;
        } else {
            ss << "%" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
               << static_cast<int>(c);
        }
    }
    return ss.str();
}

nlohmann::json MagnetUtils::parseMagnetLink(const std::string& magnet_link) {
    const std::string scheme = "magnet:?";
    if (magnet_link.size() < scheme.size() ||
        !std::equal(scheme.begin(), scheme.end(), magnet_link.begin(),
                    [](char a, char b) { return a == std::tolower(static_cast<unsigned char>(b)); })) {
        throw BadRequestError("Invalid magnet link: wrong head");
    }

    nlohmann::json result = {
        {"info_hash", ""},
        {"display_name", ""},
        {"trackers", nlohmann::json::array()}
    };

    std::stringstream params(magnet_link.substr(scheme.size()));
    std::string param;
    while (std::getline(params, param, '&')) {
        size_t eq = param.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = param.substr(0, eq);
        std::string value = urlDecode(param.substr(eq + 1), true);

        if (key == "xt") {
            const std::string prefix = "urn:btih:";
            if (value.compare(0, prefix.size(), prefix) == 0) {
                result["info_hash"] = normalizeInfoHash(value.substr(prefix.size()));
            }
        } else if (key == "dn") {
            result["display_name"] = value;
        } else if (key == "tr") {
            result["trackers"].push_back(value);
        }
    }

    if (result["info_hash"].get<std::string>().empty()) {
        throw BadRequestError("Invalid magnet link: missing urn:btih:");
    }
    return result;
}

std::string MagnetUtils::normalizeInfoHash(const std::string& hash) {
    if (hash.size() == 40 && std::all_of(hash.begin(), hash.end(),
            [](unsigned char c) { return std::isxdigit(c); })) {
        std::string lower = hash;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return std::tolower(c); });
        return lower;
    }
    if (hash.size() == 32) {
        return base32ToHex(hash);
    }
    throw BadRequestError("Invalid magnet link: bad info hash " + hash);
}

std::string MagnetUtils::base32ToHex(const std::string& encoded) {
    std::vector<unsigned char> bytes;
    uint32_t buffer = 0;
    int bits = 0;
    for (char ch : encoded) {
        int c = std::toupper(static_cast<unsigned char>(ch));
        int value;
        if (c >= 'A' && c <= 'Z') {
            value = c - 'A';
        } else if (c >= '2' && c <= '7') {
            value = c - '2' + 26;
        } else {
            throw BadRequestError("Invalid magnet link: bad base32 info hash");
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<unsigned char>((buffer >> bits) & 0xFF));
        }
    }

    std::stringstream ss;
    for (unsigned char byte : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}
