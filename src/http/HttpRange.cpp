#include "HttpRange.hpp"
#include "../engine/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <vector>

std::string HttpRange::trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

int64_t HttpRange::parseOffset(const std::string& text, int64_t length) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw RangeNotSatisfiableError(length);
    }
    if (text.size() > 18) {
        return std::numeric_limits<int64_t>::max();  // far past any file
    }
    return std::stoll(text);
}

std::optional<ByteRange> HttpRange::parse(const std::string& header, int64_t length) {
    std::string value = trim(header);
    if (value.empty()) {
        return std::nullopt;
    }

    const std::string unit = "bytes=";
    if (value.compare(0, unit.size(), unit) != 0) {
        throw RangeNotSatisfiableError(length);
    }

    std::vector<std::string> parts;
    std::stringstream list(value.substr(unit.size()));
    std::string part;
    while (std::getline(list, part, ',')) {
        part = trim(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    if (parts.empty()) {
        throw RangeNotSatisfiableError(length);
    }
    if (parts.size() > 1) {
        return std::nullopt;
    }

    part = parts.front();
    size_t dash = part.find('-');
    if (dash == std::string::npos) {
        throw RangeNotSatisfiableError(length);
    }
    std::string first = trim(part.substr(0, dash));
    std::string last = trim(part.substr(dash + 1));

    ByteRange range;
    if (first.empty()) {
        // Suffix range: the final N bytes
        int64_t suffix = parseOffset(last, length);
        if (suffix == 0 || length == 0) {
            throw RangeNotSatisfiableError(length);
        }
        range.start = suffix >= length ? 0 : length - suffix;
        range.end = length - 1;
        return range;
    }

    range.start = parseOffset(first, length);
    if (range.start >= length) {
        throw RangeNotSatisfiableError(length);
    }
    if (last.empty()) {
        range.end = length - 1;
    } else {
        range.end = parseOffset(last, length);
        if (range.end < range.start) {
            throw RangeNotSatisfiableError(length);
        }
        range.end = std::min(range.end, length - 1);
    }
    return range;
}

std::string HttpRange::contentRange(const ByteRange& range, int64_t length) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" + std::to_string(length);
}

std::string HttpRange::unsatisfiedRange(int64_t length) {
    return "bytes */" + std::to_string(length);
}
