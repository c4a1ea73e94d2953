#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Inclusive byte range, as written in Content-Range
struct ByteRange {
    int64_t start = 0;
    int64_t end = 0;

    int64_t length() const { return end - start + 1; }
};

class HttpRange {
public:
    // Parses a single "bytes=" range against a resource length. Returns nullopt
    // when there is no header or it names several ranges (the whole resource is
    // served). Throws RangeNotSatisfiableError for malformed or out-of-bounds ranges.
    static std::optional<ByteRange> parse(const std::string& header, int64_t length);

    static std::string contentRange(const ByteRange& range, int64_t length);
    static std::string unsatisfiedRange(int64_t length);

private:
    static int64_t parseOffset(const std::string& text, int64_t length);
    static std::string trim(const std::string& text);
};
