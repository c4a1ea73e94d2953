#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& message) : std::runtime_error(message) {}
};

// The engine could not turn a descriptor into metadata
class ResolutionError : public StreamError {
public:
    explicit ResolutionError(const std::string& message) : StreamError(message) {}
};

class NoPlayableFileError : public StreamError {
public:
    NoPlayableFileError() : StreamError("no video file found in torrent") {}
};

class NoActiveSessionError : public StreamError {
public:
    NoActiveSessionError() : StreamError("no active torrent") {}
};

class BadRequestError : public StreamError {
public:
    explicit BadRequestError(const std::string& message) : StreamError(message) {}
};

class RangeNotSatisfiableError : public StreamError {
public:
    explicit RangeNotSatisfiableError(int64_t length)
        : StreamError("requested range not satisfiable"), total_length(length) {}

    int64_t length() const { return total_length; }

private:
    int64_t total_length;
};

// A blocked read gave up because its caller went away
class ReadCancelledError : public StreamError {
public:
    ReadCancelledError() : StreamError("read cancelled") {}
};

class TransferClosedError : public StreamError {
public:
    explicit TransferClosedError(const std::string& message = "transfer closed") : StreamError(message) {}
};
