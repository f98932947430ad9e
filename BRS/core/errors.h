#pragma once
#include <stdexcept>
#include <string>

// Renderer failed for one record. Recovered by StreamProducer.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& msg) : std::runtime_error(msg) {}
};

// Write to the response failed; handled like a client disconnect.
class TransportWriteError : public std::runtime_error {
public:
    explicit TransportWriteError(const std::string& msg) : std::runtime_error(msg) {}
};

// Boundary missing or unparsable. Fatal to a whole decode.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

// One multipart part could not be parsed. Recovered by the decoder.
class PartParseError : public std::runtime_error {
public:
    explicit PartParseError(const std::string& msg) : std::runtime_error(msg) {}
};

class NoWorkError : public std::runtime_error {
public:
    explicit NoWorkError(const std::string& msg) : std::runtime_error(msg) {}
};
