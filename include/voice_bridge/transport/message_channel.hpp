#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace voice_bridge::transport {

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    virtual bool send_text(const std::string& text) = 0;

    virtual std::optional<std::string> receive() = 0;

    virtual void close(const std::string& reason) = 0;

    virtual bool is_open() const = 0;
};

}
