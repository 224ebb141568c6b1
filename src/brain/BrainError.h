// src/brain/BrainError.h
#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace promenade::brain {

// Raised by reasoning-service transports and the wire decoder.
class BrainError : public std::runtime_error {
public:
    enum class Kind {
        Network,     // connect/send/receive failed
        Timeout,
        Http,        // non-2xx status
        Malformed,   // body is not the expected JSON shape
    };

    BrainError(Kind kind, const std::string& what, long httpStatus = 0)
        : std::runtime_error(what), kind_(kind), httpStatus_(httpStatus) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] long http_status() const noexcept { return httpStatus_; }

private:
    Kind kind_;
    long httpStatus_;
};

inline std::string_view to_string(BrainError::Kind k) noexcept
{
    switch (k) {
    case BrainError::Kind::Network:   return "network";
    case BrainError::Kind::Timeout:   return "timeout";
    case BrainError::Kind::Http:      return "http";
    case BrainError::Kind::Malformed: return "malformed";
    }
    return "unknown";
}

} // namespace promenade::brain
