#pragma once

#include <string_view>

namespace gradebox {

/// Destination of human-readable output
class Sink
{
public:
    virtual void write(std::string_view str) = 0;
    virtual void flush() = 0;

    virtual ~Sink() = default;
};

} // namespace gradebox
