#pragma once

#include <stdexcept>
#include <string>

namespace hourglass {

// I/O, connection or statement failure inside the store.
class StoreError : public std::runtime_error
{
public:
    explicit StoreError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Caller supplied data the taxonomy cannot accept (duplicate name, missing
// parent, malformed pattern). Never retried or coerced.
class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace hourglass
