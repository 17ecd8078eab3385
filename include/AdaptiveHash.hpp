#pragma once
#include <string>
#include <string_view>

// Salted, self-describing one-way hash with a tunable work factor.
// Implementations must never emit ':' since hashes are joined with it.
class AdaptiveHash {
public:
    virtual ~AdaptiveHash() = default;

    virtual std::string hash(std::string_view input, int cost) const = 0;
    virtual bool verify(std::string_view hashed, std::string_view input) const = 0;
    virtual int cost(std::string_view hashed) const = 0;
};
