#pragma once
#include "AdaptiveHash.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// PBKDF2-HMAC-SHA256 with 2^cost iterations, serialized as
// $pbkdf2-sha256$NN$<salt>$<digest> using the crypt(3) base64 alphabet.
class Pbkdf2Hash : public AdaptiveHash {
public:
    static constexpr int MIN_COST = 4;
    static constexpr int MAX_COST = 30;
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t DIGEST_SIZE = 32;

    std::string hash(std::string_view input, int cost) const override;
    bool verify(std::string_view hashed, std::string_view input) const override;
    int cost(std::string_view hashed) const override;

private:
    struct Parsed {
        int cost;
        std::vector<uint8_t> salt;
        std::vector<uint8_t> digest;
    };

    Parsed parse(std::string_view hashed) const;
    std::vector<uint8_t> derive(std::string_view input, const std::vector<uint8_t>& salt, int cost) const;
};
