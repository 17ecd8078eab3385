#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

constexpr char BASE32_ALPHABET[] = "0123456789bcdefghjkmnpqrstuvwxyz";

// Number of digits needed for the largest multiple of both 5 and 4 within 64 bits.
constexpr size_t BASE32_DIGITS = 12;

// Encodes the low 60 bits of x as 12 digits, most significant first.
std::string encodeBase32(uint64_t x);

// Throws InvalidBase32Error on any byte outside the alphabet.
uint64_t decodeBase32(std::string_view text);
