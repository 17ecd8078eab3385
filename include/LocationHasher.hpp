#pragma once
#include "AdaptiveHash.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Builds and checks one-way location verifiers. A verifier is a ':' joined
// list of adaptive hashes, one per precision, finest first. Each hash covers
// the big-endian Morton code truncated to the precision's bit count followed
// by the note text, and its cost is 66 minus that bit count.
class LocationHasher {
public:
    explicit LocationHasher(const AdaptiveHash& primitive);

    // Uses DEFAULT_PRECISION when precisions is empty. Duplicates are hashed once.
    std::string hash(double latitude, double longitude, std::string_view text,
                     const std::vector<int>& precisions = {}) const;

    // Returns the bit precision of the first tier that matches, or throws
    // MismatchedHashAndLocationError.
    int compare(std::string_view hashedLocation, double latitude, double longitude,
                std::string_view text) const;

    static int costForBits(int bits);
    static int bitsForCost(int cost);

private:
    const AdaptiveHash& primitive;

    static std::vector<int> normalizePrecisions(const std::vector<int>& precisions);
    static std::string hashInput(double latitude, double longitude, int bits, std::string_view text);
    bool compareSegment(std::string_view segment, double latitude, double longitude,
                        std::string_view text, int& bits) const;
};
