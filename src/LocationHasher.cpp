#include "LocationHasher.hpp"
#include "GeoCryptErrors.hpp"
#include "GeoEncoding.hpp"
#include "Precision.hpp"
#include <algorithm>
#include <functional>
#include <iostream>

namespace {

constexpr int COST_OFFSET = 66;
constexpr char SEPARATOR = ':';

void checkTextLength(std::string_view text) {
    if (text.size() > MAX_TEXT_LENGTH) {
        throw TextTooLongError(text.size());
    }
}

}

LocationHasher::LocationHasher(const AdaptiveHash& primitive) : primitive(primitive) {}

int LocationHasher::costForBits(int bits) {
    return COST_OFFSET - bits;
}

int LocationHasher::bitsForCost(int cost) {
    return COST_OFFSET - cost;
}

std::vector<int> LocationHasher::normalizePrecisions(const std::vector<int>& precisions) {
    if (precisions.empty()) {
        return { DEFAULT_PRECISION };
    }
    std::vector<int> sorted(precisions);
    std::stable_sort(sorted.begin(), sorted.end(), std::greater<int>());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    return sorted;
}

std::string LocationHasher::hashInput(double latitude, double longitude, int bits, std::string_view text) {
    uint64_t code = truncate(encode(latitude, longitude), bits);

    std::string input;
    input.reserve(8 + text.size());
    for (int shift = 56; shift >= 0; shift -= 8) {
        input.push_back(static_cast<char>((code >> shift) & 0xFF));
    }
    input.append(text.data(), text.size());
    return input;
}

std::string LocationHasher::hash(double latitude, double longitude, std::string_view text,
                                 const std::vector<int>& precisions) const {
    checkTextLength(text);
    for (size_t i = 0; i < precisions.size(); ++i) {
        if (precisions[i] < MIN_PRECISION || precisions[i] > MAX_PRECISION) {
            throw InvalidPrecisionError(precisions[i], i);
        }
    }

    std::string out;
    for (int prec : normalizePrecisions(precisions)) {
        if (!out.empty()) out.push_back(SEPARATOR);
        int bits = bitsForPrecision(prec);
        out += primitive.hash(hashInput(latitude, longitude, bits, text), costForBits(bits));
    }
    return out;
}

bool LocationHasher::compareSegment(std::string_view segment, double latitude, double longitude,
                                    std::string_view text, int& bits) const {
    int cost = primitive.cost(segment);
    bits = bitsForCost(cost);
    if (bits < 1 || bits > 64) {
        throw MalformedHashError("cost " + std::to_string(cost) + " has no bit precision");
    }
    return primitive.verify(segment, hashInput(latitude, longitude, bits, text));
}

int LocationHasher::compare(std::string_view hashedLocation, double latitude, double longitude,
                            std::string_view text) const {
    checkTextLength(text);
    if (hashedLocation.empty()) {
        throw MalformedHashError("empty hashed location");
    }

    size_t index = 0;
    size_t start = 0;
    while (start <= hashedLocation.size()) {
        size_t end = hashedLocation.find(SEPARATOR, start);
        if (end == std::string_view::npos) end = hashedLocation.size();
        std::string_view segment = hashedLocation.substr(start, end - start);

        try {
            int bits = 0;
            if (compareSegment(segment, latitude, longitude, text, bits)) {
                return bits;
            }
        } catch (const MalformedHashError& e) {
            std::cerr << "LocationHasher: skipping malformed segment " << index << ": " << e.what() << "\n";
        } catch (const UnsupportedCostError& e) {
            std::cerr << "LocationHasher: skipping segment " << index << ": " << e.what() << "\n";
        }

        start = end + 1;
        ++index;
    }
    throw MismatchedHashAndLocationError();
}
