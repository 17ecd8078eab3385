#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include "GeoEncoding.hpp"

constexpr int MIN_PRECISION = 1;
constexpr int MAX_PRECISION = 9;

// Approximately one diagonal metre at the equator.
constexpr int DEFAULT_PRECISION = 7;

constexpr size_t MAX_TEXT_LENGTH = 64;

constexpr int MIN_GEOHASH_BITS = 5;
constexpr int MAX_GEOHASH_BITS = 60;

struct GeoLocation {
    double latitude;
    double longitude;
    int bits;
};

int bitsForPrecision(int prec);
int precisionForBits(int bits);

std::string geohash(double latitude, double longitude, int bits);
GeoLocation location(std::string_view geohash);

// Maximum deviation in degrees introduced by truncating to `bits`.
// Both fields are NaN when bits is outside [1, 60].
Coordinates errorBounds(int bits);

double haversine(double lat1, double lon1, double lat2, double lon2);

// Length in metres of the diagonal of the error box around the point.
double diagonalError(double latitude, double longitude, int bits);
