#include "Precision.hpp"
#include "Base32.hpp"
#include "GeoCryptErrors.hpp"
#include <cmath>
#include <limits>

int bitsForPrecision(int prec) {
    return 4 * (prec + 6);
}

int precisionForBits(int bits) {
    return bits / 4 - 6;
}

std::string geohash(double latitude, double longitude, int bits) {
    if (bits < MIN_GEOHASH_BITS || bits > MAX_GEOHASH_BITS) {
        throw InvalidBitCountError(bits);
    }
    // The low 4 bits are dropped so 12 digits cover the top 60 bits.
    return encodeBase32(encode(latitude, longitude) >> 4).substr(0, bits / 5);
}

GeoLocation location(std::string_view geohash) {
    if (geohash.empty() || geohash.size() > BASE32_DIGITS) {
        throw InvalidBitCountError(static_cast<int>(5 * geohash.size()));
    }
    int bits = static_cast<int>(5 * geohash.size());
    Coordinates coords = decode(decodeBase32(geohash), bits);
    return { coords.latitude, coords.longitude, bits };
}

Coordinates errorBounds(int bits) {
    if (bits < 1 || bits > MAX_GEOHASH_BITS) {
        double nan = std::numeric_limits<double>::quiet_NaN();
        return { nan, nan };
    }
    int latBits = bits / 2;
    int lonBits = bits - latBits;
    return { std::ldexp(LATITUDE_RANGE, -latBits), std::ldexp(LONGITUDE_RANGE, -lonBits) };
}

double haversine(double lat1, double lon1, double lat2, double lon2) {
    const double R = 6371e3;
    double dLat = (lat2 - lat1) * M_PI / 180.0;
    double dLon = (lon2 - lon1) * M_PI / 180.0;

    lat1 = lat1 * M_PI / 180.0;
    lat2 = lat2 * M_PI / 180.0;

    double a = sin(dLat/2) * sin(dLat/2) + sin(dLon/2) * sin(dLon/2) * cos(lat1) * cos(lat2);
    return 2 * R * asin(sqrt(a));
}

double diagonalError(double latitude, double longitude, int bits) {
    Coordinates err = errorBounds(bits);
    if (std::isnan(err.latitude)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return haversine(latitude - err.latitude, longitude - err.longitude,
                     latitude + err.latitude, longitude + err.longitude);
}
