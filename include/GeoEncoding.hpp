#pragma once
#include <cstdint>

constexpr double MIN_LATITUDE = -90.0;
constexpr double MAX_LATITUDE = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

constexpr double LATITUDE_RANGE = MAX_LATITUDE - MIN_LATITUDE;
constexpr double LONGITUDE_RANGE = MAX_LONGITUDE - MIN_LONGITUDE;

struct Coordinates {
    double latitude;
    double longitude;
};

uint64_t spread_int32_to_int64(uint32_t v);
uint32_t compact_int64_to_int32(uint64_t v);
uint64_t interleave(uint32_t x, uint32_t y);

// Morton code of the point: latitude bits at even positions, longitude at odd.
uint64_t encode(double latitude, double longitude);

// Reconstructs the south-west corner of the cell named by the low `bits` bits of geo_code.
Coordinates decode(uint64_t geo_code, int bits);

// Zeroes every bit of geo_code below the top `bits`.
uint64_t truncate(uint64_t geo_code, int bits);
