#include "GeoEncoding.hpp"
#include <cmath>
#include <cstdint>

uint64_t spread_int32_to_int64(uint32_t v) {
    uint64_t result = v;
    result = (result | (result << 16)) & 0x0000FFFF0000FFFFULL;
    result = (result | (result << 8))  & 0x00FF00FF00FF00FFULL;
    result = (result | (result << 4))  & 0x0F0F0F0F0F0F0F0FULL;
    result = (result | (result << 2))  & 0x3333333333333333ULL;
    result = (result | (result << 1))  & 0x5555555555555555ULL;
    return result;
}

uint64_t interleave(uint32_t x, uint32_t y) {
    return spread_int32_to_int64(x) | (spread_int32_to_int64(y) << 1);
}

// Values outside [0, 1) saturate so the conversion stays defined.
static uint32_t to_fixed_point(double normalized) {
    if (!(normalized > 0.0)) return 0;
    if (normalized >= 1.0) return UINT32_MAX;
    return static_cast<uint32_t>(std::ldexp(normalized, 32));
}

uint64_t encode(double latitude, double longitude) {
    uint32_t lat_int = to_fixed_point((latitude - MIN_LATITUDE) / LATITUDE_RANGE);
    uint32_t lon_int = to_fixed_point((longitude - MIN_LONGITUDE) / LONGITUDE_RANGE);

    return interleave(lat_int, lon_int);
}

uint32_t compact_int64_to_int32(uint64_t v) {
    v = v & 0x5555555555555555ULL;
    v = (v | (v >> 1)) & 0x3333333333333333ULL;
    v = (v | (v >> 2)) & 0x0F0F0F0F0F0F0F0FULL;
    v = (v | (v >> 4)) & 0x00FF00FF00FF00FFULL;
    v = (v | (v >> 8)) & 0x0000FFFF0000FFFFULL;
    v = (v | (v >> 16)) & 0x00000000FFFFFFFFULL;
    return static_cast<uint32_t>(v);
}

static Coordinates convert_grid_numbers_to_coordinates(uint32_t grid_latitude_number, uint32_t grid_longitude_number) {
    Coordinates result;
    result.latitude = std::ldexp(static_cast<double>(grid_latitude_number) * LATITUDE_RANGE, -32) + MIN_LATITUDE;
    result.longitude = std::ldexp(static_cast<double>(grid_longitude_number) * LONGITUDE_RANGE, -32) + MIN_LONGITUDE;
    return result;
}

uint64_t truncate(uint64_t geo_code, int bits) {
    if (bits <= 0) return 0;
    if (bits >= 64) return geo_code;
    return geo_code & (~0ULL << (64 - bits));
}

Coordinates decode(uint64_t geo_code, int bits) {
    // Shifting a 64-bit value by 64 is undefined, so the full-width code is used as is.
    uint64_t aligned = 0;
    if (bits >= 64) {
        aligned = geo_code;
    } else if (bits > 0) {
        aligned = geo_code << (64 - bits);
    }

    uint32_t grid_latitude_number = compact_int64_to_int32(aligned);
    uint32_t grid_longitude_number = compact_int64_to_int32(aligned >> 1);

    return convert_grid_numbers_to_coordinates(grid_latitude_number, grid_longitude_number);
}
