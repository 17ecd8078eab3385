#pragma once
#include <stdexcept>
#include <string>
#include <optional>
#include <cstddef>

class GeoCryptError : public std::runtime_error {
public:
    explicit GeoCryptError(const std::string& message)
        : std::runtime_error("geocrypt: " + message) {}
};

class InvalidPrecisionError : public GeoCryptError {
public:
    explicit InvalidPrecisionError(int value, std::optional<size_t> position = std::nullopt)
        : GeoCryptError(describe("location precision out of range", value, position)),
          value_(value), position_(position) {}

    int value() const { return value_; }
    std::optional<size_t> position() const { return position_; }

protected:
    InvalidPrecisionError(const std::string& what, int value)
        : GeoCryptError(describe(what, value, std::nullopt)), value_(value) {}

private:
    int value_;
    std::optional<size_t> position_;

    static std::string describe(const std::string& what, int value, std::optional<size_t> position) {
        std::string msg = what;
        if (position.has_value()) msg += ": position " + std::to_string(*position);
        return msg + ": " + std::to_string(value);
    }
};

// Geohash bit counts must be a whole number of base32 digits, 5 to 60.
class InvalidBitCountError : public InvalidPrecisionError {
public:
    explicit InvalidBitCountError(int bits)
        : InvalidPrecisionError("geohash bit count out of range", bits) {}
};

class TextTooLongError : public GeoCryptError {
public:
    explicit TextTooLongError(size_t length)
        : GeoCryptError("note text is too long: " + std::to_string(length) + " bytes") {}
};

class InvalidBase32Error : public GeoCryptError {
public:
    InvalidBase32Error() : GeoCryptError("invalid base32") {}
};

class MismatchedHashAndLocationError : public GeoCryptError {
public:
    MismatchedHashAndLocationError()
        : GeoCryptError("hashedLocation is not the hash of the given location") {}
};

// Errors raised by the adaptive hash primitive.
class HashPrimitiveError : public GeoCryptError {
public:
    explicit HashPrimitiveError(const std::string& message) : GeoCryptError(message) {}
};

class MalformedHashError : public HashPrimitiveError {
public:
    explicit MalformedHashError(const std::string& reason)
        : HashPrimitiveError("malformed hash: " + reason) {}
};

class UnsupportedCostError : public HashPrimitiveError {
public:
    explicit UnsupportedCostError(int cost)
        : HashPrimitiveError("unsupported cost: " + std::to_string(cost)), cost_(cost) {}

    int cost() const { return cost_; }

private:
    int cost_;
};
