#include "Pbkdf2Hash.hpp"
#include "GeoCryptErrors.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdio>

namespace {

constexpr std::string_view PREFIX = "$pbkdf2-sha256$";
constexpr char CRYPT_ALPHABET[] = "./0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

std::string opensslError(const std::string& context) {
    char buf[256];
    unsigned long code = ERR_get_error();
    if (code == 0) return context;
    ERR_error_string_n(code, buf, sizeof(buf));
    return context + ": " + buf;
}

size_t encodedLength(size_t n) {
    return (n * 8 + 5) / 6;
}

std::string encodeCryptBase64(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(encodedLength(data.size()));
    uint32_t acc = 0;
    int accBits = 0;
    for (uint8_t byte : data) {
        acc = (acc << 8) | byte;
        accBits += 8;
        while (accBits >= 6) {
            accBits -= 6;
            out.push_back(CRYPT_ALPHABET[(acc >> accBits) & 0x3F]);
        }
    }
    if (accBits > 0) {
        out.push_back(CRYPT_ALPHABET[(acc << (6 - accBits)) & 0x3F]);
    }
    return out;
}

int cryptDigit(char c) {
    if (c == '.') return 0;
    if (c == '/') return 1;
    if (c >= '0' && c <= '9') return c - '0' + 2;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 12;
    if (c >= 'a' && c <= 'z') return c - 'a' + 38;
    return -1;
}

std::vector<uint8_t> decodeCryptBase64(std::string_view text, size_t size, const char* field) {
    if (text.size() != encodedLength(size)) {
        throw MalformedHashError(std::string(field) + " has wrong length");
    }
    std::vector<uint8_t> out;
    out.reserve(size);
    uint32_t acc = 0;
    int accBits = 0;
    for (char c : text) {
        int v = cryptDigit(c);
        if (v < 0) {
            throw MalformedHashError(std::string(field) + " is not crypt base64");
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        accBits += 6;
        if (accBits >= 8) {
            accBits -= 8;
            out.push_back(static_cast<uint8_t>(acc >> accBits));
        }
        acc &= (1u << accBits) - 1;
    }
    if (acc != 0) {
        throw MalformedHashError(std::string(field) + " has non-zero padding bits");
    }
    return out;
}

}

std::string Pbkdf2Hash::hash(std::string_view input, int cost) const {
    if (cost < MIN_COST || cost > MAX_COST) {
        throw UnsupportedCostError(cost);
    }

    std::vector<uint8_t> salt(SALT_SIZE);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw HashPrimitiveError(opensslError("RAND_bytes failed"));
    }
    std::vector<uint8_t> digest = derive(input, salt, cost);

    char costField[3];
    std::snprintf(costField, sizeof(costField), "%02d", cost);

    std::string out(PREFIX);
    out += costField;
    out += '$';
    out += encodeCryptBase64(salt);
    out += '$';
    out += encodeCryptBase64(digest);
    return out;
}

bool Pbkdf2Hash::verify(std::string_view hashed, std::string_view input) const {
    Parsed parsed = parse(hashed);
    std::vector<uint8_t> digest = derive(input, parsed.salt, parsed.cost);
    return CRYPTO_memcmp(digest.data(), parsed.digest.data(), DIGEST_SIZE) == 0;
}

int Pbkdf2Hash::cost(std::string_view hashed) const {
    return parse(hashed).cost;
}

Pbkdf2Hash::Parsed Pbkdf2Hash::parse(std::string_view hashed) const {
    if (hashed.substr(0, PREFIX.size()) != PREFIX) {
        throw MalformedHashError("missing $pbkdf2-sha256$ prefix");
    }
    std::string_view rest = hashed.substr(PREFIX.size());

    if (rest.size() < 3 || rest[2] != '$' ||
        rest[0] < '0' || rest[0] > '9' || rest[1] < '0' || rest[1] > '9') {
        throw MalformedHashError("cost is not two digits");
    }
    Parsed parsed;
    parsed.cost = (rest[0] - '0') * 10 + (rest[1] - '0');
    if (parsed.cost < MIN_COST || parsed.cost > MAX_COST) {
        throw UnsupportedCostError(parsed.cost);
    }
    rest.remove_prefix(3);

    size_t sep = rest.find('$');
    if (sep == std::string_view::npos) {
        throw MalformedHashError("missing digest");
    }
    parsed.salt = decodeCryptBase64(rest.substr(0, sep), SALT_SIZE, "salt");
    parsed.digest = decodeCryptBase64(rest.substr(sep + 1), DIGEST_SIZE, "digest");
    return parsed;
}

std::vector<uint8_t> Pbkdf2Hash::derive(std::string_view input, const std::vector<uint8_t>& salt, int cost) const {
    std::vector<uint8_t> digest(DIGEST_SIZE);
    int ok = PKCS5_PBKDF2_HMAC(input.data(), static_cast<int>(input.size()),
                               salt.data(), static_cast<int>(salt.size()),
                               1 << cost, EVP_sha256(),
                               static_cast<int>(digest.size()), digest.data());
    if (ok != 1) {
        throw HashPrimitiveError(opensslError("PKCS5_PBKDF2_HMAC failed"));
    }
    return digest;
}
