// Verifier build and check, with a recording primitive and with PBKDF2
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "GeoCryptErrors.hpp"
#include "GeoEncoding.hpp"
#include "LocationHasher.hpp"
#include "Pbkdf2Hash.hpp"
#include "Precision.hpp"
#include "TestUtils.hpp"

using Tests::TestContext;
using Tests::throws;

namespace {

// Deterministic stand-in: "$fake$NN$<hex input>". Records every hash call.
class RecordingHash : public AdaptiveHash {
public:
    struct Call {
        std::string input;
        int cost;
    };

    mutable std::vector<Call> calls;

    std::string hash(std::string_view input, int cost) const override {
        if (cost < 4 || cost > 30) throw UnsupportedCostError(cost);
        calls.push_back({ std::string(input), cost });
        std::string out = "$fake$";
        out += static_cast<char>('0' + cost / 10);
        out += static_cast<char>('0' + cost % 10);
        out += '$';
        return out + hex(input);
    }

    bool verify(std::string_view hashed, std::string_view input) const override {
        int c = cost(hashed);
        return hashed.substr(9) == hex(input) && c >= 4;
    }

    int cost(std::string_view hashed) const override {
        if (hashed.size() < 9 || hashed.substr(0, 6) != "$fake$" || hashed[8] != '$') {
            throw MalformedHashError("not a fake hash");
        }
        int c = (hashed[6] - '0') * 10 + (hashed[7] - '0');
        if (c < 4 || c > 30) throw UnsupportedCostError(c);
        return c;
    }

    static std::string hex(std::string_view input) {
        static const char* digits = "0123456789abcdef";
        std::string out;
        for (unsigned char c : input) {
            out += digits[c >> 4];
            out += digits[c & 0xF];
        }
        return out;
    }
};

std::vector<std::string> split(const std::string& blob) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = blob.find(':', start);
        parts.push_back(blob.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return parts;
}

}

static void test_precision_normalisation(TestContext& t) {
    t.section("precision normalisation");

    RecordingHash fake;
    LocationHasher hasher(fake);

    hasher.hash(10.0, 20.0, "", {});
    t.check(fake.calls.size() == 1 && fake.calls[0].cost == 66 - bitsForPrecision(DEFAULT_PRECISION),
            "no precision uses the default precision");

    fake.calls.clear();
    std::string blob = hasher.hash(10.0, 20.0, "", { 5, 9, 5, 7, 9 });
    t.check(fake.calls.size() == 3, "duplicate precisions are hashed once");
    t.check(fake.calls.size() == 3 && fake.calls[0].cost == 6 && fake.calls[1].cost == 14 && fake.calls[2].cost == 22,
            "tiers are hashed finest first with cost 66 - bits");
    t.check(split(blob).size() == 3, "blob has one segment per distinct precision");

    fake.calls.clear();
    hasher.hash(10.0, 20.0, "", { 8 });
    t.check(fake.calls.size() == 1 && fake.calls[0].cost == 66 - 56, "single precision is used as given");
}

static void test_hash_input(TestContext& t) {
    t.section("hash input layout");

    RecordingHash fake;
    LocationHasher hasher(fake);
    hasher.hash(38.9521808, -77.1458137, "Kryptos", { 6 });

    uint64_t code = truncate(encode(38.9521808, -77.1458137), 48);
    std::string expected;
    for (int shift = 56; shift >= 0; shift -= 8) {
        expected.push_back(static_cast<char>((code >> shift) & 0xFF));
    }
    expected += "Kryptos";

    t.check(fake.calls.size() == 1 && fake.calls[0].input == expected,
            "input is the big-endian truncated code followed by the note");
    t.check(fake.calls.size() == 1 && fake.calls[0].input[6] == '\0' && fake.calls[0].input[7] == '\0',
            "bits below the precision are zero");
}

static void test_validation(TestContext& t) {
    t.section("validation");

    RecordingHash fake;
    LocationHasher hasher(fake);
    std::string longText(65, 'x');

    t.check(throws<TextTooLongError>([&] { hasher.hash(0.0, 0.0, longText, { 7 }); }), "hash rejects 65 byte note");
    t.check(fake.calls.empty(), "nothing is hashed after a validation failure");
    t.check(!hasher.hash(0.0, 0.0, std::string(64, 'x'), { 9 }).empty(), "64 byte note is accepted");

    try {
        hasher.hash(0.0, 0.0, "", { 7, 0, 3 });
        t.check(false, "precision 0 is rejected");
    } catch (const InvalidPrecisionError& e) {
        t.check(e.position().has_value() && *e.position() == 1 && e.value() == 0,
                "invalid precision reports its position and value");
        t.check(std::string(e.what()).find("position 1") != std::string::npos, "message names the position");
    }
    t.check(throws<InvalidPrecisionError>([&] { hasher.hash(0.0, 0.0, "", { 10 }); }), "precision 10 is rejected");

    t.check(throws<UnsupportedCostError>([&] { hasher.hash(0.0, 0.0, "", { 1 }); }),
            "primitive cost errors pass through");

    std::string blob = hasher.hash(0.0, 0.0, "", { 9 });
    t.check(throws<TextTooLongError>([&] { hasher.compare(blob, 0.0, 0.0, longText); }),
            "compare rejects 65 byte note before scanning");
    t.check(throws<MalformedHashError>([&] { hasher.compare("", 0.0, 0.0, ""); }),
            "compare rejects an empty blob");
}

static void test_compare_segments(TestContext& t) {
    t.section("segment scan");

    RecordingHash fake;
    LocationHasher hasher(fake);
    std::string blob = hasher.hash(41.9038163, 12.4476838, "note", { 9, 6 });
    std::vector<std::string> parts = split(blob);

    t.check(hasher.compare(blob, 41.9038163, 12.4476838, "note") == 60, "exact point matches the finest tier");
    t.check(hasher.compare("garbage:" + blob, 41.9038163, 12.4476838, "note") == 60,
            "malformed segments are skipped");
    t.check(hasher.compare("$fake$99$00:" + parts[1], 41.9038163, 12.4476838, "note") == 48,
            "segments with unsupported cost are skipped");
    t.check(hasher.compare(parts[1] + ":" + parts[0], 41.9038163, 12.4476838, "note") == 48,
            "first matching segment wins");
    t.check(throws<MismatchedHashAndLocationError>([&] { hasher.compare("garbage::", 0.0, 0.0, ""); }),
            "all malformed segments is a mismatch");
    t.check(throws<MismatchedHashAndLocationError>([&] { hasher.compare(blob, 41.9038163, 12.4476838, "other"); }),
            "different note is a mismatch");
}

static void test_round_trip(TestContext& t) {
    t.section("PBKDF2 round trip");

    Pbkdf2Hash primitive;
    LocationHasher hasher(primitive);

    struct Point { double lat, lon; };
    std::vector<Point> points = { { -36.7522214, 141.8259674 }, { 41.9038163, 12.4476838 } };
    for (const auto& p : points) {
        for (int prec : { 9, 8, 7 }) {
            std::string blob = hasher.hash(p.lat, p.lon, "", { prec });
            t.check(hasher.compare(blob, p.lat, p.lon, "") == bitsForPrecision(prec),
                    "compare reports bits for precision " + std::to_string(prec));
            t.check(throws<MismatchedHashAndLocationError>([&] { hasher.compare(blob, p.lat, p.lon, "x"); }),
                    "note text is bound into precision " + std::to_string(prec));
        }
    }

    std::string blob = hasher.hash(0.0, 0.0, "");
    t.check(hasher.compare(blob, 0.0, 0.0, "") == bitsForPrecision(DEFAULT_PRECISION), "default precision round trips");

    Coordinates err = errorBounds(bitsForPrecision(9));
    double lat = 41.9038163 + 10 * err.latitude;
    double lon = 12.4476838 + 10 * err.longitude;
    std::string fine = hasher.hash(41.9038163, 12.4476838, "", { 9 });
    t.check(throws<MismatchedHashAndLocationError>([&] { hasher.compare(fine, lat, lon, ""); }),
            "candidate beyond the error bound is a mismatch");
}

static void test_coarse_fallback(TestContext& t) {
    t.section("coarse tier fallback");

    Pbkdf2Hash primitive;
    LocationHasher hasher(primitive);

    const double lat = -36.7522214;
    const double lon = 141.8259674;
    const int coarse = bitsForPrecision(5);
    const int fine = bitsForPrecision(9);
    uint64_t code = encode(lat, lon);

    // South-west corner of the coarse cell, nudged inside it.
    Coordinates corner = decode(truncate(code, coarse) >> (64 - coarse), coarse);
    Coordinates fineErr = errorBounds(fine);
    Coordinates coarseErr = errorBounds(coarse);
    std::vector<Coordinates> candidates = {
        { corner.latitude + fineErr.latitude / 2, corner.longitude + fineErr.longitude / 2 },
        { corner.latitude + coarseErr.latitude / 2, corner.longitude + coarseErr.longitude / 2 },
    };

    bool found = false;
    Coordinates candidate{};
    for (const auto& c : candidates) {
        uint64_t cc = encode(c.latitude, c.longitude);
        if (truncate(cc, coarse) == truncate(code, coarse) && truncate(cc, fine) != truncate(code, fine)) {
            candidate = c;
            found = true;
            break;
        }
    }
    t.check(found, "a candidate inside the coarse cell but outside the fine cell exists");
    if (!found) return;

    std::string blob = hasher.hash(lat, lon, "", { 9, 5 });
    t.check(split(blob).size() == 2, "two tiers are stored");
    t.check(hasher.compare(blob, lat, lon, "") == fine, "exact point matches the fine tier");
    t.check(hasher.compare(blob, candidate.latitude, candidate.longitude, "") == coarse,
            "nearby point falls back to the coarse tier");
}

static void test_kryptos(TestContext& t) {
    t.section("Kryptos");

    Pbkdf2Hash primitive;
    LocationHasher hasher(primitive);

    int bits = bitsForPrecision(6);
    Coordinates err = errorBounds(bits);
    t.check(bits == 48, "precision 6 is 48 bits");
    t.check(Tests::near(err.latitude, 1.07e-05, 0.005e-05) && Tests::near(err.longitude, 2.15e-05, 0.005e-05),
            "error is about (1.07e-05, 2.15e-05)");

    std::string h = hasher.hash(38.9521808, -77.1458137, "Kryptos", { 6 });
    t.check(throws<MismatchedHashAndLocationError>([&] { hasher.compare(h, 38.95218, -77.14581, ""); }),
            "reduced accuracy location without note fails");
    t.check(hasher.compare(h, 38.95218, -77.14581, "Kryptos") == 48,
            "reduced accuracy location with note matches at 48 bits");
}

static void test_concurrent(TestContext& t) {
    t.section("concurrent use");

    Pbkdf2Hash primitive;
    LocationHasher hasher(primitive);

    std::atomic<int> matches{0};
    std::mutex errorsMutex;
    std::vector<std::string> errors;
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&, i] {
            try {
                double lat = -45.0 + 20.0 * i;
                double lon = -90.0 + 40.0 * i;
                std::string note = "thread " + std::to_string(i);
                std::string blob = hasher.hash(lat, lon, note, { 9, 8 });
                if (hasher.compare(blob, lat, lon, note) == 60) matches++;
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> lock(errorsMutex);
                errors.push_back(e.what());
            }
        });
    }
    for (auto& th : threads) th.join();

    for (const auto& e : errors) std::cout << "  thread error: " << e << std::endl;
    t.check(errors.empty() && matches == 4, "hash and compare from several threads");
}

int main() {
    TestContext t;
    test_precision_normalisation(t);
    test_hash_input(t);
    test_validation(t);
    test_compare_segments(t);
    test_round_trip(t);
    test_coarse_fallback(t);
    test_kryptos(t);
    test_concurrent(t);
    return t.finish("LocationHasher");
}
