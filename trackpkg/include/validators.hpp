#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Length and prefix rules for the right-to-left mod-10 barcodes
// shared by FedEx Ground and USPS.
struct Mod10Scheme {
    std::size_t width;                           // characters used, taken from the right
    std::vector<std::string> accepted_prefixes;  // leading characters of the full number
    std::vector<std::string> excluded_prefixes;
};

extern const Mod10Scheme FEDEX_GROUND_SCHEME;
extern const Mod10Scheme USPS_SCHEME;

class Validators {
public:
    // Strip leading and trailing ASCII whitespace
    static std::string trim(const std::string& raw);

    // "1Z" + 15 alphanumerics + check digit, 18 characters in total
    static bool ups(const std::string& raw);

    // 11 digits weighted 3,1,7 + mod-11 check digit
    static bool fedex_express(const std::string& raw);

    // "96"/"00" barcodes, check over the rightmost 15 characters
    static bool fedex_ground(const std::string& raw);

    // Service prefixed barcodes, check over the rightmost 22 characters
    static bool usps(const std::string& raw);

    // Check digit for a numeric body read right to left: the rightmost
    // digit weighs 3, then weights alternate 1, 3, ...
    // Result is in 1..10. Returns std::nullopt if the body holds a non-digit.
    static std::optional<int> weighted_mod10_check(const std::string& body);

    // Length and prefix gate only, no checksum
    static bool passes_gate(const Mod10Scheme& scheme, const std::string& number);

private:
    static bool weighted_mod10(const Mod10Scheme& scheme, const std::string& raw);
};
