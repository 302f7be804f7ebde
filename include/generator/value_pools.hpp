#pragma once

#include <array>
#include <string_view>

namespace seedgen::pools {

// ============================================================================
// Locations (city/state/country/timezone kept consistent within a row)
// ============================================================================

struct LocationSeed {
    std::string_view city;
    std::string_view state;
    std::string_view country;
    std::string_view postal_prefix;
    std::string_view timezone;
};

inline constexpr std::array<LocationSeed, 13> kLocations = {{
    {"Boston", "MA", "US", "02", "America/New_York"},
    {"New York", "NY", "US", "10", "America/New_York"},
    {"Chicago", "IL", "US", "60", "America/Chicago"},
    {"Austin", "TX", "US", "78", "America/Chicago"},
    {"Denver", "CO", "US", "80", "America/Denver"},
    {"Seattle", "WA", "US", "98", "America/Los_Angeles"},
    {"San Francisco", "CA", "US", "94", "America/Los_Angeles"},
    {"San Jose", "CA", "US", "95", "America/Los_Angeles"},
    {"Miami", "FL", "US", "33", "America/New_York"},
    {"Bengaluru", "KA", "IN", "560", "Asia/Kolkata"},
    {"Hyderabad", "TS", "IN", "500", "Asia/Kolkata"},
    {"Mumbai", "MH", "IN", "400", "Asia/Kolkata"},
    {"Chennai", "TN", "IN", "600", "Asia/Kolkata"},
}};

inline constexpr std::array<std::string_view, 16> kStreetNames = {
    "Maple Avenue", "Oak Street", "Pine Road", "Cedar Lane",
    "Elm Street", "Lakeview Drive", "Harbor Way", "Sunset Boulevard",
    "Park Avenue", "Hill Road", "River Street", "Church Lane",
    "MG Road", "Residency Road", "Brigade Road", "Station Road",
};

// ============================================================================
// Hospitality vocabulary
// ============================================================================

inline constexpr std::array<std::string_view, 10> kHotelBrands = {
    "Marriott", "Hilton", "Hyatt", "Westin", "Sheraton",
    "Ibis", "Novotel", "Taj", "Oberoi", "Radisson",
};

inline constexpr std::array<std::string_view, 4> kHotelSuffixes = {
    "Hotel", "Resort", "Suites", "Inn",
};

inline constexpr std::array<std::string_view, 8> kRoomTypeNames = {
    "Standard King", "Standard Queen", "Deluxe King", "Deluxe Queen",
    "Studio", "Junior Suite", "Executive Suite", "Family Suite",
};

inline constexpr std::array<std::string_view, 2> kCurrencies = {"USD", "INR"};

// ============================================================================
// Filler text
// ============================================================================

inline constexpr std::array<std::string_view, 48> kWords = {
    "quiet", "harbor", "garden", "lobby", "balcony", "breakfast",
    "window", "corner", "ocean", "river", "summit", "valley",
    "morning", "evening", "travel", "guest", "suite", "terrace",
    "spa", "pool", "lounge", "service", "comfort", "stay",
    "city", "view", "fresh", "bright", "classic", "modern",
    "family", "business", "weekend", "holiday", "late", "early",
    "clean", "spacious", "friendly", "central", "cozy", "grand",
    "local", "premium", "simple", "direct", "daily", "extra",
};

inline constexpr std::array<std::string_view, 6> kEmailDomains = {
    "example.com", "example.net", "example.org",
    "mail.test", "guests.test", "inbox.test",
};

} // namespace seedgen::pools
