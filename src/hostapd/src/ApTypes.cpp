// /////////////////////////////////////////////////////////////////////////////
/// @file ApTypes.cpp
/// @brief MacAddress parsing and enum helpers.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hostapd/ApTypes.hpp>

#include <algorithm>
#include <charconv>
#include <cstdio>

namespace aphal::hostapd {

core::Expected<MacAddress> MacAddress::fromString(std::string_view text)
{
    // "aa:bb:cc:dd:ee:ff"
    if (text.size() != 17)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "malformed MAC address: " + std::string{text});
    }

    Bytes bytes{};
    for (core::usize i = 0; i < bytes.size(); ++i)
    {
        const auto offset = i * 3;
        if (i > 0 && text[offset - 1] != ':')
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "malformed MAC address: " + std::string{text});
        }

        const char* first = text.data() + offset;
        const char* last  = first + 2;
        core::u32 value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value, 16);
        if (ec != std::errc{} || ptr != last)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "malformed MAC address: " + std::string{text});
        }
        bytes[i] = static_cast<core::u8>(value);
    }
    return MacAddress{bytes};
}

std::string MacAddress::toString() const
{
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
    return std::string{buf};
}

bool MacAddress::isZero() const noexcept
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](core::u8 b) { return b == 0; });
}

Ieee80211ReasonCode toIeee80211ReasonCode(DisconnectReason reason) noexcept
{
    switch (reason)
    {
        case DisconnectReason::kBlockedByUser: return Ieee80211ReasonCode::kPrevAuthNotValid;
        case DisconnectReason::kNoMoreStas:    return Ieee80211ReasonCode::kDisassocApBusy;
        case DisconnectReason::kUnspecified:   break;
    }
    return Ieee80211ReasonCode::kUnspecified;
}

std::string_view toString(SecurityType type) noexcept
{
    switch (type)
    {
        case SecurityType::kOpen:              return "OPEN";
        case SecurityType::kWpa2Psk:           return "WPA2_PSK";
        case SecurityType::kWpa3SaeTransition: return "WPA3_SAE_TRANSITION";
        case SecurityType::kWpa3Sae:           return "WPA3_SAE";
        case SecurityType::kOweTransition:     return "OWE_TRANSITION";
        case SecurityType::kOwe:               return "OWE";
    }
    return "UNKNOWN";
}

std::string_view toString(EncryptionType type) noexcept
{
    switch (type)
    {
        case EncryptionType::kNone:              return "NONE";
        case EncryptionType::kWpa:               return "WPA";
        case EncryptionType::kWpa2:              return "WPA2";
        case EncryptionType::kWpa3SaeTransition: return "WPA3_SAE_TRANSITION";
        case EncryptionType::kWpa3Sae:           return "WPA3_SAE";
        case EncryptionType::kOweTransition:     return "OWE_TRANSITION";
        case EncryptionType::kOwe:               return "OWE";
    }
    return "UNKNOWN";
}

} // namespace aphal::hostapd
