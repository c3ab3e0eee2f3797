// /////////////////////////////////////////////////////////////////////////////
/// @file ApTypes.hpp
/// @brief Value types exchanged between the HAL facade and hostapd.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/core/Types.hpp>
#include <aphal/core/Expected.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace aphal::hostapd {

// /////////////////////////////////////////////////////////////////////////////
/// @class MacAddress
/// @brief 48-bit IEEE 802 MAC address.
// /////////////////////////////////////////////////////////////////////////////
class MacAddress
{
public:
    using Bytes = std::array<core::u8, 6>;

    constexpr MacAddress() noexcept = default;
    constexpr explicit MacAddress(const Bytes& bytes) noexcept : bytes_{bytes} {}

    /// @brief Parses "aa:bb:cc:dd:ee:ff" (case-insensitive).
    [[nodiscard]] static core::Expected<MacAddress> fromString(std::string_view text);

    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }
    [[nodiscard]] std::string  toString() const;
    [[nodiscard]] bool         isZero() const noexcept;

    friend constexpr bool operator==(const MacAddress&, const MacAddress&) = default;

private:
    Bytes bytes_{};
};

// -------------------------------------------------------------------------- //
//  Bands & security                                                          //
// -------------------------------------------------------------------------- //

/// @brief Band bit mask, combinable with operator|.
enum BandMask : core::u32 {
    kBand2Ghz  = 1u << 0,
    kBand5Ghz  = 1u << 1,
    kBand6Ghz  = 1u << 2,
    kBand60Ghz = 1u << 3,
};

enum class SecurityType : core::u8 {
    kOpen,
    kWpa2Psk,
    kWpa3SaeTransition,
    kWpa3Sae,
    kOweTransition,
    kOwe,
};

enum class EncryptionType : core::u8 {
    kNone,
    kWpa,
    kWpa2,
    kWpa3SaeTransition,
    kWpa3Sae,
    kOweTransition,
    kOwe,
};

enum class ChannelBandwidth : core::u8 {
    kAuto,
    k20Mhz,
    k40Mhz,
    k80Mhz,
    k160Mhz,
    k320Mhz,
};

// -------------------------------------------------------------------------- //
//  Framework-side configuration                                              //
// -------------------------------------------------------------------------- //

/// @brief What the caller wants the access point to look like.
struct SoftApConfig
{
    std::string                ssid;
    std::string                passphrase;
    SecurityType               securityType{SecurityType::kOpen};
    core::u32                  bandMask{kBand2Ghz};
    /// 0 selects automatic channel selection (ACS).
    core::u32                  channel{0};
    bool                       hidden{false};
    ChannelBandwidth           maxChannelBandwidth{ChannelBandwidth::kAuto};
    std::string                oweTransIfaceName;
    std::vector<core::u8>      vendorElements;
};

// -------------------------------------------------------------------------- //
//  hostapd-side parameters                                                   //
// -------------------------------------------------------------------------- //

/// @brief Inclusive range, either channel numbers or MHz depending on use.
struct Range
{
    core::u32 start{0};
    core::u32 end{0};

    friend bool operator==(const Range&, const Range&) = default;
};

struct HwModeParams
{
    bool             enable80211N{true};
    bool             enable80211AC{false};
    bool             enable80211AX{false};
    bool             enable6GhzBand{false};
    bool             enableHeSingleUserBeamformer{false};
    bool             enableHeSingleUserBeamformee{false};
    bool             enableHeMultiUserBeamformer{false};
    bool             enableHeTargetWakeTime{false};
    ChannelBandwidth maximumChannelBandwidth{ChannelBandwidth::kAuto};
};

struct ChannelParams
{
    core::u32          bandMask{0};
    core::u32          channel{0};
    bool               enableAcs{false};
    bool               acsShouldExcludeDfs{false};
    std::vector<Range> acsChannelFreqRangesMhz;
};

struct IfaceParams
{
    std::string                name;
    HwModeParams               hwModeParams;
    std::vector<ChannelParams> channelParams;
};

struct NetworkParams
{
    std::vector<core::u8> ssid;
    bool                  isHidden{false};
    EncryptionType        encryptionType{EncryptionType::kNone};
    std::string           passphrase;
    bool                  isMetered{false};
    std::vector<core::u8> vendorElements;
};

// -------------------------------------------------------------------------- //
//  Events                                                                    //
// -------------------------------------------------------------------------- //

/// @brief Snapshot of one running AP instance.
struct ApInfo
{
    std::string      ifaceName;
    std::string      apIfaceInstance;
    core::u32        freqMhz{0};
    ChannelBandwidth channelBandwidth{ChannelBandwidth::kAuto};
    core::u32        generation{0};
    MacAddress       apIfaceInstanceMacAddress;
};

struct ClientInfo
{
    std::string ifaceName;
    std::string apIfaceInstance;
    MacAddress  clientAddress;
    bool        isConnected{false};
};

// -------------------------------------------------------------------------- //
//  Client disconnect reasons                                                 //
// -------------------------------------------------------------------------- //

/// @brief Reasons a caller may give for kicking a client.
enum class DisconnectReason : core::i32 {
    kUnspecified = 0,
    kBlockedByUser,
    kNoMoreStas,
};

/// @brief IEEE 802.11 reason codes understood by hostapd.
enum class Ieee80211ReasonCode : core::u16 {
    kUnspecified       = 1,
    kPrevAuthNotValid  = 2,
    kDisassocApBusy    = 5,
};

/// @brief Maps a framework reason onto the wire reason code.
[[nodiscard]] Ieee80211ReasonCode toIeee80211ReasonCode(DisconnectReason reason) noexcept;

[[nodiscard]] std::string_view toString(SecurityType type) noexcept;
[[nodiscard]] std::string_view toString(EncryptionType type) noexcept;

} // namespace aphal::hostapd
