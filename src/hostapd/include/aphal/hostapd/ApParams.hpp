// /////////////////////////////////////////////////////////////////////////////
/// @file ApParams.hpp
/// @brief Translation of a SoftApConfig into hostapd parameters.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/ApTypes.hpp>
#include <aphal/hostapd/HalConfig.hpp>
#include <aphal/core/Expected.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace aphal::hostapd {

/// @brief Parses a channel list such as "1-6, 11".
///
/// Malformed items and reversed ranges are logged and skipped; they never
/// fail the whole list.
[[nodiscard]] std::vector<Range> parseChannelList(std::string_view list);

/// @brief Centre frequency of @p channel in @p band, or nullopt when the
///        channel does not exist in that band.
[[nodiscard]] std::optional<core::u32> channelToFrequencyMhz(core::u32 channel, BandMask band) noexcept;

/// @brief Converts a channel range into a MHz range (nullopt if invalid).
[[nodiscard]] std::optional<Range> toFrequencyRange(const Range& channels, BandMask band) noexcept;

/// @brief Security type -> hostapd encryption type.
[[nodiscard]] core::Expected<EncryptionType> toEncryptionType(SecurityType type);

/// @brief ACS frequency ranges for every band selected in @p bandMask.
[[nodiscard]] std::vector<Range> acsFrequencyRanges(core::u32 bandMask, const HalConfig& config);

/// @brief Builds the interface parameters for @p ifaceName.
/// @return kInvalidArgument when the band mask is empty or the fixed
///         channel does not exist in any selected band.
[[nodiscard]] core::Expected<IfaceParams> prepareIfaceParams(
    std::string_view ifaceName, const SoftApConfig& config, const HalConfig& halConfig);

/// @brief Builds the network parameters.
[[nodiscard]] core::Expected<NetworkParams> prepareNetworkParams(
    const SoftApConfig& config, bool isMetered);

} // namespace aphal::hostapd
