// /////////////////////////////////////////////////////////////////////////////
/// @file ApParams.cpp
/// @brief SoftApConfig -> hostapd parameter translation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hostapd/ApParams.hpp>
#include <aphal/core/Log.hpp>

#include <charconv>

namespace aphal::hostapd {

namespace {

constexpr std::string_view kTag = "ApParams";

std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

std::optional<core::u32> parseUnsigned(std::string_view s) noexcept
{
    s = trim(s);
    core::u32 value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return value;
}

} // namespace

// -------------------------------------------------------------------------- //
//  Channels                                                                  //
// -------------------------------------------------------------------------- //

std::vector<Range> parseChannelList(std::string_view list)
{
    std::vector<Range> ranges;

    while (!list.empty())
    {
        const auto comma = list.find(',');
        const auto item  = trim(list.substr(0, comma));
        list = (comma == std::string_view::npos) ? std::string_view{} : list.substr(comma + 1);

        if (item.empty())
            continue;

        const auto dash = item.find('-');
        if (dash == std::string_view::npos)
        {
            const auto channel = parseUnsigned(item);
            if (!channel)
            {
                core::Log::error(kTag, "Malformed channel value: " + std::string{item});
                continue;
            }
            ranges.push_back(Range{*channel, *channel});
            continue;
        }

        if (item.find('-', dash + 1) != std::string_view::npos)
        {
            core::Log::error(kTag, "Unrecognized channel range: " + std::string{item});
            continue;
        }

        const auto start = parseUnsigned(item.substr(0, dash));
        const auto end   = parseUnsigned(item.substr(dash + 1));
        if (!start || !end)
        {
            core::Log::error(kTag, "Malformed channel range: " + std::string{item});
            continue;
        }
        if (*start > *end)
        {
            core::Log::error(kTag, "Invalid channel range, from " + std::to_string(*start)
                                   + " to " + std::to_string(*end));
            continue;
        }
        ranges.push_back(Range{*start, *end});
    }

    return ranges;
}

std::optional<core::u32> channelToFrequencyMhz(core::u32 channel, BandMask band) noexcept
{
    switch (band)
    {
        case kBand2Ghz:
            if (channel == 14)
                return 2484;
            if (channel >= 1 && channel <= 13)
                return 2407 + 5 * channel;
            return std::nullopt;
        case kBand5Ghz:
            if (channel >= 32 && channel <= 177)
                return 5000 + 5 * channel;
            return std::nullopt;
        case kBand6Ghz:
            if (channel == 2)
                return 5935;
            if (channel >= 1 && channel <= 233)
                return 5950 + 5 * channel;
            return std::nullopt;
        case kBand60Ghz:
            if (channel >= 1 && channel <= 6)
                return 56160 + 2160 * channel;
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Range> toFrequencyRange(const Range& channels, BandMask band) noexcept
{
    const auto start = channelToFrequencyMhz(channels.start, band);
    const auto end   = channelToFrequencyMhz(channels.end, band);
    if (!start || !end)
        return std::nullopt;
    return Range{*start, *end};
}

std::vector<Range> acsFrequencyRanges(core::u32 bandMask, const HalConfig& config)
{
    std::vector<Range> out;

    const auto append = [&out](std::string_view list, BandMask band) {
        for (const auto& channels : parseChannelList(list))
        {
            if (auto mhz = toFrequencyRange(channels, band))
                out.push_back(*mhz);
            else
                core::Log::warn(kTag, "Channel range " + std::to_string(channels.start) + "-"
                                      + std::to_string(channels.end) + " outside band, skipped");
        }
    };

    if (bandMask & kBand2Ghz)
        append(config.acsChannels2g(), kBand2Ghz);
    if (bandMask & kBand5Ghz)
        append(config.acsChannels5g(), kBand5Ghz);
    if (bandMask & kBand6Ghz)
        out.push_back(Range{5945, 7105});

    return out;
}

// -------------------------------------------------------------------------- //
//  Security                                                                  //
// -------------------------------------------------------------------------- //

core::Expected<EncryptionType> toEncryptionType(SecurityType type)
{
    switch (type)
    {
        case SecurityType::kOpen:              return EncryptionType::kNone;
        case SecurityType::kWpa2Psk:           return EncryptionType::kWpa2;
        case SecurityType::kWpa3SaeTransition: return EncryptionType::kWpa3SaeTransition;
        case SecurityType::kWpa3Sae:           return EncryptionType::kWpa3Sae;
        case SecurityType::kOweTransition:     return EncryptionType::kOweTransition;
        case SecurityType::kOwe:               return EncryptionType::kOwe;
    }
    return core::makeError(core::ErrorCode::kInvalidArgument, "unknown security type");
}

// -------------------------------------------------------------------------- //
//  Parameter bundles                                                         //
// -------------------------------------------------------------------------- //

core::Expected<IfaceParams> prepareIfaceParams(
    std::string_view ifaceName, const SoftApConfig& config, const HalConfig& halConfig)
{
    constexpr core::u32 kKnownBands = kBand2Ghz | kBand5Ghz | kBand6Ghz | kBand60Ghz;
    if ((config.bandMask & kKnownBands) == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Unrecognized apBand: " + std::to_string(config.bandMask));
    }

    IfaceParams params;
    params.name = std::string{ifaceName};

    auto& hw = params.hwModeParams;
    hw.enable80211N                 = true;
    hw.enable80211AC                = (config.bandMask & (kBand5Ghz | kBand6Ghz)) != 0;
    hw.enable80211AX                = halConfig.ieee80211axSupported();
    hw.enable6GhzBand               = halConfig.band6GhzSupported();
    hw.enableHeSingleUserBeamformer = halConfig.heSuBeamformerSupported();
    hw.enableHeSingleUserBeamformee = halConfig.heSuBeamformeeSupported();
    hw.enableHeMultiUserBeamformer  = halConfig.heMuBeamformerSupported();
    hw.enableHeTargetWakeTime       = halConfig.heTwtSupported();
    hw.maximumChannelBandwidth      = config.maxChannelBandwidth;

    ChannelParams channel;
    channel.bandMask  = config.bandMask & kKnownBands;
    channel.channel   = config.channel;
    channel.enableAcs = (config.channel == 0);

    if (channel.enableAcs)
    {
        channel.acsShouldExcludeDfs     = halConfig.acsExcludeDfs();
        channel.acsChannelFreqRangesMhz = acsFrequencyRanges(channel.bandMask, halConfig);
    }
    else
    {
        bool valid = false;
        for (BandMask band : {kBand2Ghz, kBand5Ghz, kBand6Ghz, kBand60Ghz})
        {
            if ((channel.bandMask & band) && channelToFrequencyMhz(config.channel, band))
                valid = true;
        }
        if (!valid)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "channel " + std::to_string(config.channel)
                                   + " not in band mask " + std::to_string(config.bandMask));
        }
    }

    params.channelParams.push_back(std::move(channel));
    return params;
}

core::Expected<NetworkParams> prepareNetworkParams(const SoftApConfig& config, bool isMetered)
{
    if (config.ssid.empty() || config.ssid.size() > 32)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "SSID must be 1..32 bytes");
    }

    NetworkParams params;
    params.ssid.assign(config.ssid.begin(), config.ssid.end());
    params.isHidden       = config.hidden;
    params.encryptionType = APHAL_TRY(toEncryptionType(config.securityType));
    params.isMetered      = isMetered;
    params.vendorElements = config.vendorElements;

    const bool needsPassphrase = params.encryptionType == EncryptionType::kWpa2
        || params.encryptionType == EncryptionType::kWpa3Sae
        || params.encryptionType == EncryptionType::kWpa3SaeTransition;

    if (needsPassphrase)
    {
        if (config.passphrase.empty())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::string{"passphrase required for "}
                                   + std::string{toString(config.securityType)});
        }
        params.passphrase = config.passphrase;
    }

    return params;
}

} // namespace aphal::hostapd
