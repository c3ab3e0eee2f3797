/**
 * @file TestApParams.cpp
 * @brief Unit tests for SoftApConfig to hostapd parameter translation.
 */

#include <catch2/catch_test_macros.hpp>

#include "aphal/hostapd/ApParams.hpp"
#include "aphal/testing/CapturingLogger.hpp"
#include "aphal/testing/FakeServices.hpp"

using namespace aphal;
using namespace aphal::hostapd;

TEST_CASE("parseChannelList accepts singles and ranges", "[hostapd][params]")
{
    auto ranges = parseChannelList("1-6, 11 ,36-48");
    REQUIRE(ranges == std::vector<Range>{{1, 6}, {11, 11}, {36, 48}});
}

TEST_CASE("parseChannelList skips malformed items with an error log", "[hostapd][params]")
{
    testing::CapturingLogger logger;

    auto ranges = parseChannelList("1-3,x,9-4,5-6-7,,12");

    REQUIRE(ranges == std::vector<Range>{{1, 3}, {12, 12}});
    REQUIRE(logger.contains(core::LogLevel::kError, "Malformed channel value: x"));
    REQUIRE(logger.contains(core::LogLevel::kError, "Invalid channel range, from 9 to 4"));
    REQUIRE(logger.contains(core::LogLevel::kError, "Unrecognized channel range: 5-6-7"));
}

TEST_CASE("channelToFrequencyMhz follows the band plans", "[hostapd][params]")
{
    REQUIRE(channelToFrequencyMhz(1, kBand2Ghz) == 2412u);
    REQUIRE(channelToFrequencyMhz(14, kBand2Ghz) == 2484u);
    REQUIRE_FALSE(channelToFrequencyMhz(15, kBand2Ghz).has_value());
    REQUIRE(channelToFrequencyMhz(36, kBand5Ghz) == 5180u);
    REQUIRE(channelToFrequencyMhz(2, kBand6Ghz) == 5935u);
    REQUIRE(channelToFrequencyMhz(1, kBand6Ghz) == 5955u);
    REQUIRE(channelToFrequencyMhz(2, kBand60Ghz) == 60480u);
}

TEST_CASE("ACS ranges come from the configured channel lists", "[hostapd][params]")
{
    const auto config = HalConfig::Builder{}
        .acsChannels2g("1,6,11")
        .acsChannels5g("36-48")
        .build();

    auto ranges = acsFrequencyRanges(kBand2Ghz | kBand5Ghz, config);
    REQUIRE(ranges == std::vector<Range>{{2412, 2412}, {2437, 2437}, {2462, 2462}, {5180, 5240}});

    auto sixGhz = acsFrequencyRanges(kBand6Ghz, config);
    REQUIRE(sixGhz == std::vector<Range>{{5945, 7105}});
}

TEST_CASE("prepareIfaceParams with a fixed channel", "[hostapd][params]")
{
    const auto halConfig = HalConfig::Builder{}.ieee80211axSupported(true).build();
    auto config = testing::makeSoftApConfig();

    auto params = prepareIfaceParams("wlan1", config, halConfig);
    REQUIRE(params.has_value());
    REQUIRE(params->name == "wlan1");
    REQUIRE(params->hwModeParams.enable80211N);
    REQUIRE_FALSE(params->hwModeParams.enable80211AC);
    REQUIRE(params->hwModeParams.enable80211AX);
    REQUIRE(params->channelParams.size() == 1);
    REQUIRE(params->channelParams[0].channel == 6);
    REQUIRE_FALSE(params->channelParams[0].enableAcs);
    REQUIRE(params->channelParams[0].acsChannelFreqRangesMhz.empty());
}

TEST_CASE("prepareIfaceParams enables ACS for channel zero", "[hostapd][params]")
{
    const auto halConfig = HalConfig::Builder{}.acsExcludeDfs(true).build();
    auto config = testing::makeSoftApConfig();
    config.channel  = 0;
    config.bandMask = kBand5Ghz;

    auto params = prepareIfaceParams("wlan1", config, halConfig);
    REQUIRE(params.has_value());

    const auto& channel = params->channelParams.at(0);
    REQUIRE(channel.enableAcs);
    REQUIRE(channel.acsShouldExcludeDfs);
    REQUIRE(channel.acsChannelFreqRangesMhz
            == std::vector<Range>{{5180, 5240}, {5745, 5825}});
    REQUIRE(params->hwModeParams.enable80211AC);
}

TEST_CASE("prepareIfaceParams rejects bad bands and channels", "[hostapd][params]")
{
    const auto halConfig = HalConfig::Builder{}.build();
    auto config = testing::makeSoftApConfig();

    config.bandMask = 0;
    REQUIRE_FALSE(prepareIfaceParams("wlan1", config, halConfig).has_value());

    config.bandMask = kBand2Ghz;
    config.channel  = 36;
    auto result = prepareIfaceParams("wlan1", config, halConfig);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("prepareNetworkParams validates SSID and passphrase", "[hostapd][params]")
{
    auto config = testing::makeSoftApConfig();

    auto params = prepareNetworkParams(config, true);
    REQUIRE(params.has_value());
    REQUIRE(params->encryptionType == EncryptionType::kWpa2);
    REQUIRE(params->passphrase == "correct-horse");
    REQUIRE(params->isMetered);
    REQUIRE(std::string(params->ssid.begin(), params->ssid.end()) == "aphal-test");

    SECTION("empty passphrase for WPA2")
    {
        config.passphrase.clear();
        REQUIRE_FALSE(prepareNetworkParams(config, false).has_value());
    }
    SECTION("open network drops the passphrase")
    {
        config.securityType = SecurityType::kOpen;
        auto open = prepareNetworkParams(config, false);
        REQUIRE(open.has_value());
        REQUIRE(open->passphrase.empty());
    }
    SECTION("SSID too long")
    {
        config.ssid = std::string(33, 'a');
        REQUIRE_FALSE(prepareNetworkParams(config, false).has_value());
    }
}
