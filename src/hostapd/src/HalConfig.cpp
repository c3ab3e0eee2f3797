// /////////////////////////////////////////////////////////////////////////////
/// @file HalConfig.cpp
/// @brief HalConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hostapd/HalConfig.hpp>

namespace aphal::hostapd {

HalConfig::Builder& HalConfig::Builder::acsChannels2g(std::string channels)
{
    acsChannels2g_ = std::move(channels);
    return *this;
}

HalConfig::Builder& HalConfig::Builder::acsChannels5g(std::string channels)
{
    acsChannels5g_ = std::move(channels);
    return *this;
}

HalConfig::Builder& HalConfig::Builder::acsExcludeDfs(bool enabled) noexcept
{
    acsExcludeDfs_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::ieee80211axSupported(bool enabled) noexcept
{
    ieee80211ax_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::band6GhzSupported(bool enabled) noexcept
{
    band6Ghz_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::heSuBeamformerSupported(bool enabled) noexcept
{
    heSuBeamformer_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::heSuBeamformeeSupported(bool enabled) noexcept
{
    heSuBeamformee_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::heMuBeamformerSupported(bool enabled) noexcept
{
    heMuBeamformer_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::heTwtSupported(bool enabled) noexcept
{
    heTwt_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::vendorOcvSupported(bool enabled) noexcept
{
    vendorOcv_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::vendorBeaconProtectionSupported(bool enabled) noexcept
{
    vendorBeaconProtection_ = enabled;
    return *this;
}

HalConfig::Builder& HalConfig::Builder::bridgeIfaceName(std::string name)
{
    bridgeIfaceName_ = std::move(name);
    return *this;
}

HalConfig HalConfig::Builder::build() const
{
    HalConfig cfg;
    cfg.acsChannels2g_          = acsChannels2g_;
    cfg.acsChannels5g_          = acsChannels5g_;
    cfg.acsExcludeDfs_          = acsExcludeDfs_;
    cfg.ieee80211ax_            = ieee80211ax_;
    cfg.band6Ghz_               = band6Ghz_;
    cfg.heSuBeamformer_         = heSuBeamformer_;
    cfg.heSuBeamformee_         = heSuBeamformee_;
    cfg.heMuBeamformer_         = heMuBeamformer_;
    cfg.heTwt_                  = heTwt_;
    cfg.vendorOcv_              = vendorOcv_;
    cfg.vendorBeaconProtection_ = vendorBeaconProtection_;
    cfg.bridgeIfaceName_        = bridgeIfaceName_;
    return cfg;
}

} // namespace aphal::hostapd
