// /////////////////////////////////////////////////////////////////////////////
/// @file HalConfig.hpp
/// @brief HAL configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Holds the device capability flags that shape the parameters sent to
/// hostapd.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <string>

namespace aphal::hostapd {

/// @brief Immutable HAL configuration.
class HalConfig
{
public:
    /// @brief Fluent builder for HalConfig.
    class Builder
    {
    public:
        /// @param channels Channel list, e.g. "1-6,11".
        Builder& acsChannels2g(std::string channels);
        Builder& acsChannels5g(std::string channels);
        Builder& acsExcludeDfs(bool enabled) noexcept;
        Builder& ieee80211axSupported(bool enabled) noexcept;
        Builder& band6GhzSupported(bool enabled) noexcept;
        Builder& heSuBeamformerSupported(bool enabled) noexcept;
        Builder& heSuBeamformeeSupported(bool enabled) noexcept;
        Builder& heMuBeamformerSupported(bool enabled) noexcept;
        Builder& heTwtSupported(bool enabled) noexcept;
        Builder& vendorOcvSupported(bool enabled) noexcept;
        Builder& vendorBeaconProtectionSupported(bool enabled) noexcept;
        Builder& bridgeIfaceName(std::string name);

        [[nodiscard]] HalConfig build() const;

    private:
        std::string acsChannels2g_{"1-11"};
        std::string acsChannels5g_{"36-48,149-165"};
        bool acsExcludeDfs_{false};
        bool ieee80211ax_{false};
        bool band6Ghz_{false};
        bool heSuBeamformer_{false};
        bool heSuBeamformee_{false};
        bool heMuBeamformer_{false};
        bool heTwt_{false};
        bool vendorOcv_{false};
        bool vendorBeaconProtection_{false};
        std::string bridgeIfaceName_;
    };

    [[nodiscard]] const std::string& acsChannels2g() const noexcept { return acsChannels2g_; }
    [[nodiscard]] const std::string& acsChannels5g() const noexcept { return acsChannels5g_; }
    [[nodiscard]] bool acsExcludeDfs()                    const noexcept { return acsExcludeDfs_; }
    [[nodiscard]] bool ieee80211axSupported()             const noexcept { return ieee80211ax_; }
    [[nodiscard]] bool band6GhzSupported()                const noexcept { return band6Ghz_; }
    [[nodiscard]] bool heSuBeamformerSupported()          const noexcept { return heSuBeamformer_; }
    [[nodiscard]] bool heSuBeamformeeSupported()          const noexcept { return heSuBeamformee_; }
    [[nodiscard]] bool heMuBeamformerSupported()          const noexcept { return heMuBeamformer_; }
    [[nodiscard]] bool heTwtSupported()                   const noexcept { return heTwt_; }
    [[nodiscard]] bool vendorOcvSupported()               const noexcept { return vendorOcv_; }
    [[nodiscard]] bool vendorBeaconProtectionSupported()  const noexcept { return vendorBeaconProtection_; }
    [[nodiscard]] const std::string& bridgeIfaceName()    const noexcept { return bridgeIfaceName_; }

private:
    friend class Builder;

    std::string acsChannels2g_{"1-11"};
    std::string acsChannels5g_{"36-48,149-165"};
    bool acsExcludeDfs_{false};
    bool ieee80211ax_{false};
    bool band6Ghz_{false};
    bool heSuBeamformer_{false};
    bool heSuBeamformee_{false};
    bool heMuBeamformer_{false};
    bool heTwt_{false};
    bool vendorOcv_{false};
    bool vendorBeaconProtection_{false};
    std::string bridgeIfaceName_;
};

} // namespace aphal::hostapd
