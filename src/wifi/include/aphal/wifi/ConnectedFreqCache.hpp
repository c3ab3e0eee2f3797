// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectedFreqCache.hpp
/// @brief Per-network history of the frequencies of past connections.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/core/Types.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace aphal::wifi {

// /////////////////////////////////////////////////////////////////////////////
/// @class IClock
/// @brief Wall-clock source in milliseconds.
// /////////////////////////////////////////////////////////////////////////////
class IClock
{
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual core::i64 nowMillis() const = 0;
};

/// @brief IClock over std::chrono::system_clock.
class SystemClock final : public IClock
{
public:
    [[nodiscard]] core::i64 nowMillis() const override;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ConnectedFreqCache
/// @brief Bounded map network -> (frequency -> last seen).
///
/// At most @c maxChannelsPerNetwork frequencies are kept per network; the
/// least recently seen one is evicted first (lowest frequency on a tie).
/// Entries older than the age passed to @ref frequenciesSeenWithin are
/// pruned by that call.  Thread-safe.
// /////////////////////////////////////////////////////////////////////////////
class ConnectedFreqCache final : public core::NonCopyable<ConnectedFreqCache>
{
public:
    /// @brief frequency (MHz) -> last seen (ms since epoch).
    using FrequencyMap = std::map<core::i32, core::i64>;
    using Snapshot     = std::unordered_map<std::string, FrequencyMap>;

    ConnectedFreqCache(std::shared_ptr<const IClock> clock, core::u32 maxChannelsPerNetwork);

    void enableVerboseLogging(bool verbose);

    /// @brief Stamps @p frequency for @p networkId with the current time.
    ///        An empty id is ignored.
    void record(std::string_view networkId, core::i32 frequency);

    /// @brief Frequencies seen no more than @p maxAgeMillis ago, ascending.
    /// @return nullopt when @p networkId is unknown.
    [[nodiscard]] std::optional<std::vector<core::i32>> frequenciesSeenWithin(
        std::string_view networkId, core::i64 maxAgeMillis);

    void forget(std::string_view networkId);

    /// @brief Full copy of the history, for a persistence layer.
    [[nodiscard]] Snapshot snapshot() const;

    /// @brief Replaces the networks present in @p data, enforcing the bound.
    void restore(const Snapshot& data);

    [[nodiscard]] core::usize networkCount() const;
    [[nodiscard]] core::u32   maxChannelsPerNetwork() const noexcept { return maxChannels_; }

private:
    void trim(const std::string& networkId, FrequencyMap& freqs);

    std::shared_ptr<const IClock> clock_;
    const core::u32               maxChannels_;
    bool                          verbose_{false};

    mutable std::mutex                            mutex_;
    std::unordered_map<std::string, FrequencyMap> networks_;
};

} // namespace aphal::wifi
