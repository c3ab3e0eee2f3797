// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectedFreqCache.cpp
/// @brief ConnectedFreqCache implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/wifi/ConnectedFreqCache.hpp>
#include <aphal/core/Log.hpp>

#include <chrono>

namespace aphal::wifi {

namespace {

constexpr const char* kTag = "FreqCache";

} // namespace

core::i64 SystemClock::nowMillis() const
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

ConnectedFreqCache::ConnectedFreqCache(std::shared_ptr<const IClock> clock,
                                       core::u32 maxChannelsPerNetwork)
    : clock_{std::move(clock)}
    , maxChannels_{maxChannelsPerNetwork}
{
    if (!clock_)
    {
        clock_ = std::make_shared<SystemClock>();
    }
}

void ConnectedFreqCache::enableVerboseLogging(bool verbose)
{
    std::lock_guard<std::mutex> lock{mutex_};
    verbose_ = verbose;
}

void ConnectedFreqCache::trim(const std::string& networkId, FrequencyMap& freqs)
{
    while (freqs.size() > maxChannels_)
    {
        auto oldest = freqs.begin();
        for (auto it = freqs.begin(); it != freqs.end(); ++it)
        {
            if (it->second < oldest->second)
                oldest = it;
        }
        if (verbose_)
        {
            core::Log::debug(kTag, networkId + ": evict " + std::to_string(oldest->first)
                                   + " last seen " + std::to_string(oldest->second));
        }
        freqs.erase(oldest);
    }
}

void ConnectedFreqCache::record(std::string_view networkId, core::i32 frequency)
{
    if (networkId.empty())
    {
        return;
    }

    const core::i64 now = clock_->nowMillis();
    std::lock_guard<std::mutex> lock{mutex_};
    std::string key{networkId};
    auto& freqs = networks_[key];
    freqs.insert_or_assign(frequency, now);
    trim(key, freqs);
}

std::optional<std::vector<core::i32>> ConnectedFreqCache::frequenciesSeenWithin(
    std::string_view networkId, core::i64 maxAgeMillis)
{
    const core::i64 now = clock_->nowMillis();
    std::lock_guard<std::mutex> lock{mutex_};

    auto network = networks_.find(std::string{networkId});
    if (network == networks_.end())
    {
        return std::nullopt;
    }

    std::vector<core::i32> result;
    auto& freqs = network->second;
    for (auto it = freqs.begin(); it != freqs.end();)
    {
        if (now - it->second > maxAgeMillis)
        {
            if (verbose_)
            {
                core::Log::debug(kTag, network->first + ": prune " + std::to_string(it->first));
            }
            it = freqs.erase(it);
            continue;
        }
        result.push_back(it->first);
        ++it;
    }
    return result;
}

void ConnectedFreqCache::forget(std::string_view networkId)
{
    if (networkId.empty())
    {
        return;
    }
    std::lock_guard<std::mutex> lock{mutex_};
    networks_.erase(std::string{networkId});
}

ConnectedFreqCache::Snapshot ConnectedFreqCache::snapshot() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return networks_;
}

void ConnectedFreqCache::restore(const Snapshot& data)
{
    std::lock_guard<std::mutex> lock{mutex_};
    for (const auto& [networkId, freqs] : data)
    {
        if (networkId.empty())
        {
            core::Log::warn(kTag, "Skipping restored network with an empty id");
            continue;
        }
        auto& target = networks_[networkId];
        target = freqs;
        trim(networkId, target);
    }
}

core::usize ConnectedFreqCache::networkCount() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return networks_.size();
}

} // namespace aphal::wifi
