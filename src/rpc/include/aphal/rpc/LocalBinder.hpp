// /////////////////////////////////////////////////////////////////////////////
/// @file LocalBinder.hpp
/// @brief In-process binder used for services hosted in the same process.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/rpc/IBinder.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <memory>
#include <string>

namespace aphal::rpc {

// /////////////////////////////////////////////////////////////////////////////
/// @class LocalBinder
/// @brief IBinder implementation whose "remote" lives in this process.
///
/// @ref kill plays the role of the peer process exiting: it marks the
/// binder dead and delivers every pending death notification exactly once,
/// on the thread that called @c kill.
// /////////////////////////////////////////////////////////////////////////////
class LocalBinder final : public IBinder,
                          public core::NonCopyable<LocalBinder>
{
public:
    explicit LocalBinder(std::string descriptor);
    ~LocalBinder() override;

    [[nodiscard]] bool isAlive() const noexcept override;

    [[nodiscard]] core::Expected<void> linkToDeath(
        std::weak_ptr<DeathRecipient> recipient, core::u64 cookie) override;

    bool unlinkToDeath(const DeathRecipient* recipient) override;

    [[nodiscard]] std::string_view descriptor() const noexcept override;

    /// @brief Simulates the peer going away.  Idempotent.
    void kill();

    /// @brief Number of live death registrations.
    [[nodiscard]] core::usize linkCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aphal::rpc
