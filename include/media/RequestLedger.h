#ifndef HOLDPLAY_MEDIA_REQUESTLEDGER_H
#define HOLDPLAY_MEDIA_REQUESTLEDGER_H

#include <array>
#include <cstddef>
#include "media/SourceHandle.h"

namespace HoldPlay::Media {

enum class RequestKind {
    Transport, // play / pause
    Seek
};

/**
 * @brief Pending-request markers for engine commands
 *
 * Policy is "last request wins": issuing a request of a kind supersedes the
 * pending one of the same kind, and a late result for a superseded id is
 * reported as stale so the caller can ignore it.
 */
class RequestLedger
{
public:
    [[nodiscard]] RequestId issue(RequestKind kind) noexcept;

    // True when id is the latest outstanding request of any kind.
    [[nodiscard]] bool isPending(RequestId id) const noexcept;
    [[nodiscard]] bool isPending(RequestKind kind, RequestId id) const noexcept;
    [[nodiscard]] bool hasPending(RequestKind kind) const noexcept;

    // Marks the pending request of a kind as answered.
    void settle(RequestKind kind) noexcept;
    void settle(RequestId id) noexcept;
    void clear() noexcept;

private:
    static constexpr std::size_t KindCount = 2;
    [[nodiscard]] static std::size_t index(RequestKind kind) noexcept { return static_cast<std::size_t>(kind); }

    RequestId m_nextId{1};
    std::array<RequestId, KindCount> m_pending{};
};

} // namespace HoldPlay::Media

#endif // HOLDPLAY_MEDIA_REQUESTLEDGER_H
