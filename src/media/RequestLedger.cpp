#include "media/RequestLedger.h"
#include <algorithm>

namespace HoldPlay::Media {

RequestId RequestLedger::issue(RequestKind kind) noexcept
{
    const RequestId id = m_nextId++;
    m_pending[index(kind)] = id;
    return id;
}

bool RequestLedger::isPending(RequestId id) const noexcept
{
    if (id == NoRequest) {
        return false;
    }
    return std::find(m_pending.begin(), m_pending.end(), id) != m_pending.end();
}

bool RequestLedger::isPending(RequestKind kind, RequestId id) const noexcept
{
    return id != NoRequest && m_pending[index(kind)] == id;
}

bool RequestLedger::hasPending(RequestKind kind) const noexcept
{
    return m_pending[index(kind)] != NoRequest;
}

void RequestLedger::settle(RequestKind kind) noexcept
{
    m_pending[index(kind)] = NoRequest;
}

void RequestLedger::settle(RequestId id) noexcept
{
    for (RequestId& pending : m_pending) {
        if (pending == id) {
            pending = NoRequest;
        }
    }
}

void RequestLedger::clear() noexcept
{
    m_pending.fill(NoRequest);
}

} // namespace HoldPlay::Media
