#include "FakeFullscreenPlatform.h"

namespace HoldPlay::Test {

FakeFullscreenPlatform::FakeFullscreenPlatform(QObject* parent)
    : UI::IFullscreenPlatform(parent)
{
}

bool FakeFullscreenPlatform::requestEnter()
{
    ++m_enterRequests;
    if (m_refuse) {
        return false;
    }
    if (!m_deferred) {
        notify(true);
    }
    return true;
}

bool FakeFullscreenPlatform::requestExit()
{
    ++m_exitRequests;
    if (m_refuse) {
        return false;
    }
    if (!m_deferred) {
        notify(false);
    }
    return true;
}

void FakeFullscreenPlatform::notify(bool fullscreen)
{
    m_fullscreen = fullscreen;
    emit fullscreenChanged(fullscreen);
}

} // namespace HoldPlay::Test
