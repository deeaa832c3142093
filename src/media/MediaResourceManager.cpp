#include "media/MediaResourceManager.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include "core/PlaybackState.h"
#include <QFileInfo>
#include <QUrl>

namespace HoldPlay::Media {

MediaResourceManager::MediaResourceManager(Core::PlaybackState& state, QObject* parent)
    : QObject(parent)
    , m_state(state)
{
}

MediaResourceManager::~MediaResourceManager()
{
    releaseAll();
}

SourceHandle MediaResourceManager::openFile(const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    if (!fileInfo.exists()) {
        throw Core::ResourceError(QStringLiteral("File does not exist: %1").arg(filePath));
    }
    if (!fileInfo.isFile()) {
        throw Core::ResourceError(QStringLiteral("Not a regular file: %1").arg(filePath));
    }

    auto file = std::make_unique<QFile>(fileInfo.absoluteFilePath());
    if (!file->open(QIODevice::ReadOnly)) {
        throw Core::ResourceError(QStringLiteral("Cannot open %1: %2").arg(filePath, file->errorString()));
    }

    const SourceHandle handle(m_nextId++, QUrl::fromLocalFile(fileInfo.absoluteFilePath()));
    m_live.emplace(handle.id(), std::move(file));

    qCDebug(lcMedia) << "Opened source" << handle.id() << fileInfo.absoluteFilePath();
    return handle;
}

void MediaResourceManager::release(const SourceHandle& handle)
{
    if (handle.isNull()) {
        return;
    }

    const auto it = m_live.find(handle.id());
    if (it == m_live.end()) {
        return;
    }

    // The session must never hold a released handle.
    if (m_state.source() == handle) {
        m_state.installSource(SourceHandle());
    }

    it->second->close();
    m_live.erase(it);

    qCDebug(lcMedia) << "Released source" << handle.id();
    emit handleReleased(handle);
}

void MediaResourceManager::replace(const SourceHandle& next)
{
    const SourceHandle previous = m_state.source();
    if (previous == next) {
        return;
    }

    m_state.installSource(next);
    release(previous);
}

void MediaResourceManager::releaseAll()
{
    if (m_state.hasSource()) {
        m_state.installSource(SourceHandle());
    }

    while (!m_live.empty()) {
        const SourceId id = m_live.begin()->first;
        const QUrl url = QUrl::fromLocalFile(m_live.begin()->second->fileName());
        release(SourceHandle(id, url));
    }
}

bool MediaResourceManager::isLive(const SourceHandle& handle) const
{
    return !handle.isNull() && m_live.count(handle.id()) > 0;
}

} // namespace HoldPlay::Media
