#ifndef HOLDPLAY_MEDIA_MEDIARESOURCEMANAGER_H
#define HOLDPLAY_MEDIA_MEDIARESOURCEMANAGER_H

#include <QFile>
#include <QObject>
#include <QString>
#include <map>
#include <memory>
#include "media/SourceHandle.h"

namespace HoldPlay::Core { class PlaybackState; }

namespace HoldPlay::Media {

/**
 * @brief Owns the platform resources behind source handles
 *
 * Each live handle keeps its file open until release(). replace() is the only
 * way a handle reaches PlaybackState.source.
 */
class MediaResourceManager : public QObject
{
    Q_OBJECT

public:
    explicit MediaResourceManager(Core::PlaybackState& state, QObject* parent = nullptr);
    ~MediaResourceManager() override;

    MediaResourceManager(const MediaResourceManager&) = delete;
    MediaResourceManager& operator=(const MediaResourceManager&) = delete;

    // Throws Core::ResourceError when the file cannot be opened.
    [[nodiscard]] SourceHandle openFile(const QString& filePath);

    // No-op for null or already released handles.
    void release(const SourceHandle& handle);

    // Installs next (possibly null) into the session state, then releases the
    // handle it displaced.
    void replace(const SourceHandle& next);

    void releaseAll();

    [[nodiscard]] bool isLive(const SourceHandle& handle) const;
    [[nodiscard]] std::size_t liveHandleCount() const noexcept { return m_live.size(); }

signals:
    void handleReleased(const HoldPlay::Media::SourceHandle& handle);

private:
    Core::PlaybackState& m_state;
    std::map<SourceId, std::unique_ptr<QFile>> m_live;
    SourceId m_nextId{1};
};

} // namespace HoldPlay::Media

#endif // HOLDPLAY_MEDIA_MEDIARESOURCEMANAGER_H
