#ifndef HOLDPLAY_MEDIA_SOURCEHANDLE_H
#define HOLDPLAY_MEDIA_SOURCEHANDLE_H

#include <QMetaType>
#include <QUrl>
#include <QtGlobal>
#include <utility>

namespace HoldPlay::Media {

using SourceId = quint64;
using RequestId = quint64;

inline constexpr SourceId NullSourceId = 0;
inline constexpr RequestId NoRequest = 0;

/**
 * @brief Opaque reference to a playable local resource
 *
 * Handles are issued and released by MediaResourceManager. The id is unique
 * for the lifetime of the process, so a stale engine notification can be told
 * apart from one that belongs to the current source.
 */
class SourceHandle
{
public:
    SourceHandle() = default;
    SourceHandle(SourceId id, QUrl url) : m_id(id), m_url(std::move(url)) {}

    [[nodiscard]] SourceId id() const noexcept { return m_id; }
    [[nodiscard]] const QUrl& url() const noexcept { return m_url; }
    [[nodiscard]] bool isNull() const noexcept { return m_id == NullSourceId; }

    friend bool operator==(const SourceHandle& a, const SourceHandle& b) noexcept { return a.m_id == b.m_id; }
    friend bool operator!=(const SourceHandle& a, const SourceHandle& b) noexcept { return a.m_id != b.m_id; }

private:
    SourceId m_id{NullSourceId};
    QUrl m_url;
};

} // namespace HoldPlay::Media

Q_DECLARE_METATYPE(HoldPlay::Media::SourceHandle)

#endif // HOLDPLAY_MEDIA_SOURCEHANDLE_H
