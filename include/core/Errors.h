#ifndef HOLDPLAY_CORE_ERRORS_H
#define HOLDPLAY_CORE_ERRORS_H

#include <QMetaType>
#include <QString>
#include <stdexcept>

namespace HoldPlay::Core {

/**
 * @brief Thrown when a local file cannot be turned into a playable resource
 */
class ResourceError : public std::runtime_error
{
public:
    explicit ResourceError(const QString& message)
        : std::runtime_error(message.toStdString())
        , m_message(message)
    {
    }

    [[nodiscard]] const QString& message() const noexcept { return m_message; }

private:
    QString m_message;
};

enum class ErrorKind {
    Resource,
    PlaybackRequest,
    FullscreenRequest
};

// Non-fatal notice surfaced to the user. Nothing is retried automatically.
struct SessionError
{
    ErrorKind kind{ErrorKind::Resource};
    QString message;
};

} // namespace HoldPlay::Core

Q_DECLARE_METATYPE(HoldPlay::Core::SessionError)

#endif // HOLDPLAY_CORE_ERRORS_H
