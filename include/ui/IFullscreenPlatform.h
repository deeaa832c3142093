#ifndef HOLDPLAY_UI_IFULLSCREENPLATFORM_H
#define HOLDPLAY_UI_IFULLSCREENPLATFORM_H

#include <QObject>

namespace HoldPlay::UI {

/**
 * @brief Platform fullscreen capability
 *
 * Requests are asynchronous and may be refused. The actual condition is only
 * known from fullscreenChanged(), which also fires when the user leaves
 * fullscreen through the platform (Escape, window manager).
 */
class IFullscreenPlatform : public QObject
{
    Q_OBJECT

public:
    explicit IFullscreenPlatform(QObject* parent = nullptr) : QObject(parent) {}
    ~IFullscreenPlatform() override = default;

    // Return false when the request was refused outright.
    virtual bool requestEnter() = 0;
    virtual bool requestExit() = 0;

    [[nodiscard]] virtual bool isFullScreen() const = 0;

signals:
    void fullscreenChanged(bool fullscreen);
};

} // namespace HoldPlay::UI

#endif // HOLDPLAY_UI_IFULLSCREENPLATFORM_H
