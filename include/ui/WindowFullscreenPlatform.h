#ifndef HOLDPLAY_UI_WINDOWFULLSCREENPLATFORM_H
#define HOLDPLAY_UI_WINDOWFULLSCREENPLATFORM_H

#include <QPointer>
#include <QWidget>
#include "ui/IFullscreenPlatform.h"

namespace HoldPlay::UI {

/**
 * @brief Fullscreen through Qt window states
 *
 * Detaches the target widget into its own fullscreen top-level window and
 * puts it back into its parent's layout on exit. Window state changes of the
 * target are the notifications. Escape inside the fullscreen window is the
 * platform's own exit key. A window manager that drops the fullscreen state
 * on its own also gets the target put back into the layout.
 */
class WindowFullscreenPlatform : public IFullscreenPlatform
{
    Q_OBJECT

public:
    explicit WindowFullscreenPlatform(QWidget* target, QObject* parent = nullptr);
    ~WindowFullscreenPlatform() override;

    bool requestEnter() override;
    bool requestExit() override;
    [[nodiscard]] bool isFullScreen() const override;

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void restoreEmbedded();
    void notifyIfChanged();

    QPointer<QWidget> m_target;
    Qt::WindowFlags m_embeddedFlags;
    bool m_lastReported{false};
};

} // namespace HoldPlay::UI

#endif // HOLDPLAY_UI_WINDOWFULLSCREENPLATFORM_H
