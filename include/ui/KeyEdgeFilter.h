#ifndef HOLDPLAY_UI_KEYEDGEFILTER_H
#define HOLDPLAY_UI_KEYEDGEFILTER_H

#include <QObject>
#include <QPointer>
#include <QList>
#include <QWidget>

class QKeyEvent;

namespace HoldPlay::Controllers { class MediaController; }

namespace HoldPlay::UI {

/**
 * @brief Application-wide event filter turning key events into key edges
 *
 * Only keys delivered to one of the registered player windows are handled,
 * and none while a modal dialog is open, so dialogs and file pickers keep
 * their own keyboard behaviour. Handled edges are consumed.
 */
class KeyEdgeFilter : public QObject
{
    Q_OBJECT

public:
    explicit KeyEdgeFilter(Controllers::MediaController& controller, QObject* parent = nullptr);
    ~KeyEdgeFilter() override = default;

    // A top-level window whose keys drive playback. The fullscreen video
    // container counts as one while it is detached.
    void addWindow(QWidget* window);

    [[nodiscard]] static bool textInputHasFocus();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    [[nodiscard]] bool accepts(QObject* watched) const;
    bool handleKeyEvent(const QKeyEvent* event);

    Controllers::MediaController& m_controller;
    QList<QPointer<QWidget>> m_windows;
};

} // namespace HoldPlay::UI

#endif // HOLDPLAY_UI_KEYEDGEFILTER_H
