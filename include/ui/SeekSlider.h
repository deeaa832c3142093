#ifndef HOLDPLAY_UI_SEEKSLIDER_H
#define HOLDPLAY_UI_SEEKSLIDER_H

#include <QSlider>
#include <QMouseEvent>

namespace HoldPlay::UI {

/**
 * @brief Millisecond seek bar that jumps to the clicked position
 *
 * User interaction is reported through seekRequested(); engine updates go
 * through showPosition(), which is ignored while the handle is held.
 */
class SeekSlider : public QSlider
{
    Q_OBJECT

public:
    explicit SeekSlider(QWidget *parent = nullptr);
    ~SeekSlider() override = default;

    void showPosition(qint64 positionMs, qint64 maximumMs);

signals:
    void seekRequested(qint64 positionMs);

protected:
    void mousePressEvent(QMouseEvent *event) override;

private:
    [[nodiscard]] int valueAt(int pixel) const;
};

} // namespace HoldPlay::UI

#endif // HOLDPLAY_UI_SEEKSLIDER_H
