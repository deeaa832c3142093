#include "ui/SeekSlider.h"
#include <QStyle>
#include <QStyleOptionSlider>
#include <QtGlobal>
#include <limits>

namespace HoldPlay::UI {

SeekSlider::SeekSlider(QWidget *parent)
    : QSlider(Qt::Horizontal, parent)
{
    setRange(0, 0);
    setFocusPolicy(Qt::NoFocus);

    connect(this, &QSlider::sliderMoved, this, [this](int value) {
        emit seekRequested(value);
    });
}

void SeekSlider::showPosition(qint64 positionMs, qint64 maximumMs)
{
    constexpr qint64 limit = std::numeric_limits<int>::max();
    const int maximumValue = static_cast<int>(qBound<qint64>(0, maximumMs, limit));
    if (maximum() != maximumValue) {
        setMaximum(maximumValue);
    }

    if (isSliderDown()) {
        return;
    }

    const QSignalBlocker blocker(this);
    setValue(static_cast<int>(qBound<qint64>(0, positionMs, maximumValue)));
}

void SeekSlider::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton || minimum() >= maximum() || width() <= 0) {
        QSlider::mousePressEvent(event);
        return;
    }

    const int value = valueAt(event->position().toPoint().x());
    setValue(value);
    emit seekRequested(value);

    // Let QSlider start a drag from the new handle position.
    QSlider::mousePressEvent(event);
}

int SeekSlider::valueAt(int pixel) const
{
    QStyleOptionSlider opt;
    initStyleOption(&opt);

    const QRect groove = style()->subControlRect(QStyle::CC_Slider, &opt, QStyle::SC_SliderGroove, this);
    const QRect handle = style()->subControlRect(QStyle::CC_Slider, &opt, QStyle::SC_SliderHandle, this);

    const int sliderMin = groove.x() + handle.width() / 2;
    const int sliderMax = groove.right() - handle.width() / 2;
    if (sliderMax <= sliderMin) {
        return minimum();
    }

    return QStyle::sliderValueFromPosition(minimum(), maximum(),
                                           qBound(sliderMin, pixel, sliderMax) - sliderMin,
                                           sliderMax - sliderMin);
}

} // namespace HoldPlay::UI
