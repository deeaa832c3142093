#ifndef HOLDPLAY_CORE_SECONDS_H
#define HOLDPLAY_CORE_SECONDS_H

#include <QtGlobal>
#include <algorithm>
#include <cmath>

namespace HoldPlay::Core {

/**
 * @brief Non-negative, finite playback time in seconds
 *
 * Negative, NaN and infinite inputs collapse to zero at construction and
 * values above MaxValue are capped, so a Seconds value is always a valid
 * media position or duration and converts to milliseconds without overflow.
 */
class Seconds
{
public:
    static constexpr double MaxValue = 1.0e9;

    constexpr Seconds() noexcept = default;
    explicit Seconds(double value) noexcept : m_value(sanitize(value)) {}

    [[nodiscard]] static Seconds fromMilliseconds(qint64 milliseconds) noexcept
    {
        return Seconds(static_cast<double>(milliseconds) / 1000.0);
    }

    [[nodiscard]] double value() const noexcept { return m_value; }
    [[nodiscard]] bool isZero() const noexcept { return m_value == 0.0; }

    [[nodiscard]] qint64 toMilliseconds() const noexcept
    {
        return static_cast<qint64>(std::llround(m_value * 1000.0));
    }

    // Clamp into [0, upper]; a zero upper bound means "unknown" and leaves the
    // value unbounded above.
    [[nodiscard]] Seconds clampedTo(Seconds upper) const noexcept
    {
        if (upper.isZero() || m_value <= upper.m_value) {
            return *this;
        }
        return upper;
    }

    [[nodiscard]] Seconds offsetBy(double delta) const noexcept
    {
        return Seconds(m_value + delta);
    }

    friend bool operator==(Seconds a, Seconds b) noexcept { return a.m_value == b.m_value; }
    friend bool operator!=(Seconds a, Seconds b) noexcept { return a.m_value != b.m_value; }
    friend bool operator<(Seconds a, Seconds b) noexcept { return a.m_value < b.m_value; }

private:
    static double sanitize(double value) noexcept
    {
        return (std::isfinite(value) && value > 0.0) ? std::min(value, MaxValue) : 0.0;
    }

    double m_value{0.0};
};

} // namespace HoldPlay::Core

#endif // HOLDPLAY_CORE_SECONDS_H
