#ifndef HOLDPLAY_CORE_PLAYBACKRATE_H
#define HOLDPLAY_CORE_PLAYBACKRATE_H

#include <QString>
#include <QtGlobal>
#include <array>
#include <optional>

namespace HoldPlay::Core {

// Rates offered by the transport bar. Add an enumerator and extend
// allPlaybackRates() to offer another one.
enum class PlaybackRate {
    Half,
    ThreeQuarters,
    Normal
};

inline constexpr std::array<PlaybackRate, 3> allPlaybackRates()
{
    return {PlaybackRate::Half, PlaybackRate::ThreeQuarters, PlaybackRate::Normal};
}

inline constexpr qreal rateFactor(PlaybackRate rate)
{
    switch (rate) {
    case PlaybackRate::Half:
        return 0.5;
    case PlaybackRate::ThreeQuarters:
        return 0.75;
    case PlaybackRate::Normal:
        return 1.0;
    }
    return 1.0;
}

[[nodiscard]] inline std::optional<PlaybackRate> rateFromFactor(qreal factor)
{
    for (const PlaybackRate rate : allPlaybackRates()) {
        if (qFuzzyCompare(rateFactor(rate), factor)) {
            return rate;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline QString rateLabel(PlaybackRate rate)
{
    return QStringLiteral("%1x").arg(rateFactor(rate));
}

} // namespace HoldPlay::Core

#endif // HOLDPLAY_CORE_PLAYBACKRATE_H
