#ifndef HOLDPLAY_CORE_SESSIONEVENT_H
#define HOLDPLAY_CORE_SESSIONEVENT_H

#include <QString>
#include <variant>
#include "core/Seconds.h"
#include "media/SourceHandle.h"

namespace HoldPlay::Core {

// Engine notifications. Each carries the source it was produced for so the
// dispatcher can drop events from a source that has since been replaced.

struct TimeUpdate
{
    Media::SourceId source{Media::NullSourceId};
    Seconds time;
};

struct DurationKnown
{
    Media::SourceId source{Media::NullSourceId};
    Seconds duration;
};

struct Ended
{
    Media::SourceId source{Media::NullSourceId};
};

struct EngineStateReport
{
    Media::SourceId source{Media::NullSourceId};
    bool playing{false};
};

struct RequestFailed
{
    Media::SourceId source{Media::NullSourceId};
    Media::RequestId request{Media::NoRequest};
    QString reason;
};

struct ResourceFailure
{
    Media::SourceId source{Media::NullSourceId};
    QString reason;
};

// Keyboard edges. textInputFocused is sampled by the window at delivery time.

struct KeyEdge
{
    int key{0};
    bool autoRepeat{false};
    bool textInputFocused{false};
};

struct KeyDown : KeyEdge {};
struct KeyUp : KeyEdge {};

// Platform notification of the actual fullscreen condition.
struct FullscreenChange
{
    bool fullscreen{false};
};

using SessionEvent = std::variant<TimeUpdate,
                                  DurationKnown,
                                  Ended,
                                  EngineStateReport,
                                  RequestFailed,
                                  ResourceFailure,
                                  KeyDown,
                                  KeyUp,
                                  FullscreenChange>;

} // namespace HoldPlay::Core

#endif // HOLDPLAY_CORE_SESSIONEVENT_H
