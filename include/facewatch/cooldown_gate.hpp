#pragma once

#include <optional>

#include "facewatch/frame_types.hpp"

namespace facewatch {

// Independent per-kind throttles. A kind may emit once more than its window
// has elapsed since its last recorded emission.
class CooldownGate {
public:
    CooldownGate(Seconds motion_window, Seconds face_window);

    bool may_emit(EventKind kind, TimePoint now) const;
    void record_emit(EventKind kind, TimePoint now);

    Seconds window(EventKind kind) const;
    std::optional<TimePoint> last_emit(EventKind kind) const;

private:
    struct Timer {
        Seconds window;
        std::optional<TimePoint> last;
    };

    Timer& timer(EventKind kind) { return kind == EventKind::Face ? face_ : motion_; }
    const Timer& timer(EventKind kind) const { return kind == EventKind::Face ? face_ : motion_; }

    Timer motion_;
    Timer face_;
};

}  // namespace facewatch
