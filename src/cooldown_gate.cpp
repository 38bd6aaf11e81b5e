#include "facewatch/cooldown_gate.hpp"

namespace facewatch {

CooldownGate::CooldownGate(Seconds motion_window, Seconds face_window)
    : motion_{motion_window, std::nullopt}, face_{face_window, std::nullopt} {}

bool CooldownGate::may_emit(EventKind kind, TimePoint now) const {
    const Timer& t = timer(kind);
    if (!t.last) return true;
    return now - *t.last > t.window;
}

void CooldownGate::record_emit(EventKind kind, TimePoint now) {
    timer(kind).last = now;
}

Seconds CooldownGate::window(EventKind kind) const {
    return timer(kind).window;
}

std::optional<TimePoint> CooldownGate::last_emit(EventKind kind) const {
    return timer(kind).last;
}

}  // namespace facewatch
