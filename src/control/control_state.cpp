#include "control/control_state.hpp"

namespace control {

ControlState::ControlState(const ControlSnapshot& initial) : state_(initial) {}

ControlSnapshot ControlState::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ControlSnapshot ControlState::apply(const ControlUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    ControlSnapshot next = state_;
    if (update.mode) next.mode = *update.mode;
    if (update.is_streaming) next.is_streaming = *update.is_streaming;
    if (update.is_recording) next.is_recording = *update.is_recording;
    if (update.emotion_override) next.emotion_override = *update.emotion_override;
    ++next.revision;
    state_ = next;
    return state_;
}

}
