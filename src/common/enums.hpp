#pragma once

namespace skyshield {

enum class Identification {
    Friendly,
    Unknown,
    Hostile
};

enum class LifecycleState {
    Live,
    Engaged
};

enum class EvaluatorState {
    Running,
    Stopped
};

} // namespace skyshield
