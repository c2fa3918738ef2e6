#include <handpath/synth/clock.hpp>

#include <chrono>

namespace handpath::synth {

clock system_clock() {
    return [] {
        using seconds = std::chrono::duration<double>;
        return std::chrono::duration_cast<seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    };
}

clock fixed_clock(double t) {
    return [t] { return t; };
}

}  // namespace handpath::synth
