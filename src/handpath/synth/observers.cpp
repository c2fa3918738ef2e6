#include <handpath/synth/observers.hpp>

#include <utility>

namespace handpath::synth {

generation_observer::~generation_observer() = default;

generation_event_collector::generation_event_collector() = default;
generation_event_collector::~generation_event_collector() = default;

void generation_event_collector::on_event(event ev) {
    events_.push_back(std::move(ev));
}

const std::vector<generation_event_collector::event>& generation_event_collector::events() const {
    return events_;
}

void generation_event_collector::clear() noexcept {
    events_.clear();
}

generation_event_collector::const_iterator generation_event_collector::cbegin() const noexcept {
    using std::cbegin;
    return cbegin(events());
}

generation_event_collector::const_iterator generation_event_collector::cend() const noexcept {
    using std::cend;
    return cend(events());
}

generation_event_collector::const_iterator generation_event_collector::begin() const noexcept {
    return cbegin();
}

generation_event_collector::const_iterator generation_event_collector::end() const noexcept {
    return cend();
}

}  // namespace handpath::synth
