#pragma once

#include <cstddef>
#include <variant>
#include <vector>

#include <handpath/synth/characteristics.hpp>
#include <handpath/synth/planner.hpp>
#include <handpath/synth/validator.hpp>

namespace handpath::synth {

///
/// Observer for pipeline events during trajectory generation.
///
/// Receives one notification per completed stage, in pipeline order. Useful for
/// testing stage decisions (style choice, overshoot, repairs) that are not
/// visible in the final point sequence, and for diagnostics.
///
class generation_observer {
   public:
    ///
    /// The move was shorter than k_short_distance_threshold; no other event follows.
    ///
    struct short_trajectory_event {
        double distance;
    };

    ///
    /// The planner chose a duration and a skeleton style.
    ///
    struct planned_event {
        motion_plan plan;
    };

    ///
    /// The skeleton generator produced its path.
    ///
    struct skeleton_event {
        skeleton_style style;
        std::size_t point_count;
    };

    ///
    /// Human characteristics were injected.
    ///
    struct characteristics_event {
        characteristics_report report;
        std::size_t point_count;
    };

    ///
    /// Derivatives were computed and noise applied.
    ///
    struct smoothing_event {
        std::size_t point_count;
    };

    ///
    /// The validator finished.
    ///
    struct validation_event {
        validation_report report;
        std::size_t point_count;
    };

    using event = std::variant<short_trajectory_event,
                               planned_event,
                               skeleton_event,
                               characteristics_event,
                               smoothing_event,
                               validation_event>;

    virtual ~generation_observer();

    ///
    /// Called once per pipeline event.
    ///
    /// @param ev Event describing the completed stage
    ///
    virtual void on_event(event ev) = 0;
};

///
/// Observer that collects all generation events for later inspection.
///
/// @code
/// generation_event_collector collector;
/// trajectory_generator gen{{.observer = &collector}};
/// auto traj = gen.generate(start, end, std::nullopt, rng);
/// for (const auto& ev : collector) {
///     // Inspect each event
/// }
/// @endcode
///
class generation_event_collector final : public generation_observer {
   public:
    generation_event_collector();
    ~generation_event_collector() override;

    ///
    /// Appends an event to the collection.
    ///
    void on_event(event ev) override;

    ///
    /// Gets all collected events, in order of occurrence.
    ///
    const std::vector<event>& events() const;

    ///
    /// Finds the most recent event of a given type.
    ///
    /// @return Pointer to the event, or nullptr if none was collected
    ///
    template <typename Event>
    const Event* last() const noexcept;

    ///
    /// Discards all collected events.
    ///
    void clear() noexcept;

    using const_iterator = std::vector<event>::const_iterator;

    const_iterator cbegin() const noexcept;
    const_iterator cend() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

   private:
    std::vector<event> events_;
};

template <typename Event>
const Event* generation_event_collector::last() const noexcept {
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (const auto* ev = std::get_if<Event>(&*it)) {
            return ev;
        }
    }
    return nullptr;
}

}  // namespace handpath::synth
