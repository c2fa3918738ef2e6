#pragma once

#include <chrono>
#include <ranges>
#include <vector>

#include <handpath/types/point.hpp>

namespace handpath::types {

///
/// Ordered, non-empty sequence of pointer samples.
///
/// Produced fresh by every generator call and fully owned by the caller afterwards.
/// Holds no reference back into the generator that made it.
///
/// **Note**: Cannot be empty. Construction from an empty sequence throws.
///
class trajectory {
   public:
    ///
    /// Time duration in seconds (as floating point).
    ///
    using seconds = std::chrono::duration<double>;

    using const_iterator = std::vector<point>::const_iterator;
    using value_type = point;
    using size_type = std::size_t;

    ///
    /// Takes ownership of a sequence of points.
    ///
    /// @param points Points in emission order
    /// @throws std::invalid_argument if points is empty
    ///
    explicit trajectory(std::vector<point> points);

    ///
    /// Gets the number of points.
    ///
    size_t size() const noexcept;

    ///
    /// Always false; present for range compatibility.
    ///
    bool empty() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;
    const_iterator cbegin() const noexcept;
    const_iterator cend() const noexcept;

    const point& front() const noexcept;
    const point& back() const noexcept;

    /// Access point by index (no bounds checking)
    const point& operator[](size_t i) const;

    /// Access point by index with bounds checking
    /// @throws std::out_of_range if i >= size()
    const point& at(size_t i) const;

    ///
    /// Gets the points as a contiguous vector.
    ///
    const std::vector<point>& points() const noexcept;

    ///
    /// Releases the points to the caller.
    ///
    std::vector<point> release() && noexcept;

    ///
    /// Time between the first and the last point.
    ///
    seconds elapsed() const noexcept;

    ///
    /// Straight-line distance between the first and the last point.
    ///
    double displacement() const noexcept;

    ///
    /// Sum of the distances between consecutive points.
    ///
    double path_length() const noexcept;

    ///
    /// Straight-line displacement divided by elapsed time.
    ///
    /// @return Average speed in px/s, or zero if no time elapses
    ///
    double average_speed() const noexcept;

    ///
    /// Largest derived acceleration magnitude over all points.
    ///
    double peak_acceleration() const noexcept;

   private:
    std::vector<point> points_;
};

static_assert(std::ranges::sized_range<trajectory>);
static_assert(std::ranges::random_access_range<trajectory>);

}  // namespace handpath::types
