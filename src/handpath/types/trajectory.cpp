#include <handpath/types/trajectory.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace handpath::types {

trajectory::trajectory(std::vector<point> points) : points_{std::move(points)} {
    if (points_.empty()) {
        throw std::invalid_argument{"trajectory cannot be empty"};
    }
}

size_t trajectory::size() const noexcept {
    return points_.size();
}

bool trajectory::empty() const noexcept {
    return points_.empty();
}

trajectory::const_iterator trajectory::begin() const noexcept {
    return points_.cbegin();
}

trajectory::const_iterator trajectory::end() const noexcept {
    return points_.cend();
}

trajectory::const_iterator trajectory::cbegin() const noexcept {
    return points_.cbegin();
}

trajectory::const_iterator trajectory::cend() const noexcept {
    return points_.cend();
}

const point& trajectory::front() const noexcept {
    return points_.front();
}

const point& trajectory::back() const noexcept {
    return points_.back();
}

const point& trajectory::operator[](size_t i) const {
    return points_[i];
}

const point& trajectory::at(size_t i) const {
    if (i >= points_.size()) [[unlikely]] {
        throw std::out_of_range{"trajectory::at: index out of range"};
    }
    return points_[i];
}

const std::vector<point>& trajectory::points() const noexcept {
    return points_;
}

std::vector<point> trajectory::release() && noexcept {
    return std::move(points_);
}

trajectory::seconds trajectory::elapsed() const noexcept {
    return seconds{points_.back().timestamp - points_.front().timestamp};
}

double trajectory::displacement() const noexcept {
    return distance(position(points_.front()), position(points_.back()));
}

double trajectory::path_length() const noexcept {
    double total = 0.0;
    for (size_t i = 1; i < points_.size(); ++i) {
        total += distance(position(points_[i - 1]), position(points_[i]));
    }
    return total;
}

double trajectory::average_speed() const noexcept {
    const double t = elapsed().count();
    if (t <= 0.0) {
        return 0.0;
    }
    return displacement() / t;
}

double trajectory::peak_acceleration() const noexcept {
    double peak = 0.0;
    for (const auto& p : points_) {
        peak = std::max(peak, acceleration_magnitude(p));
    }
    return peak;
}

}  // namespace handpath::types
