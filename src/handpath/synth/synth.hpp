#pragma once

// Human-like pointer trajectory synthesis: planner, skeleton, characteristics,
// smoothing and noise, validation.

#include <handpath/synth/characteristics.hpp>
#include <handpath/synth/clock.hpp>
#include <handpath/synth/config.hpp>
#include <handpath/synth/generator.hpp>
#include <handpath/synth/json_serialization.hpp>
#include <handpath/synth/observers.hpp>
#include <handpath/synth/planner.hpp>
#include <handpath/synth/random_source.hpp>
#include <handpath/synth/skeleton.hpp>
#include <handpath/synth/smoothing.hpp>
#include <handpath/synth/tensor_export.hpp>
#include <handpath/synth/validator.hpp>
