#pragma once

// Umbrella header: everything except the optional Eigen adapter.

#include <smoothie/builder.hpp>
#include <smoothie/error.hpp>
#include <smoothie/filter.hpp>
#include <smoothie/filter_config.hpp>
#include <smoothie/filters1d.hpp>
#include <smoothie/filters2d.hpp>
#include <smoothie/fwd.hpp>
#include <smoothie/logger.hpp>
#include <smoothie/point.hpp>
#include <smoothie/smoother.hpp>
#include <smoothie/window_buffer.hpp>
