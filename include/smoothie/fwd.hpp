#pragma once

#include <cstddef>

namespace smoothie
{

// Sample dimensionality of a filter or smoother.
enum class Dimension : int
{
    One = 1,
    Two = 2,
};

struct Point2;

class Error;
class ConfigurationError;
class StateError;

template <typename T>
class WindowBuffer;

class FilterBase;
class Filter1D;
class Filter2D;

template <typename FilterT>
class BasicSmoother;

using Smoother1D = BasicSmoother<Filter1D>;
using Smoother2D = BasicSmoother<Filter2D>;

template <typename FilterT>
class BasicSmootherBuilder;

using SmootherBuilder1D = BasicSmootherBuilder<Filter1D>;
using SmootherBuilder2D = BasicSmootherBuilder<Filter2D>;

struct FilterParams;
struct FilterConfig;

class Logger;

}   // namespace smoothie
