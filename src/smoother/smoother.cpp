#include <smoothie/filter.hpp>
#include <smoothie/smoother.hpp>

namespace smoothie
{

template class BasicSmoother<Filter1D>;
template class BasicSmoother<Filter2D>;

}   // namespace smoothie
