#pragma once

#include <amc/vector.hpp>  // IWYU pragma: export

namespace deadsimple {

template <class T>
using vector = amc::vector<T>;

}  // namespace deadsimple
