#pragma once

#include <syncstream>

namespace fscmp {

inline namespace detail_v1 {

// one log line per object, emitted whole when the object is destroyed
using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace fscmp
