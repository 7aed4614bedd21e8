#pragma once

namespace geoalloc {

  template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
  };

}  // namespace geoalloc
