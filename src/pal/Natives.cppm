export module pal:Natives;

import std;

import :VirtualMachine;

namespace pal {

// Host globals every embedding gets:
//   clock()    - seconds since the epoch
//   range(n)   - native iterator over 0 .. n-1
//   Action     - native namespace mirroring the instrument actions
export [[nodiscard]] auto standard_globals() -> Globals;

} // namespace pal
