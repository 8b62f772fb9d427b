export module pal:RuntimeError;

import std;

namespace pal {

// Aborts the current run. The virtual machine reports it together with a traceback.
export class RuntimeError : public std::runtime_error
{
public:
    explicit RuntimeError(const std::string & what)
        : std::runtime_error(what)
    {
    }
};

} // namespace pal
