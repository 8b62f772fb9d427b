module;

#include <fast_float/fast_float.h>

export module fast_float;

export namespace fast_float {

using fast_float::chars_format;
using fast_float::from_chars;

} // namespace fast_float
