module;

#include <magic_enum/magic_enum.hpp>

export module magic_enum;

export namespace magic_enum {

using magic_enum::enum_cast;
using magic_enum::enum_contains;
using magic_enum::enum_count;
using magic_enum::enum_entries;
using magic_enum::enum_index;
using magic_enum::enum_integer;
using magic_enum::enum_name;
using magic_enum::enum_names;
using magic_enum::enum_underlying;
using magic_enum::enum_value;
using magic_enum::enum_values;

} // namespace magic_enum
