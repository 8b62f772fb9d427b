module;

#include <jinja2cpp/template.h>

export module jinja2cpp;

export namespace jinja2 {

using jinja2::ErrorInfo;
using jinja2::Template;
using jinja2::ValuesMap;

} // namespace jinja2
