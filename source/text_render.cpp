// text_render.cpp - Canonical text rendering

#include <semdiff/text_render.h>

namespace semdiff {

JsonWriteOptions canonical_write_options() noexcept
{
    JsonWriteOptions options;
    options.compact = false;
    options.omit_null_members = true;
    options.multiline_strings = true;
    options.open_empty_objects = true;
    return options;
}

std::string render_canonical(const Value& val)
{
    return to_json(val, canonical_write_options());
}

} // namespace semdiff
