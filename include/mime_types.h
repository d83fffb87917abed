#ifndef MIME_TYPES_H
#define MIME_TYPES_H

#include <optional>
#include <string>
#include <string_view>

// Media type for a file name, looked up by extension (case-insensitive).
// Contents are never inspected. Empty for unknown extensions.
std::optional<std::string> guess_mime_type(std::string_view filename);

// Same lookup, falling back to DEFAULT_MIME_TYPE.
std::string mime_type_or_default(std::string_view filename);

#endif // MIME_TYPES_H
