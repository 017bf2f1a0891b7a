#pragma once

#include <set>
#include <string>

namespace xsel::util {

/// Decodes named (`&copy;`), decimal (`&#169;`) and hex (`&#xA9;`) character references.
/// Names listed in keep (lowercase) are left untouched. A reference that cannot be decoded is
/// dropped when it ends with `;` and remove_illegal is set, kept verbatim otherwise.
/// Code points 0x80-0x9F are read as windows-1252, as browsers do.
std::string replace_entities(const std::string& text,
                             const std::set<std::string>& keep = {},
                             bool remove_illegal = true);

}  // namespace xsel::util
