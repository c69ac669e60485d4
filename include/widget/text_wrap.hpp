#pragma once

#include <string>
#include <vector>

namespace rev::widget {

/// Word-wraps `text` to `width` columns. Explicit newlines are kept, words
/// longer than a line are split. Always returns at least one line.
std::vector<std::string> WrapText(const std::string& text, int width);

/// Cuts `text` to `width` columns, ending in "..." when shortened.
std::string Ellipsize(const std::string& text, int width);

} // namespace rev::widget
