#include "widget/text_wrap.hpp"

#include <sstream>

namespace rev::widget {

namespace {

bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

/// Columns taken by `s`, one per code point.
std::size_t columns(const std::string& s)
{
    std::size_t n = 0;
    for (unsigned char c : s)
        if (!isContinuation(c)) ++n;
    return n;
}

/// Byte length of the first `cols` code points of `s`.
std::size_t prefixBytes(const std::string& s, std::size_t cols)
{
    std::size_t i = 0;
    for (std::size_t seen = 0; i < s.size(); ++i) {
        if (!isContinuation(static_cast<unsigned char>(s[i])) && seen++ == cols)
            break;
    }
    return i;
}

} // namespace

std::vector<std::string> WrapText(const std::string& text, int width)
{
    std::vector<std::string> lines;
    if (width <= 0) {
        lines.emplace_back();
        return lines;
    }
    const auto w = static_cast<std::size_t>(width);

    std::istringstream paragraphs(text);
    std::string paragraph;
    while (std::getline(paragraphs, paragraph)) {
        if (!paragraph.empty() && paragraph.back() == '\r')
            paragraph.pop_back();

        std::istringstream words(paragraph);
        std::string word, line;
        bool any = false;
        while (words >> word) {
            any = true;
            while (columns(word) > w) {
                if (!line.empty()) {
                    lines.push_back(line);
                    line.clear();
                }
                const std::size_t cut = prefixBytes(word, w);
                lines.push_back(word.substr(0, cut));
                word.erase(0, cut);
            }
            if (word.empty()) continue;
            if (line.empty())
                line = word;
            else if (columns(line) + 1 + columns(word) <= w)
                line += ' ' + word;
            else {
                lines.push_back(line);
                line = word;
            }
        }
        if (!line.empty() || !any)
            lines.push_back(line);
    }
    if (lines.empty())
        lines.emplace_back();
    return lines;
}

std::string Ellipsize(const std::string& text, int width)
{
    if (width <= 0) return {};
    const auto w = static_cast<std::size_t>(width);
    if (columns(text) <= w) return text;
    if (w <= 3) return text.substr(0, prefixBytes(text, w));
    return text.substr(0, prefixBytes(text, w - 3)) + "...";
}

} // namespace rev::widget
