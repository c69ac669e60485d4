#pragma once

namespace rev::widget {

/// Screen area in terminal cells.
struct Rect {
    int x      {0};
    int y      {0};
    int width  {0};
    int height {0};

    bool empty() const { return width <= 0 || height <= 0; }
    bool operator==(const Rect&) const = default;
};

} // namespace rev::widget
