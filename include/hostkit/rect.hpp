#pragma once

#include <algorithm>
#include <climits>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace hostkit
{

// Integer rectangle in pixels. (x, y) is the top-left pixel, (w, h) the spans.
// A rectangle with a zero span is empty; spans are never negative once trimmed.
struct Rect
{
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    static constexpr Rect empty_rect() { return {}; }

    // Large enough to cover any client area, small enough that x + w cannot overflow.
    static constexpr Rect huge() { return {0, 0, INT_MAX / 2, INT_MAX / 2}; }

    constexpr bool is_empty() const { return w <= 0 || h <= 0; }

    // Coordinates of the last pixel, inclusive.
    constexpr int x_max() const { return x + w - 1; }
    constexpr int y_max() const { return y + h - 1; }

    constexpr Rect with_pos(int nx, int ny) const { return {nx, ny, w, h}; }
    constexpr Rect with_pos_deltas(int dx, int dy) const { return {x + dx, y + dy, w, h}; }
    constexpr Rect with_spans(int nw, int nh) const { return {x, y, nw, nh}; }

    // Negative spans become zero.
    constexpr Rect trimmed() const { return {x, y, std::max(0, w), std::max(0, h)}; }

    // Smallest rectangle containing both. An empty operand yields the other.
    constexpr Rect union_bounding_box(const Rect& o) const
    {
        if (o.is_empty())
            return *this;
        if (is_empty())
            return o;
        const int64_t min_x = std::min(x, o.x);
        const int64_t min_y = std::min(y, o.y);
        const int64_t max_x = std::max<int64_t>(int64_t(x) + w, int64_t(o.x) + o.w);
        const int64_t max_y = std::max<int64_t>(int64_t(y) + h, int64_t(o.y) + o.h);
        return {static_cast<int>(min_x),
                static_cast<int>(min_y),
                static_cast<int>(std::min<int64_t>(INT_MAX, max_x - min_x)),
                static_cast<int>(std::min<int64_t>(INT_MAX, max_y - min_y))};
    }

    // Empty (at this rect's origin) when there is no overlap.
    constexpr Rect intersected(const Rect& o) const
    {
        const int64_t nx  = std::max(x, o.x);
        const int64_t ny  = std::max(y, o.y);
        const int64_t nx2 = std::min<int64_t>(int64_t(x) + w, int64_t(o.x) + o.w);
        const int64_t ny2 = std::min<int64_t>(int64_t(y) + h, int64_t(o.y) + o.h);
        if (nx2 <= nx || ny2 <= ny)
            return {x, y, 0, 0};
        return {static_cast<int>(nx),
                static_cast<int>(ny),
                static_cast<int>(nx2 - nx),
                static_cast<int>(ny2 - ny)};
    }

    constexpr bool contains(int px, int py) const
    {
        return !is_empty() && px >= x && py >= y && px <= x_max() && py <= y_max();
    }

    constexpr bool operator==(const Rect&) const = default;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const Rect& r);

// Client area bounds from window bounds, given insets (left, top, right, bottom)
// stored as (x, y, w, h).
constexpr Rect client_from_window(const Rect& insets, const Rect& window)
{
    return {window.x + insets.x,
            window.y + insets.y,
            window.w - (insets.x + insets.w),
            window.h - (insets.y + insets.h)};
}

constexpr Rect window_from_client(const Rect& insets, const Rect& client)
{
    return {client.x - insets.x,
            client.y - insets.y,
            client.w + (insets.x + insets.w),
            client.h + (insets.y + insets.h)};
}

}   // namespace hostkit
