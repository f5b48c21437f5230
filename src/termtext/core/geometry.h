// geometry.h created on 2018-03-04 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CORE_GEOMETRY_H
#define TERMTEXT_CORE_GEOMETRY_H

#include <cstdint>
#include <ostream>

namespace termtext::core {


/// Position or size in a grid of character cells.
/// As a position: `x` is the column, `y` is the row (both 0-based).
/// As a size: `x` is the width in columns, `y` the height in rows.
struct Vec2i {
    int32_t x = 0;
    int32_t y = 0;

    constexpr int32_t area() const { return x * y; }

    constexpr Vec2i operator+(Vec2i rhs) const { return {x + rhs.x, y + rhs.y}; }
    constexpr bool operator==(const Vec2i& rhs) const = default;

    friend std::ostream& operator<<(std::ostream& os, Vec2i v) {
        return os << '{' << v.x << ", " << v.y << '}';
    }
};


} // namespace termtext::core

#endif // TERMTEXT_CORE_GEOMETRY_H
