/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LAYOUTS_HPP
#define LAYOUTS_HPP

#include "world/GridTypes.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GridAgents {

// A named demo world: dimensions, impassable cells and a suggested start
struct LayoutDefinition {
    std::string name;
    int width{10};
    int height{10};
    std::vector<GridCoord> walls;
    GridCoord start;
};

std::optional<LayoutDefinition> findLayout(std::string_view name);
std::vector<std::string> layoutNames();

} // namespace GridAgents

#endif // LAYOUTS_HPP
