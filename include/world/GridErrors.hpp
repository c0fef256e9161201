/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_ERRORS_HPP
#define GRID_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace GridAgents {

// Direction argument outside {North, East, South, West}
class InvalidDirection : public std::out_of_range {
public:
    explicit InvalidDirection(const std::string& what) : std::out_of_range(what) {}
};

// Neighbour structure does not describe a valid 4-connected grid
class CorruptTopology : public std::logic_error {
public:
    explicit CorruptTopology(const std::string& what) : std::logic_error(what) {}
};

// An action's observation does not have the shape its kind requires
class UnexpectedObservationType : public std::logic_error {
public:
    explicit UnexpectedObservationType(const std::string& what) : std::logic_error(what) {}
};

} // namespace GridAgents

#endif // GRID_ERRORS_HPP
