/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EXPLORATION_MAP_HPP
#define EXPLORATION_MAP_HPP

#include "world/GridTypes.hpp"
#include <cstddef>
#include <optional>
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>

namespace GridAgents {

using CoordSet = boost::container::flat_set<GridCoord>;

/**
 * @brief An agent's private topological map of the cells it has visited.
 *
 * Each visited coordinate maps to the coordinates reachable from it and the
 * travel distance recorded for that edge. Edges are stored in both
 * directions. Pruning collapses pass-through (degree 2) nodes into direct
 * edges whose distance is the sum of the two edges they replace.
 */
class ExplorationMap {
public:
    using EdgeMap = boost::container::flat_map<GridCoord, int>;
    using NodeMap = boost::container::flat_map<GridCoord, EdgeMap>;

    bool empty() const { return m_nodes.empty(); }
    bool contains(GridCoord node) const { return m_nodes.find(node) != m_nodes.end(); }
    size_t nodeCount() const { return m_nodes.size(); }
    size_t edgeCount() const;
    size_t degree(GridCoord node) const;

    const NodeMap& nodes() const { return m_nodes; }
    const EdgeMap* edgesFrom(GridCoord node) const;
    std::optional<int> edgeDistance(GridCoord from, GridCoord to) const;

    // Inserts the node if missing; existing edges are untouched
    void addNode(GridCoord node);

    /**
     * @brief Adds or shortens the undirected edge a <-> b.
     *
     * Both endpoints become nodes. An existing edge keeps the smaller of the
     * two distances.
     */
    void addEdge(GridCoord a, GridCoord b, int distance);

    // Removes the node and every edge touching it
    bool removeNode(GridCoord node);

    void clear() { m_nodes.clear(); }

    /**
     * @brief Collapses corridor nodes until none remain.
     *
     * A corridor node has exactly two edges and is not in @p pinned. It is
     * replaced by a single edge between its two neighbours. Dead ends and
     * branch points are never removed. Running prune twice yields the same
     * map as running it once.
     *
     * @return number of nodes removed
     */
    size_t prune(const CoordSet& pinned = {});

    // Dijkstra over the recorded edges
    std::optional<int> shortestDistance(GridCoord from, GridCoord to) const;

    bool operator==(const ExplorationMap& other) const { return m_nodes == other.m_nodes; }

private:
    std::optional<GridCoord> findCorridor(const CoordSet& pinned) const;

    NodeMap m_nodes;
};

} // namespace GridAgents

#endif // EXPLORATION_MAP_HPP
