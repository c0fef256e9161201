/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "agents/ExplorationMap.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <iterator>
#include <queue>
#include <utility>
#include <vector>

namespace GridAgents {

size_t ExplorationMap::edgeCount() const {
    size_t directed = 0;
    for (const auto& [node, edges] : m_nodes) {
        directed += edges.size();
    }
    return directed / 2;
}

size_t ExplorationMap::degree(GridCoord node) const {
    const EdgeMap* edges = edgesFrom(node);
    return edges ? edges->size() : 0;
}

const ExplorationMap::EdgeMap* ExplorationMap::edgesFrom(GridCoord node) const {
    auto it = m_nodes.find(node);
    return it != m_nodes.end() ? &it->second : nullptr;
}

std::optional<int> ExplorationMap::edgeDistance(GridCoord from, GridCoord to) const {
    const EdgeMap* edges = edgesFrom(from);
    if (!edges) {
        return std::nullopt;
    }
    auto it = edges->find(to);
    if (it == edges->end()) {
        return std::nullopt;
    }
    return it->second;
}

void ExplorationMap::addNode(GridCoord node) {
    m_nodes.try_emplace(node);
}

void ExplorationMap::addEdge(GridCoord a, GridCoord b, int distance) {
    if (a == b) {
        return;
    }
    auto link = [this, distance](GridCoord from, GridCoord to) {
        EdgeMap& edges = m_nodes[from];
        auto [it, inserted] = edges.try_emplace(to, distance);
        if (!inserted) {
            it->second = std::min(it->second, distance);
        }
    };
    link(a, b);
    link(b, a);
}

bool ExplorationMap::removeNode(GridCoord node) {
    auto it = m_nodes.find(node);
    if (it == m_nodes.end()) {
        return false;
    }
    for (const auto& [neighbour, distance] : it->second) {
        auto nit = m_nodes.find(neighbour);
        if (nit != m_nodes.end()) {
            nit->second.erase(node);
        }
    }
    m_nodes.erase(it);
    return true;
}

std::optional<GridCoord> ExplorationMap::findCorridor(const CoordSet& pinned) const {
    for (const auto& [node, edges] : m_nodes) {
        if (edges.size() == 2 && pinned.find(node) == pinned.end()) {
            return node;
        }
    }
    return std::nullopt;
}

size_t ExplorationMap::prune(const CoordSet& pinned) {
    size_t removed = 0;
    while (auto corridor = findCorridor(pinned)) {
        const EdgeMap edges = m_nodes[*corridor];
        auto first = edges.begin();
        auto second = std::next(first);
        const int joined = first->second + second->second;

        removeNode(*corridor);
        addEdge(first->first, second->first, joined);
        ++removed;
    }

    if (removed > 0) {
        AGENT_DEBUG(std::format("Pruned {} corridor nodes, {} nodes remain", removed,
                                m_nodes.size()));
    }
    return removed;
}

std::optional<int> ExplorationMap::shortestDistance(GridCoord from, GridCoord to) const {
    if (!contains(from) || !contains(to)) {
        return std::nullopt;
    }

    using QueueEntry = std::pair<int, GridCoord>;
    auto cmp = [](const QueueEntry& a, const QueueEntry& b) { return a.first > b.first; };
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, decltype(cmp)> open(cmp);
    boost::container::flat_map<GridCoord, int> best;

    best[from] = 0;
    open.emplace(0, from);

    while (!open.empty()) {
        auto [dist, node] = open.top();
        open.pop();
        if (node == to) {
            return dist;
        }
        if (dist > best[node]) {
            continue;
        }
        for (const auto& [next, step] : m_nodes.at(node)) {
            const int candidate = dist + step;
            auto it = best.find(next);
            if (it == best.end() || candidate < it->second) {
                best[next] = candidate;
                open.emplace(candidate, next);
            }
        }
    }
    return std::nullopt;
}

} // namespace GridAgents
