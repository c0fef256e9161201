/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_VIEWER_HPP
#define GRID_VIEWER_HPP

#include "world/WorldSnapshot.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include <vector>

namespace GridAgents {

class Grid;
class SimulationRunner;

/**
 * @brief SDL3 window that draws the grid and the latest published snapshot.
 *
 * Runs on the main thread (SDL event requirement). The cell layout is
 * captured once up front, so the viewer never touches the live World.
 */
class GridViewer {
public:
    explicit GridViewer(const Grid& grid);
    ~GridViewer();

    GridViewer(const GridViewer&) = delete;
    GridViewer& operator=(const GridViewer&) = delete;

    bool init(const std::string& title, int windowWidth = 800, int windowHeight = 600);

    /**
     * @brief Draws until the runner finishes or the user quits ('q' or
     *        closing the window), which sends the runner's stop signal.
     */
    void run(SimulationRunner& runner);

private:
    void render(const WorldSnapshot& snapshot);
    SDL_FRect cellRect(int x, int y) const;

    int m_gridWidth;
    int m_gridHeight;
    std::vector<bool> m_blocked;

    std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{nullptr, SDL_DestroyWindow};
    std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{nullptr, SDL_DestroyRenderer};
    bool m_sdlInitialized{false};
    int m_windowWidth{0};
    int m_windowHeight{0};
};

} // namespace GridAgents

#endif // GRID_VIEWER_HPP
