/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/GridViewer.hpp"
#include "core/Logger.hpp"
#include "core/SimulationRunner.hpp"
#include "world/Grid.hpp"
#include <algorithm>
#include <cstdint>
#include <format>

namespace GridAgents {

namespace {
constexpr SDL_Color BACKGROUND{32, 32, 40, 255};
constexpr SDL_Color OPEN_CELL{224, 224, 255, 255};
constexpr SDL_Color BLOCKED_CELL{0, 0, 255, 255};
constexpr SDL_Color CELL_BORDER{0, 0, 0, 255};
constexpr SDL_Color AGENT{255, 0, 0, 255};

// Redraw rate while waiting on the simulation thread
constexpr Uint32 FRAME_DELAY_MS = 16;

void setColor(SDL_Renderer* renderer, const SDL_Color& color) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}
} // anonymous namespace

GridViewer::GridViewer(const Grid& grid)
    : m_gridWidth(grid.getWidth()), m_gridHeight(grid.getHeight()) {
    m_blocked.reserve(grid.cells().size());
    for (const Cell& cell : grid.cells()) {
        m_blocked.push_back(cell.capacity() == 0);
    }
}

GridViewer::~GridViewer() {
    mp_renderer.reset();
    mp_window.reset();
    if (m_sdlInitialized) {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
    }
}

bool GridViewer::init(const std::string& title, int windowWidth, int windowHeight) {
    if (!SDL_InitSubSystem(SDL_INIT_VIDEO)) {
        VIEWER_CRITICAL(std::format("SDL video could not initialize: {}", SDL_GetError()));
        return false;
    }
    m_sdlInitialized = true;

    mp_window.reset(SDL_CreateWindow(title.c_str(), windowWidth, windowHeight, SDL_WINDOW_RESIZABLE));
    if (!mp_window) {
        VIEWER_CRITICAL(std::format("Window could not be created: {}", SDL_GetError()));
        return false;
    }

    mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
    if (!mp_renderer) {
        VIEWER_CRITICAL(std::format("Renderer could not be created: {}", SDL_GetError()));
        return false;
    }

    m_windowWidth = windowWidth;
    m_windowHeight = windowHeight;
    VIEWER_INFO(std::format("Viewer window {}x{} for a {}x{} grid", windowWidth, windowHeight,
                            m_gridWidth, m_gridHeight));
    return true;
}

void GridViewer::run(SimulationRunner& runner) {
    if (!mp_renderer) {
        VIEWER_ERROR("Viewer run without a renderer");
        return;
    }

    uint64_t drawnTick = UINT64_MAX;
    bool quit = false;

    while (!quit) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_QUIT ||
                (event.type == SDL_EVENT_KEY_DOWN && event.key.key == SDLK_Q)) {
                VIEWER_INFO("Quit requested");
                runner.stop();
                quit = true;
            } else if (event.type == SDL_EVENT_WINDOW_RESIZED) {
                m_windowWidth = event.window.data1;
                m_windowHeight = event.window.data2;
                drawnTick = UINT64_MAX;
            }
        }

        const uint64_t published = runner.publishedTick();
        if (published != drawnTick) {
            render(runner.latestSnapshot());
            drawnTick = published;
        }

        if (!runner.isRunning()) {
            quit = true;
        }
        SDL_Delay(FRAME_DELAY_MS);
    }
}

SDL_FRect GridViewer::cellRect(int x, int y) const {
    // Square cells, centred in the window
    const float cellSize = std::min(static_cast<float>(m_windowWidth) / static_cast<float>(m_gridWidth),
                                    static_cast<float>(m_windowHeight) / static_cast<float>(m_gridHeight));
    const float originX = (static_cast<float>(m_windowWidth) - cellSize * static_cast<float>(m_gridWidth)) / 2.0f;
    const float originY = (static_cast<float>(m_windowHeight) - cellSize * static_cast<float>(m_gridHeight)) / 2.0f;
    return SDL_FRect{originX + cellSize * static_cast<float>(x), originY + cellSize * static_cast<float>(y),
                     cellSize, cellSize};
}

void GridViewer::render(const WorldSnapshot& snapshot) {
    SDL_Renderer* renderer = mp_renderer.get();

    setColor(renderer, BACKGROUND);
    SDL_RenderClear(renderer);

    for (int y = 0; y < m_gridHeight; ++y) {
        for (int x = 0; x < m_gridWidth; ++x) {
            const SDL_FRect rect = cellRect(x, y);
            const bool blocked = m_blocked[static_cast<size_t>(y) * static_cast<size_t>(m_gridWidth) +
                                           static_cast<size_t>(x)];
            setColor(renderer, blocked ? BLOCKED_CELL : OPEN_CELL);
            SDL_RenderFillRect(renderer, &rect);
            setColor(renderer, CELL_BORDER);
            SDL_RenderRect(renderer, &rect);
        }
    }

    setColor(renderer, AGENT);
    for (const AgentSnapshot& agent : snapshot.agents) {
        SDL_FRect rect = cellRect(agent.x, agent.y);
        const float inset = rect.w / 4.0f;
        rect.x += inset;
        rect.y += inset;
        rect.w -= 2.0f * inset;
        rect.h -= 2.0f * inset;
        SDL_RenderFillRect(renderer, &rect);
    }

    SDL_RenderPresent(renderer);
    VIEWER_DEBUG(std::format("Rendered tick {}", snapshot.tick));
}

} // namespace GridAgents
