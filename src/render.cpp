#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>

namespace {

std::string baseTitle() {
    return std::string(UNDERCROFT_APPNAME) + " v" + UNDERCROFT_VERSION;
}

} // namespace

MapView::MapView(int mapWidth, int mapHeight, int tileSize, bool vsync)
    : mapW(mapWidth), mapH(mapHeight), tile(tileSize), vsyncEnabled(vsync) {}

MapView::~MapView() {
    shutdown();
}

bool MapView::init() {
    if (renderer) return true;

    const int pixelW = mapW * tile;
    const int pixelH = mapH * tile;

    window = SDL_CreateWindow(baseTitle().c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              pixelW, pixelH, SDL_WINDOW_SHOWN);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    const Uint32 flags = SDL_RENDERER_ACCELERATED | (vsyncEnabled ? SDL_RENDERER_PRESENTVSYNC : 0u);
    renderer = SDL_CreateRenderer(window, -1, flags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        shutdown();
        return false;
    }

    return true;
}

void MapView::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
}

Color MapView::tileColor(TileKind k) {
    switch (k) {
        case TileKind::Void:        return {8, 8, 12, 255};
        case TileKind::Placeholder: return {200, 60, 200, 255};
        case TileKind::Wall:        return {70, 80, 96, 255};
        case TileKind::Floor:       return {168, 156, 128, 255};
        case TileKind::StairsDown:  return {90, 200, 255, 255};
        default:                    return {255, 0, 0, 255};
    }
}

void MapView::fillTile(int x, int y, int inset, const Color& c) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    const SDL_Rect r = {x * tile + inset, y * tile + inset, tile - 2 * inset, tile - 2 * inset};
    SDL_RenderFillRect(renderer, &r);
}

void MapView::render(const Grid& map, Vec2i start) {
    if (!renderer) return;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    const int w = std::min(map.width, mapW);
    const int h = std::min(map.height, mapH);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            fillTile(x, y, 0, tileColor(map.at(x, y)));
        }
    }

    // Player start marker
    if (map.inBounds(start.x, start.y)) {
        fillTile(start.x, start.y, std::max(1, tile / 4), Color{255, 220, 60, 255});
    }

    SDL_RenderPresent(renderer);
}

void MapView::setTitle(const std::string& status) {
    if (!window) return;
    const std::string title = status.empty() ? baseTitle() : baseTitle() + " - " + status;
    SDL_SetWindowTitle(window, title.c_str());
}
