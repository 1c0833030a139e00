#pragma once
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif
#include <SDL.h>

#include "common.hpp"
#include "grid.hpp"

#include <string>

// Flat-colour tile view used to play back generation history.
class MapView {
public:
    MapView(int mapW, int mapH, int tileSize, bool vsync);
    ~MapView();

    MapView(const MapView&) = delete;
    MapView& operator=(const MapView&) = delete;

    bool init();
    void shutdown();

    // Draws `map`; a start of (-1,-1) is not marked.
    void render(const Grid& map, Vec2i start);

    // Status text goes in the title bar after the app name.
    void setTitle(const std::string& status);

private:
    static Color tileColor(TileKind k);
    void fillTile(int x, int y, int inset, const Color& c);

    int mapW = 0;
    int mapH = 0;
    int tile = 12;
    bool vsyncEnabled = true;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
};
