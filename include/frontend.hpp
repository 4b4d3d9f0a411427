#pragma once

#include <SDL2/SDL.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "emulator.hpp"

/**
 * Command line options for the SDL front end
 */
struct FrontendOptions {
    std::string rom_path;
    EmulatorConfig config;
    int scale = 3;
};

/**
 * SDL2 Frontend
 *
 * Features:
 * - FPS counter in window title
 * - Aspect ratio preservation on window resize
 * - Battery RAM kept in a .sav file next to the ROM
 * - F5 quick save / F8 quick load (in memory)
 * - Ctrl+R to reset emulator
 * - Frame pacing at the Game Boy's ~59.73 Hz
 *
 * Handles video output and input. There is no sound output.
 */
class Frontend {
public:
    Frontend();
    ~Frontend();

    // Initialize SDL video
    bool init(int scale);

    // Run emulator with ROM until the window is closed
    bool run(const FrontendOptions& options);

private:
    SDL_Window* window;
    SDL_Renderer* renderer;
    SDL_Texture* texture;

    std::unique_ptr<Emulator> emulator;
    std::string save_path;
    std::vector<uint8_t> quick_save;

    // Input handling
    uint8_t get_joypad_state();

    // Battery RAM
    void load_battery();
    void write_battery();

    void handle_key(const SDL_KeyboardEvent& key, bool& running);
    void render();

    // Cleanup
    void cleanup();
};
