#include "frontend.hpp"
#include "errors.hpp"
#include "ppu.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace {
// 4194304 Hz / 70224 dots per frame
const double TARGET_FRAME_TIME = 70224.0 / 4194304.0;

std::string strip_extension(const std::string& path) {
    size_t last_dot = path.find_last_of('.');
    size_t last_slash = path.find_last_of("/\\");
    if (last_dot == std::string::npos || (last_slash != std::string::npos && last_dot < last_slash)) {
        return path;
    }
    return path.substr(0, last_dot);
}
}

Frontend::Frontend() : window(nullptr), renderer(nullptr), texture(nullptr) {
}

Frontend::~Frontend() {
    cleanup();
}

bool Frontend::init(int scale) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
        std::cerr << "SDL initialization failed: " << SDL_GetError() << std::endl;
        return false;
    }

    // Create window with resizable flag
    window = SDL_CreateWindow(
        "Game Boy Emulator - Loading...",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        PPU::SCREEN_WIDTH * scale,
        PPU::SCREEN_HEIGHT * scale,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );

    if (!window) {
        std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
        return false;
    }

    // VSync would lock us to the host refresh rate, pacing is done by hand
    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
        return false;
    }

    // Set render quality to nearest neighbor for crisp pixels
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");

    texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_RGB24,
        SDL_TEXTUREACCESS_STREAMING,
        PPU::SCREEN_WIDTH,
        PPU::SCREEN_HEIGHT
    );

    if (!texture) {
        std::cerr << "Texture creation failed: " << SDL_GetError() << std::endl;
        return false;
    }

    return true;
}

bool Frontend::run(const FrontendOptions& options) {
    emulator = std::make_unique<Emulator>(options.config);

    if (!emulator->load_rom(options.rom_path)) {
        return false;
    }

    save_path = strip_extension(options.rom_path) + ".sav";
    load_battery();

    // Extract ROM name for window title
    std::string rom_name = strip_extension(options.rom_path);
    size_t last_slash = rom_name.find_last_of("/\\");
    if (last_slash != std::string::npos) {
        rom_name = rom_name.substr(last_slash + 1);
    }

    bool running = true;
    SDL_Event event;

    // FPS tracking
    auto last_fps_time = std::chrono::high_resolution_clock::now();
    int frame_count = 0;
    double fps = 0.0;

    while (running) {
        auto frame_start = std::chrono::high_resolution_clock::now();

        // Handle events
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            } else if (event.type == SDL_KEYDOWN) {
                handle_key(event.key, running);
            }
        }

        emulator->set_joypad_state(get_joypad_state());

        if (!emulator->run_frame()) {
            // CPU locked up; keep showing the last frame until the user quits or resets
            SDL_Delay(16);
        }

        render();

        // FPS calculation
        frame_count++;
        auto current_time = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double>(current_time - last_fps_time).count();

        if (elapsed >= 1.0) {
            fps = frame_count / elapsed;
            frame_count = 0;
            last_fps_time = current_time;

            std::ostringstream title;
            title << "Game Boy Emulator - " << rom_name << " | "
                  << std::fixed << std::setprecision(1) << fps << " FPS";
            if (emulator->has_fault()) {
                title << " | CPU locked up";
            }
            SDL_SetWindowTitle(window, title.str().c_str());
        }

        // Frame timing
        auto frame_end = std::chrono::high_resolution_clock::now();
        double frame_time = std::chrono::duration<double>(frame_end - frame_start).count();

        if (frame_time < TARGET_FRAME_TIME) {
            double sleep_time = TARGET_FRAME_TIME - frame_time;
            SDL_Delay((Uint32)(sleep_time * 1000));
        }
    }

    write_battery();
    return true;
}

void Frontend::handle_key(const SDL_KeyboardEvent& key, bool& running) {
    switch (key.keysym.sym) {
        case SDLK_ESCAPE:
            running = false;
            break;

        case SDLK_r:
            if (key.keysym.mod & KMOD_CTRL) {
                emulator->reset();
                std::cout << "Reset" << std::endl;
            }
            break;

        case SDLK_F5:
            quick_save = emulator->save_state();
            std::cout << "Saved state (" << quick_save.size() << " bytes)" << std::endl;
            break;

        case SDLK_F8:
            if (quick_save.empty()) {
                std::cout << "No saved state" << std::endl;
                break;
            }
            try {
                emulator->load_state(quick_save);
                std::cout << "Loaded state" << std::endl;
            } catch (const StateError& e) {
                std::cerr << "Failed to load state: " << e.what() << std::endl;
            }
            break;

        default:
            break;
    }
}

void Frontend::render() {
    SDL_UpdateTexture(texture, nullptr, emulator->get_screen(), PPU::SCREEN_WIDTH * 3);

    int win_w, win_h;
    SDL_GetWindowSize(window, &win_w, &win_h);

    // Calculate destination rectangle maintaining 160:144 aspect ratio
    float aspect = (float)PPU::SCREEN_WIDTH / PPU::SCREEN_HEIGHT;
    int dest_w, dest_h;
    if ((float)win_w / win_h > aspect) {
        dest_h = win_h;
        dest_w = (int)(win_h * aspect);
    } else {
        dest_w = win_w;
        dest_h = (int)(win_w / aspect);
    }

    SDL_Rect dest_rect;
    dest_rect.x = (win_w - dest_w) / 2;
    dest_rect.y = (win_h - dest_h) / 2;
    dest_rect.w = dest_w;
    dest_rect.h = dest_h;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, &dest_rect);
    SDL_RenderPresent(renderer);
}

uint8_t Frontend::get_joypad_state() {
    // SDL_PumpEvents is called by SDL_PollEvent in main loop
    const uint8_t* keys = SDL_GetKeyboardState(nullptr);
    uint8_t state = 0x00;

    auto press = [&state](Button button) {
        state |= 1 << static_cast<uint8_t>(button);
    };

    // Arrow keys for D-Pad
    if (keys[SDL_SCANCODE_UP])    press(Button::UP);
    if (keys[SDL_SCANCODE_DOWN])  press(Button::DOWN);
    if (keys[SDL_SCANCODE_LEFT])  press(Button::LEFT);
    if (keys[SDL_SCANCODE_RIGHT]) press(Button::RIGHT);

    if (keys[SDL_SCANCODE_X])     press(Button::A);
    if (keys[SDL_SCANCODE_Z])     press(Button::B);
    if (keys[SDL_SCANCODE_RSHIFT] || keys[SDL_SCANCODE_LSHIFT]) press(Button::SELECT);
    if (keys[SDL_SCANCODE_RETURN]) press(Button::START);

    // WASD + J/K alternative layout
    if (keys[SDL_SCANCODE_W])     press(Button::UP);
    if (keys[SDL_SCANCODE_S])     press(Button::DOWN);
    if (keys[SDL_SCANCODE_A])     press(Button::LEFT);
    if (keys[SDL_SCANCODE_D])     press(Button::RIGHT);
    if (keys[SDL_SCANCODE_K])     press(Button::A);
    if (keys[SDL_SCANCODE_J])     press(Button::B);

    return state;
}

// ============================================================================
// BATTERY RAM
// ============================================================================

void Frontend::load_battery() {
    if (!emulator->has_battery()) {
        return;
    }

    std::ifstream file(save_path, std::ios::binary);
    if (!file) {
        return;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    std::vector<uint8_t>& ram = emulator->battery_ram();
    if (data.size() != ram.size()) {
        std::cerr << "Ignoring " << save_path << ": " << data.size()
                  << " bytes, cartridge has " << ram.size() << std::endl;
        return;
    }

    ram = std::move(data);
    std::cout << "Loaded " << save_path << std::endl;
}

void Frontend::write_battery() {
    if (!emulator || !emulator->has_battery()) {
        return;
    }

    const std::vector<uint8_t>& ram = emulator->battery_ram();
    if (ram.empty()) {
        return;
    }

    std::ofstream file(save_path, std::ios::binary);
    if (!file) {
        std::cerr << "Failed to write " << save_path << std::endl;
        return;
    }
    file.write(reinterpret_cast<const char*>(ram.data()), ram.size());
    std::cout << "Wrote " << save_path << std::endl;
}

void Frontend::cleanup() {
    if (texture) {
        SDL_DestroyTexture(texture);
        texture = nullptr;
    }

    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }

    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }

    SDL_Quit();
}
