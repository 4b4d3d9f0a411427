#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

class InterruptController;
class StateTransfer;

/**
 * Game Boy PPU (Pixel Processing Unit) - Dot Accurate
 *
 * 160x144 pixels, 154 lines of 456 dots per frame (~59.73 Hz)
 * 4 dots per machine cycle at normal speed, 2 in CGB double speed
 *
 * Line breakdown:
 * - Lines 0-143: Visible
 *     Mode 2 (OAM scan)        80 dots, up to 10 sprites picked for the line
 *     Mode 3 (pixel transfer)  172-289 dots, fetcher + pixel FIFOs
 *     Mode 0 (HBlank)          rest of the 456 dots
 * - Lines 144-153: VBlank (mode 1)
 *
 * Mode 3 grows by SCX mod 8 (discarded pixels), by the window restarting
 * the fetcher, and by every sprite fetch. HBlank shrinks by the same amount.
 *
 * The frame is drawn into a back buffer and copied to the front buffer when
 * line 144 starts, so get_screen() never shows a partially drawn frame.
 */
class PPU {
public:
    static constexpr int SCREEN_WIDTH = 160;
    static constexpr int SCREEN_HEIGHT = 144;
    static constexpr int DOTS_PER_LINE = 456;
    static constexpr int LINES_PER_FRAME = 154;
    static constexpr int OAM_SCAN_DOTS = 80;
    static constexpr int MAX_SPRITES_PER_LINE = 10;

    enum class Mode : uint8_t {
        HBLANK = 0,
        VBLANK = 1,
        OAM_SCAN = 2,
        PIXEL_TRANSFER = 3
    };

    // Dots spent in each mode on one visible line
    struct LineTiming {
        uint16_t oam_scan;
        uint16_t pixel_transfer;
        uint16_t hblank;

        uint16_t total() const { return oam_scan + pixel_transfer + hblank; }
    };

    explicit PPU(InterruptController* interrupts);

    // cgb_mode: color rendering, VRAM banking and CGB registers
    // cgb_hardware: CGB running a DMG title (palettes still go through CGB color RAM)
    // post_boot: state the boot ROM leaves behind (LCD on, BGP=$FC)
    void reset(bool cgb_mode, bool cgb_hardware, bool post_boot);

    // Execute one dot
    void clock();

    // Execute several dots
    void advance(uint32_t dots);

    // ===== CPU ACCESS =====
    // The bus consults these before every VRAM/OAM access
    bool vram_accessible() const;
    bool oam_accessible() const;

    uint8_t read_vram(uint16_t addr) const;
    void write_vram(uint16_t addr, uint8_t data);
    uint8_t read_oam(uint16_t addr) const;
    void write_oam(uint16_t addr, uint8_t data);

    // OAM DMA target, ignores mode lockout
    void dma_write_oam(uint8_t index, uint8_t data) { oam[index] = data; }

    // $FF40-$FF45, $FF47-$FF4B, $FF4F, $FF68-$FF6B
    uint8_t read_register(uint16_t addr) const;
    void write_register(uint16_t addr, uint8_t data);

    // ===== OUTPUT =====
    // 160x144 RGB24
    const uint8_t* get_screen() const { return front_rgb.data(); }

    // 160x144 color indices (DMG: shade after BGP/OBP, CGB: index before palette)
    const uint8_t* get_shades() const { return front_shades.data(); }

    // Check if frame is complete (clears the flag)
    bool frame_complete();

    // Mode 0 entered on a visible line since the last call (HBlank DMA trigger)
    bool hblank_started();

    // ===== STATE INSPECTION =====
    Mode get_mode() const { return lcd_enabled() ? mode : Mode::HBLANK; }
    uint8_t get_ly() const { return ly; }
    uint16_t get_dot() const { return dot; }
    bool lcd_enabled() const { return lcdc & 0x80; }
    const LineTiming& get_last_line_timing() const { return last_timing; }
    uint64_t get_frame_count() const { return frame_count; }

    void transfer_state(StateTransfer& state);

private:
    InterruptController* interrupts;

    bool cgb;
    bool compat;  // CGB hardware, DMG title

    // ===== MEMORY =====
    std::array<uint8_t, 0x4000> vram;   // 2 x 8KB banks
    std::array<uint8_t, 0xA0> oam;
    std::array<uint8_t, 64> bg_palette_ram;
    std::array<uint8_t, 64> obj_palette_ram;
    uint8_t vram_bank;
    uint8_t bcps;
    uint8_t ocps;

    // ===== REGISTERS =====
    uint8_t lcdc;
    uint8_t stat;   // writable bits 3-6 only
    uint8_t scy;
    uint8_t scx;
    uint8_t ly;
    uint8_t lyc;
    uint8_t bgp;
    uint8_t obp0;
    uint8_t obp1;
    uint8_t wy;
    uint8_t wx;

    // ===== TIMING =====
    Mode mode;
    uint8_t line;     // internal line counter, LY differs on line 153
    uint16_t dot;
    bool stat_line;   // OR of enabled STAT sources, interrupt on rising edge
    bool frame_ready;
    bool hblank_flag;
    uint64_t frame_count;
    LineTiming current_timing;
    LineTiming last_timing;

    // ===== WINDOW =====
    bool window_y_triggered;
    bool window_active;
    bool window_drawn;
    uint8_t window_line;
    uint8_t window_discard;

    // ===== SPRITES =====
    struct Sprite {
        uint8_t y;
        uint8_t x;
        uint8_t tile;
        uint8_t attributes;
        uint8_t index;
        bool fetched;
    };

    std::array<Sprite, MAX_SPRITES_PER_LINE> line_sprites;
    uint8_t sprite_count;
    int8_t pending_sprite;
    uint8_t sprite_fetch_dots;

    // ===== PIXEL PIPELINE =====
    struct FifoPixel {
        uint8_t color;      // 2-bit color number
        uint8_t palette;    // DMG: OBP0/OBP1, CGB: palette 0-7
        uint8_t priority;   // BG-over-OBJ bit
        uint8_t oam_index;
    };

    struct PixelFifo {
        std::array<FifoPixel, 16> pixels;
        uint8_t head;
        uint8_t size;

        void clear() { head = 0; size = 0; }
        void push(const FifoPixel& pixel) { pixels[(head + size++) & 15] = pixel; }
        FifoPixel pop() { FifoPixel p = pixels[head]; head = (head + 1) & 15; size--; return p; }
        FifoPixel& at(uint8_t i) { return pixels[(head + i) & 15]; }
    };

    enum class FetchStep : uint8_t {
        TILE,
        DATA_LOW,
        DATA_HIGH,
        PUSH
    };

    struct Fetcher {
        FetchStep step;
        uint8_t sub_dot;    // each step but PUSH takes 2 dots
        uint8_t tile_x;
        uint8_t tile_id;
        uint8_t attributes;
        uint8_t row;
        uint8_t data_low;
        uint8_t data_high;
        bool window;
    };

    PixelFifo bg_fifo;
    PixelFifo obj_fifo;
    Fetcher fetcher;
    uint8_t lx;             // next screen column
    uint8_t scx_discard;
    uint8_t startup_dots;

    // ===== FRAME BUFFERS =====
    std::array<uint8_t, SCREEN_WIDTH * SCREEN_HEIGHT> back_shades;
    std::array<uint8_t, SCREEN_WIDTH * SCREEN_HEIGHT> front_shades;
    std::array<uint8_t, SCREEN_WIDTH * SCREEN_HEIGHT * 3> back_rgb;
    std::array<uint8_t, SCREEN_WIDTH * SCREEN_HEIGHT * 3> front_rgb;

    static const uint8_t dmg_colors[4][3];

    // Line/mode sequencing
    void start_oam_scan();
    void scan_oam_entry(uint8_t entry);
    void start_pixel_transfer();
    void enter_hblank();
    void next_line();
    void update_stat();
    void set_ly(uint8_t value);

    // Mode 3
    void transfer_dot();
    int find_sprite() const;
    bool fetcher_idle() const;
    void advance_fetcher();
    void reset_fetcher(bool window);
    void merge_sprite(const Sprite& sprite);
    void shift_pixel();
    void output_pixel(const FifoPixel& bg, const FifoPixel& obj);

    // Colors
    void palette_color(const std::array<uint8_t, 64>& ram, uint8_t palette, uint8_t color, uint8_t* rgb) const;
    void set_lcd_enabled(bool enabled);
};
