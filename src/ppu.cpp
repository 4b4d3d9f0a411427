#include "ppu.hpp"
#include "interrupts.hpp"
#include "save_state.hpp"

// DMG shades, lightest first
const uint8_t PPU::dmg_colors[4][3] = {
    {0xFF, 0xFF, 0xFF},
    {0xAA, 0xAA, 0xAA},
    {0x55, 0x55, 0x55},
    {0x00, 0x00, 0x00},
};

PPU::PPU(InterruptController* interrupts) : interrupts(interrupts) {
    reset(false, false, true);
}

void PPU::reset(bool cgb_mode, bool cgb_hardware, bool post_boot) {
    cgb = cgb_mode;
    compat = cgb_hardware && !cgb_mode;

    vram.fill(0x00);
    oam.fill(0x00);
    vram_bank = 0;
    bcps = 0x00;
    ocps = 0x00;

    // Color RAM powers up white
    bg_palette_ram.fill(0xFF);
    obj_palette_ram.fill(0xFF);
    if (compat) {
        // Grayscale in place of the boot ROM's per-title palette
        static const uint16_t grays[4] = {0x7FFF, 0x56B5, 0x294A, 0x0000};
        for (int i = 0; i < 4; i++) {
            for (int pal = 0; pal < 2; pal++) {
                obj_palette_ram[pal * 8 + i * 2] = grays[i] & 0xFF;
                obj_palette_ram[pal * 8 + i * 2 + 1] = grays[i] >> 8;
            }
            bg_palette_ram[i * 2] = grays[i] & 0xFF;
            bg_palette_ram[i * 2 + 1] = grays[i] >> 8;
        }
    }

    lcdc = post_boot ? 0x91 : 0x00;
    stat = 0x00;
    scy = 0x00;
    scx = 0x00;
    ly = 0x00;
    lyc = 0x00;
    bgp = post_boot ? 0xFC : 0x00;
    obp0 = 0xFF;
    obp1 = 0xFF;
    wy = 0x00;
    wx = 0x00;

    line = 0;
    dot = 0;
    stat_line = false;
    frame_ready = false;
    hblank_flag = false;
    frame_count = 0;
    current_timing = LineTiming{0, 0, 0};
    last_timing = LineTiming{0, 0, 0};

    window_y_triggered = false;
    window_active = false;
    window_drawn = false;
    window_line = 0;
    window_discard = 0;

    sprite_count = 0;
    pending_sprite = -1;
    sprite_fetch_dots = 0;

    bg_fifo.clear();
    obj_fifo.clear();
    reset_fetcher(false);
    lx = 0;
    scx_discard = 0;
    startup_dots = 0;

    back_shades.fill(0);
    front_shades.fill(0);
    back_rgb.fill(0xFF);
    front_rgb.fill(0xFF);

    mode = Mode::HBLANK;
    if (lcd_enabled()) {
        mode = Mode::OAM_SCAN;
        start_oam_scan();
    }
}

// ============================================================================
// DOT SEQUENCING
// ============================================================================

void PPU::advance(uint32_t dots) {
    for (uint32_t i = 0; i < dots; i++) {
        clock();
    }
}

void PPU::clock() {
    if (!lcd_enabled()) {
        return;
    }

    switch (mode) {
        case Mode::OAM_SCAN:
            // 2 dots per OAM entry, 40 entries
            if ((dot & 1) == 0) {
                scan_oam_entry(static_cast<uint8_t>(dot >> 1));
            }
            current_timing.oam_scan++;
            break;
        case Mode::PIXEL_TRANSFER:
            current_timing.pixel_transfer++;
            transfer_dot();
            break;
        case Mode::HBLANK:
            current_timing.hblank++;
            break;
        case Mode::VBLANK:
            break;
    }

    dot++;

    if (mode == Mode::OAM_SCAN && dot == OAM_SCAN_DOTS) {
        start_pixel_transfer();
    } else if (dot == DOTS_PER_LINE) {
        next_line();
    } else if (line == 153 && dot == 4) {
        // LY reads 0 for most of the last line
        set_ly(0);
    }

    update_stat();
}

void PPU::next_line() {
    if (line < SCREEN_HEIGHT) {
        last_timing = current_timing;
        if (window_drawn) {
            window_line++;
        }
    }
    current_timing = LineTiming{0, 0, 0};
    dot = 0;
    line++;

    if (line == SCREEN_HEIGHT) {
        mode = Mode::VBLANK;
        interrupts->request(Interrupt::VBLANK);

        front_shades = back_shades;
        front_rgb = back_rgb;
        frame_ready = true;
        frame_count++;
    } else if (line == LINES_PER_FRAME) {
        line = 0;
        window_line = 0;
        window_y_triggered = false;
        mode = Mode::OAM_SCAN;
    } else if (line < SCREEN_HEIGHT) {
        mode = Mode::OAM_SCAN;
    }

    set_ly(line);

    if (mode == Mode::OAM_SCAN) {
        start_oam_scan();
    }
}

void PPU::set_ly(uint8_t value) {
    ly = value;
}

void PPU::update_stat() {
    bool lyc_match = ly == lyc;
    bool signal = ((stat & 0x40) && lyc_match) ||
                  ((stat & 0x08) && mode == Mode::HBLANK) ||
                  ((stat & 0x10) && mode == Mode::VBLANK) ||
                  ((stat & 0x20) && mode == Mode::OAM_SCAN);

    if (signal && !stat_line) {
        interrupts->request(Interrupt::LCD_STAT);
    }
    stat_line = signal;
}

// ============================================================================
// MODE 2 - OAM SCAN
// ============================================================================

void PPU::start_oam_scan() {
    sprite_count = 0;
    window_drawn = false;
    if (ly == wy) {
        window_y_triggered = true;
    }
}

void PPU::scan_oam_entry(uint8_t entry) {
    if (sprite_count >= MAX_SPRITES_PER_LINE) {
        return;
    }

    uint8_t y = oam[entry * 4];
    uint8_t height = (lcdc & 0x04) ? 16 : 8;
    int top = static_cast<int>(y) - 16;

    if (ly >= top && ly < top + height) {
        Sprite& sprite = line_sprites[sprite_count++];
        sprite.y = y;
        sprite.x = oam[entry * 4 + 1];
        sprite.tile = oam[entry * 4 + 2];
        sprite.attributes = oam[entry * 4 + 3];
        sprite.index = entry;
        sprite.fetched = false;
    }
}

// ============================================================================
// MODE 3 - PIXEL TRANSFER
// ============================================================================

void PPU::start_pixel_transfer() {
    mode = Mode::PIXEL_TRANSFER;

    bg_fifo.clear();
    obj_fifo.clear();
    reset_fetcher(false);

    lx = 0;
    scx_discard = scx & 0x07;
    // First tile fetch of the line is thrown away
    startup_dots = 6;
    window_active = false;
    window_discard = 0;
    pending_sprite = -1;
    sprite_fetch_dots = 0;
}

void PPU::enter_hblank() {
    mode = Mode::HBLANK;
    hblank_flag = true;
}

void PPU::reset_fetcher(bool window) {
    fetcher.step = FetchStep::TILE;
    fetcher.sub_dot = 0;
    fetcher.tile_x = 0;
    fetcher.tile_id = 0;
    fetcher.attributes = 0;
    fetcher.row = 0;
    fetcher.data_low = 0;
    fetcher.data_high = 0;
    fetcher.window = window;
}

void PPU::transfer_dot() {
    if (startup_dots > 0) {
        startup_dots--;
        return;
    }

    // ===== SPRITE FETCH IN PROGRESS =====
    // The FIFO is stalled until the sprite's tile data is in
    if (pending_sprite >= 0) {
        if (--sprite_fetch_dots == 0) {
            Sprite& sprite = line_sprites[pending_sprite];
            merge_sprite(sprite);
            sprite.fetched = true;
            pending_sprite = -1;
        }
        return;
    }

    // ===== SPRITE HIT =====
    if (scx_discard == 0 && (lcdc & 0x02)) {
        int hit = find_sprite();
        if (hit >= 0) {
            // Let the background fetcher finish its tile first
            if (!fetcher_idle()) {
                advance_fetcher();
                if (!fetcher_idle()) {
                    return;
                }
            }
            pending_sprite = static_cast<int8_t>(hit);
            sprite_fetch_dots = 5;
            return;
        }
    }

    // ===== WINDOW START =====
    if (!window_active && (lcdc & 0x20) && window_y_triggered && scx_discard == 0 &&
        lx + 7 >= wx) {
        window_active = true;
        window_drawn = true;
        bg_fifo.clear();
        reset_fetcher(true);
        // WX below 7 scrolls the window's left edge off screen
        window_discard = wx < 7 ? 7 - wx : 0;
    }

    advance_fetcher();
    shift_pixel();
}

int PPU::find_sprite() const {
    // Lowest X first, OAM order breaks ties
    int best = -1;
    for (int i = 0; i < sprite_count; i++) {
        const Sprite& sprite = line_sprites[i];
        if (sprite.fetched || sprite.x > lx + 8) {
            continue;
        }
        if (best < 0 || sprite.x < line_sprites[best].x) {
            best = i;
        }
    }
    return best;
}

bool PPU::fetcher_idle() const {
    if (bg_fifo.size == 0) {
        return false;
    }
    return fetcher.step == FetchStep::PUSH ||
           (fetcher.step == FetchStep::TILE && fetcher.sub_dot == 0);
}

void PPU::advance_fetcher() {
    if (fetcher.step != FetchStep::PUSH && fetcher.sub_dot == 0) {
        // First dot of a 2-dot step
        fetcher.sub_dot = 1;
        return;
    }
    fetcher.sub_dot = 0;

    switch (fetcher.step) {
        case FetchStep::TILE: {
            uint16_t map;
            uint8_t x, y;
            if (fetcher.window) {
                map = (lcdc & 0x40) ? 0x1C00 : 0x1800;
                x = fetcher.tile_x & 0x1F;
                y = window_line;
            } else {
                map = (lcdc & 0x08) ? 0x1C00 : 0x1800;
                x = ((scx >> 3) + fetcher.tile_x) & 0x1F;
                y = static_cast<uint8_t>(ly + scy);
            }
            uint16_t addr = map + (y >> 3) * 32 + x;
            fetcher.tile_id = vram[addr];
            fetcher.attributes = cgb ? vram[0x2000 + addr] : 0x00;
            fetcher.row = y & 0x07;
            fetcher.step = FetchStep::DATA_LOW;
            break;
        }

        case FetchStep::DATA_LOW:
        case FetchStep::DATA_HIGH: {
            uint8_t row = (fetcher.attributes & 0x40) ? 7 - fetcher.row : fetcher.row;
            uint16_t base = (lcdc & 0x10) ? fetcher.tile_id * 16
                                          : 0x1000 + static_cast<int8_t>(fetcher.tile_id) * 16;
            uint16_t addr = ((fetcher.attributes & 0x08) ? 0x2000 : 0) + base + row * 2;
            if (fetcher.step == FetchStep::DATA_LOW) {
                fetcher.data_low = vram[addr];
                fetcher.step = FetchStep::DATA_HIGH;
            } else {
                fetcher.data_high = vram[addr + 1];
                fetcher.step = FetchStep::PUSH;
            }
            break;
        }

        case FetchStep::PUSH:
            // Only pushes into an empty FIFO
            if (bg_fifo.size != 0) {
                break;
            }
            for (int i = 0; i < 8; i++) {
                int bit = (fetcher.attributes & 0x20) ? i : 7 - i;
                FifoPixel pixel;
                pixel.color = (((fetcher.data_high >> bit) & 1) << 1) | ((fetcher.data_low >> bit) & 1);
                pixel.palette = fetcher.attributes & 0x07;
                pixel.priority = fetcher.attributes >> 7;
                pixel.oam_index = 0;
                bg_fifo.push(pixel);
            }
            fetcher.tile_x++;
            fetcher.step = FetchStep::TILE;
            break;
    }
}

void PPU::merge_sprite(const Sprite& sprite) {
    uint8_t height = (lcdc & 0x04) ? 16 : 8;
    uint8_t row = ly + 16 - sprite.y;
    if (sprite.attributes & 0x40) {
        row = height - 1 - row;
    }

    uint8_t tile = (height == 16) ? (sprite.tile & 0xFE) : sprite.tile;
    uint16_t addr = ((cgb && (sprite.attributes & 0x08)) ? 0x2000 : 0) + tile * 16 + row * 2;
    uint8_t low = vram[addr];
    uint8_t high = vram[addr + 1];

    for (int i = 0; i < 8; i++) {
        int column = static_cast<int>(sprite.x) - 8 + i;
        if (column < lx) {
            continue;
        }
        uint8_t pos = static_cast<uint8_t>(column - lx);
        while (obj_fifo.size <= pos) {
            obj_fifo.push(FifoPixel{0, 0, 0, 0xFF});
        }

        int bit = (sprite.attributes & 0x20) ? i : 7 - i;
        uint8_t color = (((high >> bit) & 1) << 1) | ((low >> bit) & 1);
        if (color == 0) {
            continue;
        }

        // DMG: first sprite fetched keeps the pixel. CGB: lower OAM index wins.
        FifoPixel& existing = obj_fifo.at(pos);
        if (existing.color == 0 || (cgb && sprite.index < existing.oam_index)) {
            existing.color = color;
            existing.palette = cgb ? (sprite.attributes & 0x07) : ((sprite.attributes >> 4) & 0x01);
            existing.priority = sprite.attributes >> 7;
            existing.oam_index = sprite.index;
        }
    }
}

void PPU::shift_pixel() {
    if (bg_fifo.size == 0) {
        return;
    }

    FifoPixel bg = bg_fifo.pop();
    if (scx_discard > 0) {
        scx_discard--;
        return;
    }
    if (window_discard > 0) {
        window_discard--;
        return;
    }

    FifoPixel obj{0, 0, 0, 0xFF};
    if (obj_fifo.size > 0) {
        obj = obj_fifo.pop();
    }

    output_pixel(bg, obj);
    lx++;

    if (lx == SCREEN_WIDTH) {
        enter_hblank();
    }
}

void PPU::palette_color(const std::array<uint8_t, 64>& ram, uint8_t palette, uint8_t color, uint8_t* rgb) const {
    uint16_t value = ram[palette * 8 + color * 2] | (ram[palette * 8 + color * 2 + 1] << 8);
    uint8_t r = value & 0x1F;
    uint8_t g = (value >> 5) & 0x1F;
    uint8_t b = (value >> 10) & 0x1F;
    rgb[0] = (r << 3) | (r >> 2);
    rgb[1] = (g << 3) | (g >> 2);
    rgb[2] = (b << 3) | (b >> 2);
}

void PPU::output_pixel(const FifoPixel& bg, const FifoPixel& obj) {
    size_t index = ly * SCREEN_WIDTH + lx;
    uint8_t* rgb = &back_rgb[index * 3];

    if (cgb) {
        // LCDC.0 clear takes away all background priority
        bool show_obj = (lcdc & 0x02) && obj.color != 0;
        if (show_obj && (lcdc & 0x01) && bg.color != 0 && (bg.priority || obj.priority)) {
            show_obj = false;
        }

        if (show_obj) {
            back_shades[index] = obj.color;
            palette_color(obj_palette_ram, obj.palette, obj.color, rgb);
        } else {
            back_shades[index] = bg.color;
            palette_color(bg_palette_ram, bg.palette, bg.color, rgb);
        }
        return;
    }

    // DMG: LCDC.0 clear blanks background and window to color 0
    uint8_t bg_color = (lcdc & 0x01) ? bg.color : 0;
    bool show_obj = (lcdc & 0x02) && obj.color != 0 && !(obj.priority && bg_color != 0);

    uint8_t shade;
    if (show_obj) {
        uint8_t palette = obj.palette ? obp1 : obp0;
        shade = (palette >> (obj.color * 2)) & 0x03;
        if (compat) {
            palette_color(obj_palette_ram, obj.palette, shade, rgb);
        }
    } else {
        shade = (bgp >> (bg_color * 2)) & 0x03;
        if (compat) {
            palette_color(bg_palette_ram, 0, shade, rgb);
        }
    }

    back_shades[index] = shade;
    if (!compat) {
        rgb[0] = dmg_colors[shade][0];
        rgb[1] = dmg_colors[shade][1];
        rgb[2] = dmg_colors[shade][2];
    }
}

// ============================================================================
// CPU INTERFACE
// ============================================================================

bool PPU::vram_accessible() const {
    return !lcd_enabled() || mode != Mode::PIXEL_TRANSFER;
}

bool PPU::oam_accessible() const {
    return !lcd_enabled() || (mode != Mode::OAM_SCAN && mode != Mode::PIXEL_TRANSFER);
}

uint8_t PPU::read_vram(uint16_t addr) const {
    return vram[vram_bank * 0x2000 + (addr & 0x1FFF)];
}

void PPU::write_vram(uint16_t addr, uint8_t data) {
    vram[vram_bank * 0x2000 + (addr & 0x1FFF)] = data;
}

uint8_t PPU::read_oam(uint16_t addr) const {
    return oam[addr - 0xFE00];
}

void PPU::write_oam(uint16_t addr, uint8_t data) {
    oam[addr - 0xFE00] = data;
}

uint8_t PPU::read_register(uint16_t addr) const {
    switch (addr) {
        case 0xFF40: return lcdc;
        case 0xFF41: {
            uint8_t mode_bits = lcd_enabled() ? static_cast<uint8_t>(mode) : 0;
            uint8_t coincidence = (lcd_enabled() && ly == lyc) ? 0x04 : 0x00;
            return 0x80 | (stat & 0x78) | coincidence | mode_bits;
        }
        case 0xFF42: return scy;
        case 0xFF43: return scx;
        case 0xFF44: return ly;
        case 0xFF45: return lyc;
        case 0xFF47: return bgp;
        case 0xFF48: return obp0;
        case 0xFF49: return obp1;
        case 0xFF4A: return wy;
        case 0xFF4B: return wx;
        case 0xFF4F: return cgb ? (0xFE | vram_bank) : 0xFF;
        case 0xFF68: return cgb ? (bcps | 0x40) : 0xFF;
        case 0xFF69:
            if (!cgb || !vram_accessible()) return 0xFF;
            return bg_palette_ram[bcps & 0x3F];
        case 0xFF6A: return cgb ? (ocps | 0x40) : 0xFF;
        case 0xFF6B:
            if (!cgb || !vram_accessible()) return 0xFF;
            return obj_palette_ram[ocps & 0x3F];
        default:
            return 0xFF;
    }
}

void PPU::write_register(uint16_t addr, uint8_t data) {
    switch (addr) {
        case 0xFF40: {
            bool was_enabled = lcd_enabled();
            lcdc = data;
            if (was_enabled != lcd_enabled()) {
                set_lcd_enabled(lcd_enabled());
            }
            break;
        }
        case 0xFF41:
            stat = data & 0x78;
            if (lcd_enabled()) update_stat();
            break;
        case 0xFF42: scy = data; break;
        case 0xFF43: scx = data; break;
        case 0xFF44: break;  // read only
        case 0xFF45:
            lyc = data;
            if (lcd_enabled()) update_stat();
            break;
        case 0xFF47: bgp = data; break;
        case 0xFF48: obp0 = data; break;
        case 0xFF49: obp1 = data; break;
        case 0xFF4A: wy = data; break;
        case 0xFF4B: wx = data; break;
        case 0xFF4F:
            if (cgb) vram_bank = data & 0x01;
            break;
        case 0xFF68:
            if (cgb) bcps = data & 0xBF;
            break;
        case 0xFF69:
            if (!cgb) break;
            if (vram_accessible()) bg_palette_ram[bcps & 0x3F] = data;
            // Index still advances when the write is blocked
            if (bcps & 0x80) bcps = 0x80 | ((bcps + 1) & 0x3F);
            break;
        case 0xFF6A:
            if (cgb) ocps = data & 0xBF;
            break;
        case 0xFF6B:
            if (!cgb) break;
            if (vram_accessible()) obj_palette_ram[ocps & 0x3F] = data;
            if (ocps & 0x80) ocps = 0x80 | ((ocps + 1) & 0x3F);
            break;
        default:
            break;
    }
}

void PPU::set_lcd_enabled(bool enabled) {
    line = 0;
    dot = 0;
    set_ly(0);
    current_timing = LineTiming{0, 0, 0};
    window_line = 0;
    window_y_triggered = false;

    if (enabled) {
        mode = Mode::OAM_SCAN;
        start_oam_scan();
        stat_line = false;
        update_stat();
    } else {
        // Blank screen while the LCD is off
        mode = Mode::HBLANK;
        stat_line = false;
        front_shades.fill(0);
        front_rgb.fill(0xFF);
    }
}

bool PPU::frame_complete() {
    bool ready = frame_ready;
    frame_ready = false;
    return ready;
}

bool PPU::hblank_started() {
    bool started = hblank_flag;
    hblank_flag = false;
    return started;
}

void PPU::transfer_state(StateTransfer& state) {
    state.transfer(vram);
    state.transfer(oam);
    state.transfer(bg_palette_ram);
    state.transfer(obj_palette_ram);
    state.transfer(vram_bank);
    state.transfer(bcps);
    state.transfer(ocps);

    state.transfer(lcdc);
    state.transfer(stat);
    state.transfer(scy);
    state.transfer(scx);
    state.transfer(ly);
    state.transfer(lyc);
    state.transfer(bgp);
    state.transfer(obp0);
    state.transfer(obp1);
    state.transfer(wy);
    state.transfer(wx);

    state.transfer(mode);
    state.transfer(line);
    state.transfer(dot);
    state.transfer(stat_line);
    state.transfer(frame_ready);
    state.transfer(hblank_flag);
    state.transfer(frame_count);
    state.transfer(current_timing);
    state.transfer(last_timing);

    state.transfer(window_y_triggered);
    state.transfer(window_active);
    state.transfer(window_drawn);
    state.transfer(window_line);
    state.transfer(window_discard);

    state.transfer(line_sprites);
    state.transfer(sprite_count);
    state.transfer(pending_sprite);
    state.transfer(sprite_fetch_dots);

    state.transfer(bg_fifo);
    state.transfer(obj_fifo);
    state.transfer(fetcher);
    state.transfer(lx);
    state.transfer(scx_discard);
    state.transfer(startup_dots);

    state.transfer(back_shades);
    state.transfer(back_rgb);
    state.transfer(front_shades);
    state.transfer(front_rgb);
}
