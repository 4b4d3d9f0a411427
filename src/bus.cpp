#include "bus.hpp"
#include "audio_unit.hpp"
#include "cartridge.hpp"
#include "interrupts.hpp"
#include "joypad.hpp"
#include "memory.hpp"
#include "ppu.hpp"
#include "save_state.hpp"
#include "serial.hpp"
#include "timer.hpp"

Bus::Bus()
    : memory(nullptr), ppu(nullptr), timer(nullptr), interrupts(nullptr),
      joypad(nullptr), serial(nullptr), audio(nullptr), cgb(false), boot_rom_enabled(false) {
    reset(false);
}

Bus::~Bus() = default;

void Bus::connect_memory(Memory* memory_ptr) {
    memory = memory_ptr;
}

void Bus::connect_ppu(PPU* ppu_ptr) {
    ppu = ppu_ptr;
}

void Bus::connect_timer(Timer* timer_ptr) {
    timer = timer_ptr;
}

void Bus::connect_interrupts(InterruptController* interrupts_ptr) {
    interrupts = interrupts_ptr;
}

void Bus::connect_joypad(Joypad* joypad_ptr) {
    joypad = joypad_ptr;
}

void Bus::connect_serial(Serial* serial_ptr) {
    serial = serial_ptr;
}

void Bus::connect_audio(AudioUnit* audio_ptr) {
    audio = audio_ptr;
}

void Bus::insert_cartridge(std::shared_ptr<Cartridge> cart) {
    cartridge = cart;
}

void Bus::set_boot_rom(std::vector<uint8_t> image) {
    boot_rom = std::move(image);
}

void Bus::reset(bool cgb_mode) {
    cgb = cgb_mode;
    boot_rom_enabled = !boot_rom.empty();
    audio_registers.fill(0x00);

    dma_requested = false;
    dma_active = false;
    dma_register = 0xFF;
    dma_index = 0;
    dma_delay = 0;

    hdma_source = 0x0000;
    hdma_dest = 0x0000;
    hdma_length = 0x7F;
    hdma_hblank_active = false;
    stall_cycles = 0;

    key1 = 0x00;
    double_speed = false;
}

// ============================================================================
// CPU ACCESS
// ============================================================================

bool Bus::boot_rom_covers(uint16_t addr) const {
    if (!boot_rom_enabled) {
        return false;
    }
    // CGB boot ROM leaves the cartridge header at $0100-$01FF visible
    if (addr < 0x0100) {
        return addr < boot_rom.size();
    }
    return addr >= 0x0200 && addr < boot_rom.size();
}

uint8_t Bus::cpu_read(uint16_t addr) {
    if (addr < 0x8000) {
        if (boot_rom_covers(addr)) {
            return boot_rom[addr];
        }
        return cartridge ? cartridge->read_rom(addr) : 0xFF;
    }

    if (addr < 0xA000) {
        // VRAM is locked while the PPU reads it
        return ppu->vram_accessible() ? ppu->read_vram(addr) : 0xFF;
    }

    if (addr < 0xC000) {
        uint8_t data = 0xFF;
        if (cartridge && cartridge->read_ram(addr, data)) {
            return data;
        }
        return 0xFF;
    }

    if (addr < 0xFE00) {
        return memory->read_wram(addr);
    }

    if (addr < 0xFEA0) {
        if (dma_active || !ppu->oam_accessible()) {
            return 0xFF;
        }
        return ppu->read_oam(addr);
    }

    if (addr < 0xFF00) {
        // Unusable area
        return (dma_active || !ppu->oam_accessible()) ? 0xFF : 0x00;
    }

    if (addr < 0xFF80) {
        return read_io(addr);
    }

    if (addr < 0xFFFF) {
        return memory->read_hram(addr);
    }

    return interrupts->read_enable();
}

void Bus::cpu_write(uint16_t addr, uint8_t data) {
    if (addr < 0x8000) {
        if (cartridge) {
            cartridge->write_control(addr, data);
        }
    } else if (addr < 0xA000) {
        if (ppu->vram_accessible()) {
            ppu->write_vram(addr, data);
        }
    } else if (addr < 0xC000) {
        if (cartridge) {
            cartridge->write_ram(addr, data);
        }
    } else if (addr < 0xFE00) {
        memory->write_wram(addr, data);
    } else if (addr < 0xFEA0) {
        if (!dma_active && ppu->oam_accessible()) {
            ppu->write_oam(addr, data);
        }
    } else if (addr < 0xFF00) {
        // Unusable area, writes ignored
    } else if (addr < 0xFF80) {
        write_io(addr, data);
    } else if (addr < 0xFFFF) {
        memory->write_hram(addr, data);
    } else {
        interrupts->write_enable(data);
    }
}

// ============================================================================
// I/O REGISTERS
// ============================================================================

uint8_t Bus::read_io(uint16_t addr) {
    if (addr >= 0xFF10 && addr <= 0xFF3F) {
        return audio ? audio->read_register(addr) : audio_registers[addr - 0xFF10];
    }

    switch (addr) {
        case 0xFF00: return joypad->read();
        case 0xFF01:
        case 0xFF02: return serial->read(addr);
        case 0xFF04:
        case 0xFF05:
        case 0xFF06:
        case 0xFF07: return timer->read(addr);
        case 0xFF0F: return interrupts->read_flags();

        case 0xFF40: case 0xFF41: case 0xFF42: case 0xFF43:
        case 0xFF44: case 0xFF45: case 0xFF47: case 0xFF48:
        case 0xFF49: case 0xFF4A: case 0xFF4B: case 0xFF4F:
        case 0xFF68: case 0xFF69: case 0xFF6A: case 0xFF6B:
            return ppu->read_register(addr);

        case 0xFF46: return dma_register;
        case 0xFF4D: return cgb ? (0x7E | (double_speed ? 0x80 : 0x00) | (key1 & 0x01)) : 0xFF;
        case 0xFF55:
            if (!cgb) return 0xFF;
            return hdma_hblank_active ? hdma_length : (0x80 | hdma_length);
        case 0xFF70: return memory->read_svbk();
        case 0xFF72: case 0xFF73: case 0xFF74: case 0xFF75:
            return memory->read_undocumented(addr);

        default:
            return 0xFF;
    }
}

void Bus::write_io(uint16_t addr, uint8_t data) {
    if (addr >= 0xFF10 && addr <= 0xFF3F) {
        if (audio) {
            audio->write_register(addr, data);
        } else {
            audio_registers[addr - 0xFF10] = data;
        }
        return;
    }

    switch (addr) {
        case 0xFF00: joypad->write(data); break;
        case 0xFF01:
        case 0xFF02: serial->write(addr, data); break;
        case 0xFF04:
        case 0xFF05:
        case 0xFF06:
        case 0xFF07: timer->write(addr, data); break;
        case 0xFF0F: interrupts->write_flags(data); break;

        case 0xFF40: case 0xFF41: case 0xFF42: case 0xFF43:
        case 0xFF44: case 0xFF45: case 0xFF47: case 0xFF48:
        case 0xFF49: case 0xFF4A: case 0xFF4B: case 0xFF4F:
        case 0xFF68: case 0xFF69: case 0xFF6A: case 0xFF6B:
            ppu->write_register(addr, data);
            break;

        case 0xFF46:
            // OAM DMA starts after the writing instruction
            dma_register = data;
            dma_requested = true;
            break;

        case 0xFF4D:
            if (cgb) key1 = (key1 & 0xFE) | (data & 0x01);
            break;

        case 0xFF50:
            if (data != 0) boot_rom_enabled = false;
            break;

        case 0xFF51: if (cgb) hdma_source = (hdma_source & 0x00FF) | (data << 8); break;
        case 0xFF52: if (cgb) hdma_source = (hdma_source & 0xFF00) | (data & 0xF0); break;
        case 0xFF53: if (cgb) hdma_dest = (hdma_dest & 0x00FF) | ((data & 0x1F) << 8); break;
        case 0xFF54: if (cgb) hdma_dest = (hdma_dest & 0xFF00) | (data & 0xF0); break;
        case 0xFF55: if (cgb) start_hdma(data); break;

        case 0xFF70: memory->write_svbk(data); break;
        case 0xFF72: case 0xFF73: case 0xFF74: case 0xFF75:
            memory->write_undocumented(addr, data);
            break;

        default:
            break;
    }
}

// ============================================================================
// DMA
// ============================================================================

uint8_t Bus::dma_read(uint16_t addr) {
    // $E000 and up read the work RAM behind the echo
    if (addr >= 0xE000) {
        addr -= 0x2000;
    }

    if (addr < 0x8000) {
        return cartridge ? cartridge->read_rom(addr) : 0xFF;
    }
    if (addr < 0xA000) {
        return ppu->read_vram(addr);
    }
    if (addr < 0xC000) {
        uint8_t data = 0xFF;
        if (cartridge && cartridge->read_ram(addr, data)) {
            return data;
        }
        return 0xFF;
    }
    return memory->read_wram(addr);
}

void Bus::clock(uint32_t machine_cycles) {
    // ===== OAM DMA =====
    if (dma_requested) {
        // Restarting mid-transfer begins again from byte 0
        dma_requested = false;
        dma_active = true;
        dma_index = 0;
        dma_delay = 1;
    } else {
        for (uint32_t i = 0; i < machine_cycles && dma_active; i++) {
            if (dma_delay > 0) {
                dma_delay--;
                continue;
            }
            uint16_t source = (dma_register << 8) | dma_index;
            ppu->dma_write_oam(dma_index, dma_read(source));
            dma_index++;
            if (dma_index == 160) {
                dma_active = false;
            }
        }
    }

    // ===== HBLANK VRAM DMA =====
    bool hblank = ppu->hblank_started();
    if (hblank && hdma_hblank_active) {
        copy_hdma_block();
        stall_cycles += double_speed ? 16 : 8;
        if (hdma_length == 0) {
            hdma_hblank_active = false;
            hdma_length = 0x7F;
        } else {
            hdma_length--;
        }
    }
}

void Bus::start_hdma(uint8_t data) {
    if (hdma_hblank_active && !(data & 0x80)) {
        // Cancel a running HBlank transfer, FF55 then reports the blocks left
        hdma_hblank_active = false;
        return;
    }

    hdma_length = data & 0x7F;

    if (data & 0x80) {
        hdma_hblank_active = true;
        return;
    }

    // General purpose: everything at once, the CPU waits
    uint32_t blocks = hdma_length + 1;
    for (uint32_t i = 0; i < blocks; i++) {
        copy_hdma_block();
    }
    stall_cycles += blocks * (double_speed ? 16 : 8);
    hdma_length = 0x7F;
}

void Bus::copy_hdma_block() {
    for (int i = 0; i < 16; i++) {
        uint8_t value = dma_read(hdma_source);
        ppu->write_vram(0x8000 | (hdma_dest & 0x1FFF), value);
        hdma_source++;
        hdma_dest++;
    }
}

uint32_t Bus::take_stall_cycles() {
    uint32_t cycles = stall_cycles;
    stall_cycles = 0;
    return cycles;
}

void Bus::perform_speed_switch() {
    double_speed = !double_speed;
    key1 &= 0xFE;
    timer->write(0xFF04, 0x00);
    timer->set_double_speed(double_speed);
}

void Bus::transfer_state(StateTransfer& state) {
    state.transfer(boot_rom_enabled);
    state.transfer(audio_registers);

    state.transfer(dma_requested);
    state.transfer(dma_active);
    state.transfer(dma_register);
    state.transfer(dma_index);
    state.transfer(dma_delay);

    state.transfer(hdma_source);
    state.transfer(hdma_dest);
    state.transfer(hdma_length);
    state.transfer(hdma_hblank_active);
    state.transfer(stall_cycles);

    state.transfer(key1);
    state.transfer(double_speed);
}
