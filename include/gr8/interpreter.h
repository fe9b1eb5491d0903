/**
 * @file interpreter.h
 * @brief The CHIP-8 virtual machine.
 *
 * Owns the complete machine state (memory, registers, stack, timers,
 * keypad, framebuffer) and is its only mutator. A driver loop feeds it
 * input and elapsed time, calls update() to execute instructions and
 * reads the framebuffer back.
 *
 * ## Execution model
 * @verbatim
 *   Running ──[FX0A]──> AwaitingKeypress ──[key released->pressed]──> Running
 * @endverbatim
 * In AwaitingKeypress, update() makes no progress until a key goes from
 * released to pressed; that update stores the key and does not fetch.
 *
 * ## Error model
 * update() and load() return Result<T>. Execution faults (stack over- or
 * underflow, out-of-range memory, 0NNN, undecodable words) are fatal to
 * the run and leave the machine exactly as it was before the faulting
 * instruction, including the program counter.
 *
 * ## Thread Safety
 * None. All calls must come from one thread.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/config.h>
#include <gr8/error.h>
#include <gr8/layout.h>
#include <gr8/memory.h>
#include <gr8/opcode.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <span>

namespace gr8 {

/**
 * @brief Outcome of a successful update().
 */
enum class Status : uint8_t {
    Working
};

enum class ExecutionMode : uint8_t {
    Running,
    AwaitingKeypress
};

[[nodiscard]] constexpr const char* to_string(ExecutionMode mode) noexcept {
    switch (mode) {
        case ExecutionMode::Running:          return "Running";
        case ExecutionMode::AwaitingKeypress: return "AwaitingKeypress";
    }
    return "Unknown";
}

class Interpreter {
public:
    using Registers = std::array<uint8_t, layout::kRegisterCount>;
    using Keys = std::array<uint8_t, layout::kKeyCount>;
    using Display = std::array<uint8_t, layout::kDisplaySize>;

    /**
     * @brief Build a machine with the font installed and PC at 0x200.
     * @throws ConfigException if @p config fails validation
     */
    explicit Interpreter(InterpreterConfig config = InterpreterConfig::defaults());

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;
    Interpreter(Interpreter&&) noexcept = default;
    Interpreter& operator=(Interpreter&&) noexcept = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Return to power-on state: zeroed memory with the font, cleared
     * registers, stack, timers, keys and display. Reseeds a deterministic RNG.
     */
    void reset();

    /**
     * @brief Reset the machine and copy @p rom to 0x200.
     *
     * Fails with RomTooLarge when rom.size() > 3584; in that case nothing
     * is modified.
     */
    [[nodiscard]] Result<void> load(std::span<const uint8_t> rom);

    /**
     * @brief Execute one fetch-decode-execute step.
     */
    [[nodiscard]] Result<Status> update();

    // ─────────────────────────────────────────────────────────────────────────
    // Time
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Feed elapsed host time; timers drop once per 1/timer_hz s.
     */
    void advance_clock_us(uint64_t elapsed_us) noexcept;

    void advance_clock_ms(uint64_t elapsed_ms) noexcept {
        advance_clock_us(elapsed_ms * 1000);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Input
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @pre index < 16
     */
    void set_key(size_t index, bool pressed);

    void set_keys(std::span<const uint8_t, layout::kKeyCount> keys) noexcept;

    [[nodiscard]] const Keys& keys() const noexcept { return keys_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Framebuffer
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Row-major 64x32 framebuffer, one byte (0 or 1) per pixel.
     */
    [[nodiscard]] std::span<const uint8_t, layout::kDisplaySize> display() const noexcept {
        return display_;
    }

    /**
     * @pre x < 64 && y < 32
     */
    [[nodiscard]] bool pixel(size_t x, size_t y) const;

    /**
     * @brief True once after anything changed the framebuffer.
     */
    [[nodiscard]] bool take_redraw() noexcept {
        const bool redraw = redraw_;
        redraw_ = false;
        return redraw;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const Registers& registers() const noexcept { return v_; }

    /**
     * @pre index < 16
     */
    [[nodiscard]] uint8_t register_value(size_t index) const;

    /**
     * @pre index < 16
     */
    void set_register(size_t index, uint8_t value);

    [[nodiscard]] uint16_t index_register() const noexcept { return i_; }
    [[nodiscard]] uint16_t program_counter() const noexcept { return pc_; }
    [[nodiscard]] size_t stack_depth() const noexcept { return sp_; }
    [[nodiscard]] uint8_t delay_timer() const noexcept { return delay_timer_; }
    [[nodiscard]] uint8_t sound_timer() const noexcept { return sound_timer_; }
    [[nodiscard]] bool sound_active() const noexcept { return sound_timer_ > 0; }
    [[nodiscard]] ExecutionMode mode() const noexcept { return mode_; }
    [[nodiscard]] std::span<const uint8_t> memory() const noexcept { return memory_.as_span(); }

    /**
     * @brief Instructions executed since the last reset.
     */
    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_; }

    /**
     * @brief FNV-1a 64 over all machine state.
     *
     * Includes the undelivered timer fraction and the FX0A key snapshot,
     * since both decide what the next update does.
     *
     * Two machines with the same seed fed the same inputs and elapsed time
     * produce the same hash after the same number of updates.
     */
    [[nodiscard]] uint64_t state_hash() const noexcept;

    [[nodiscard]] const InterpreterConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] Result<void> execute(const Opcode& op, uint16_t word);
    [[nodiscard]] Result<void> draw(const Opcode& op, uint16_t word);
    void poll_keypress() noexcept;
    void install_font();
    void seed_rng();
    [[nodiscard]] uint8_t random_byte();

    InterpreterConfig config_;
    GuestMemory memory_;

    Registers v_{};
    uint16_t i_ = 0;
    uint16_t pc_ = layout::kProgramStart;
    std::array<uint16_t, layout::kStackDepth> stack_{};
    size_t sp_ = 0;

    uint8_t delay_timer_ = 0;
    uint8_t sound_timer_ = 0;
    uint64_t timer_accum_ = 0;  // elapsed_us * timer_hz not yet turned into ticks

    Keys keys_{};
    Display display_{};
    bool redraw_ = true;

    ExecutionMode mode_ = ExecutionMode::Running;
    uint8_t wait_register_ = 0;
    Keys key_snapshot_{};

    uint64_t cycles_ = 0;
    std::mt19937 rng_;
};

} // namespace gr8
