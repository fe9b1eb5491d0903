/**
 * @file interpreter.cpp
 * @brief Fetch-decode-execute loop and instruction semantics.
 *
 * Every instruction computes its effects into locals, validates them and
 * only then commits, so a faulting instruction changes nothing. Where an
 * instruction writes both a result register and VF, the result is
 * written first and VF last.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/interpreter.h"

#include "gr8/contracts.h"
#include "gr8/exceptions.h"
#include "gr8/logging.h"

#include <gsl-lite/gsl-lite.hpp>

#include <algorithm>

namespace gr8 {

namespace {

constexpr uint32_t kUsPerSecond = 1'000'000;
constexpr size_t kVF = layout::kFlagRegister;

Error memory_fault(uint16_t word, uint32_t addr, size_t len,
                   std::source_location where = std::source_location::current()) {
    return Error::formatted(where, ErrorCode::MemoryOutOfBounds,
                            "access of %zu byte(s) at 0x%04X exceeds guest memory",
                            len, static_cast<unsigned>(addr))
        .with_instruction(word);
}

// FNV-1a, 64-bit.
class Fnv1a {
public:
    void add(std::span<const uint8_t> bytes) noexcept {
        for (uint8_t b : bytes) {
            hash_ ^= b;
            hash_ *= 0x100000001b3ULL;
        }
    }

    void add(uint64_t value) noexcept {
        for (int shift = 0; shift < 64; shift += 8) {
            hash_ ^= static_cast<uint8_t>(value >> shift);
            hash_ *= 0x100000001b3ULL;
        }
    }

    [[nodiscard]] uint64_t value() const noexcept { return hash_; }

private:
    uint64_t hash_ = 0xcbf29ce484222325ULL;
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Interpreter::Interpreter(InterpreterConfig config)
    : config_(config)
    , memory_(layout::kMemorySize)
{
    const auto problems = config_.validate();
    if (!problems.empty()) {
        throw ConfigException("interpreter", problems.front());
    }
    reset();
}

void Interpreter::reset() {
    memory_.fill(0, 0, memory_.size());
    install_font();

    v_.fill(0);
    i_ = 0;
    pc_ = layout::kProgramStart;
    stack_.fill(0);
    sp_ = 0;

    delay_timer_ = 0;
    sound_timer_ = 0;
    timer_accum_ = 0;

    keys_.fill(0);
    display_.fill(0);
    redraw_ = true;

    mode_ = ExecutionMode::Running;
    wait_register_ = 0;
    key_snapshot_.fill(0);

    cycles_ = 0;
    seed_rng();
}

void Interpreter::install_font() {
    memory_.write_block(layout::kFontBase, layout::kFontGlyphs);
}

void Interpreter::seed_rng() {
    if (config_.deterministic) {
        std::seed_seq seq{static_cast<uint32_t>(config_.rng_seed),
                          static_cast<uint32_t>(config_.rng_seed >> 32)};
        rng_.seed(seq);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

uint8_t Interpreter::random_byte() {
    std::uniform_int_distribution<int> dist(0, 255);
    return static_cast<uint8_t>(dist(rng_));
}

Result<void> Interpreter::load(std::span<const uint8_t> rom) {
    GR8_REQUIRE_FMT(rom.size() <= layout::kMaxRomSize, ErrorCode::RomTooLarge,
                    "ROM is %zu bytes; at most %zu fit at 0x200",
                    rom.size(), layout::kMaxRomSize);

    reset();
    memory_.write_block(layout::kProgramStart, rom);
    GR8_LOG_DEBUG("CPU", "Loaded %zu byte program at 0x%03X",
                  rom.size(), static_cast<unsigned>(layout::kProgramStart));
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

Result<Status> Interpreter::update() {
    if (mode_ == ExecutionMode::AwaitingKeypress) {
        poll_keypress();
        return Status::Working;
    }

    if (!memory_.in_bounds(pc_, 2)) {
        return Err(GR8_ERROR(ErrorCode::MemoryOutOfBounds,
                             "instruction fetch at 0x%04X runs past guest memory",
                             static_cast<unsigned>(pc_)));
    }

    const uint16_t word = memory_.read16_be(pc_);
    auto op = decode_word(word);
    if (!op) {
        GR8_LOG_DEBUG("CPU", "Undecodable word 0x%04X at 0x%03X",
                      static_cast<unsigned>(word), static_cast<unsigned>(pc_));
        return Err(std::move(op).error());
    }

    GR8_LOG_TRACE("CPU", "%03X: %04X  %s", static_cast<unsigned>(pc_),
                  static_cast<unsigned>(word), mnemonic(*op).c_str());

    auto executed = execute(*op, word);
    if (!executed) {
        GR8_LOG_DEBUG("CPU", "Fault at 0x%03X: %s", static_cast<unsigned>(pc_),
                      executed.error().message().c_str());
        return Err(std::move(executed).error());
    }
    GR8_ASSERT(sp_ <= layout::kStackDepth, "stack pointer past the call stack");

    ++cycles_;
    return Status::Working;
}

void Interpreter::poll_keypress() noexcept {
    for (size_t k = 0; k < layout::kKeyCount; ++k) {
        if (keys_[k] && !key_snapshot_[k]) {
            v_[wait_register_] = static_cast<uint8_t>(k);
            mode_ = ExecutionMode::Running;
            GR8_LOG_TRACE("CPU", "Key %X satisfied wait on V%X",
                          static_cast<unsigned>(k), static_cast<unsigned>(wait_register_));
            return;
        }
    }
    // Keys released since the wait began become eligible again.
    for (size_t k = 0; k < layout::kKeyCount; ++k) {
        key_snapshot_[k] = static_cast<uint8_t>(key_snapshot_[k] && keys_[k]);
    }
}

Result<void> Interpreter::execute(const Opcode& op, uint16_t word) {
    uint16_t next_pc = static_cast<uint16_t>(pc_ + 2);
    const uint8_t vx = v_[op.x()];
    const uint8_t vy = v_[op.y()];

    switch (op.operation()) {
        case Operation::SysCall:
            return Err(GR8_ERROR(ErrorCode::UnsupportedOpcode,
                                 "machine code routine 0x%03X is not supported",
                                 static_cast<unsigned>(op.nnn()))
                           .with_instruction(word));

        case Operation::ClearScreen:
            display_.fill(0);
            redraw_ = true;
            break;

        case Operation::Return:
            if (sp_ == 0) {
                return Err(Error(ErrorCode::StackUnderflow, "return with empty stack")
                               .with_instruction(word));
            }
            --sp_;
            next_pc = stack_[sp_];
            break;

        case Operation::Jump:
            next_pc = op.nnn();
            break;

        case Operation::Call:
            if (sp_ == layout::kStackDepth) {
                return Err(GR8_ERROR(ErrorCode::StackOverflow,
                                     "call to 0x%03X with %zu frames already on the stack",
                                     static_cast<unsigned>(op.nnn()), sp_)
                               .with_instruction(word));
            }
            stack_[sp_++] = next_pc;
            next_pc = op.nnn();
            break;

        case Operation::SkipEqImm:
            if (vx == op.kk()) next_pc = static_cast<uint16_t>(next_pc + 2);
            break;

        case Operation::SkipNeImm:
            if (vx != op.kk()) next_pc = static_cast<uint16_t>(next_pc + 2);
            break;

        case Operation::SkipEqReg:
            if (vx == vy) next_pc = static_cast<uint16_t>(next_pc + 2);
            break;

        case Operation::SkipNeReg:
            if (vx != vy) next_pc = static_cast<uint16_t>(next_pc + 2);
            break;

        case Operation::LoadImm:
            v_[op.x()] = op.kk();
            break;

        case Operation::AddImm:
            v_[op.x()] = static_cast<uint8_t>(vx + op.kk());
            break;

        case Operation::Move:
            v_[op.x()] = vy;
            break;

        case Operation::Or:
            v_[op.x()] = static_cast<uint8_t>(vx | vy);
            break;

        case Operation::And:
            v_[op.x()] = static_cast<uint8_t>(vx & vy);
            break;

        case Operation::Xor:
            v_[op.x()] = static_cast<uint8_t>(vx ^ vy);
            break;

        case Operation::AddReg: {
            const unsigned sum = static_cast<unsigned>(vx) + vy;
            v_[op.x()] = static_cast<uint8_t>(sum);
            v_[kVF] = sum > 0xFF ? 1 : 0;
            break;
        }

        case Operation::SubReg:
            v_[op.x()] = static_cast<uint8_t>(vx - vy);
            v_[kVF] = vx >= vy ? 1 : 0;
            break;

        case Operation::ShiftRight:
            v_[op.x()] = static_cast<uint8_t>(vx >> 1);
            v_[kVF] = vx & 0x1;
            break;

        case Operation::SubReversed:
            v_[op.x()] = static_cast<uint8_t>(vy - vx);
            v_[kVF] = vy >= vx ? 1 : 0;
            break;

        case Operation::ShiftLeft:
            v_[op.x()] = static_cast<uint8_t>(vx << 1);
            v_[kVF] = static_cast<uint8_t>(vx >> 7);
            break;

        case Operation::LoadIndex:
            i_ = op.nnn();
            break;

        case Operation::JumpOffset:
            next_pc = static_cast<uint16_t>(op.nnn() + v_[0]);
            break;

        case Operation::Random:
            v_[op.x()] = static_cast<uint8_t>(random_byte() & op.kk());
            break;

        case Operation::Draw: {
            auto drawn = draw(op, word);
            if (!drawn) {
                return drawn;
            }
            break;
        }

        case Operation::SkipKeyDown:
            if (keys_[vx & 0xF]) next_pc = static_cast<uint16_t>(next_pc + 2);
            break;

        case Operation::SkipKeyUp:
            if (!keys_[vx & 0xF]) next_pc = static_cast<uint16_t>(next_pc + 2);
            break;

        case Operation::LoadDelay:
            v_[op.x()] = delay_timer_;
            break;

        case Operation::WaitKey:
            key_snapshot_ = keys_;
            wait_register_ = op.x();
            mode_ = ExecutionMode::AwaitingKeypress;
            break;

        case Operation::SetDelay:
            delay_timer_ = vx;
            break;

        case Operation::SetSound:
            sound_timer_ = vx;
            break;

        case Operation::AddIndex:
            i_ = static_cast<uint16_t>(i_ + vx);
            break;

        case Operation::LoadGlyph:
            i_ = static_cast<uint16_t>(layout::kFontBase + layout::kGlyphBytes * (vx & 0xF));
            break;

        case Operation::StoreBcd:
            if (!memory_.in_bounds(i_, 3)) {
                return Err(memory_fault(word, i_, 3));
            }
            memory_.write8(i_, static_cast<uint8_t>(vx / 100));
            memory_.write8(i_ + 1u, static_cast<uint8_t>((vx / 10) % 10));
            memory_.write8(i_ + 2u, static_cast<uint8_t>(vx % 10));
            break;

        case Operation::StoreRegisters: {
            const size_t count = static_cast<size_t>(op.x()) + 1;
            if (!memory_.in_bounds(i_, count)) {
                return Err(memory_fault(word, i_, count));
            }
            memory_.write_block(i_, std::span<const uint8_t>(v_.data(), count));
            break;
        }

        case Operation::LoadRegisters: {
            const size_t count = static_cast<size_t>(op.x()) + 1;
            if (!memory_.in_bounds(i_, count)) {
                return Err(memory_fault(word, i_, count));
            }
            memory_.read_block(i_, std::span<uint8_t>(v_.data(), count));
            break;
        }
    }

    pc_ = next_pc;
    return Ok();
}

Result<void> Interpreter::draw(const Opcode& op, uint16_t word) {
    const size_t height = op.n();
    if (height > 0 && !memory_.in_bounds(i_, height)) {
        return Err(memory_fault(word, i_, height));
    }

    const size_t x0 = v_[op.x()] % layout::kDisplayWidth;
    const size_t y0 = v_[op.y()] % layout::kDisplayHeight;
    const bool wrap = config_.sprite_edge == SpriteEdge::Wrap;
    uint8_t collision = 0;

    for (size_t row = 0; row < height; ++row) {
        size_t py = y0 + row;
        if (py >= layout::kDisplayHeight) {
            if (!wrap) break;
            py %= layout::kDisplayHeight;
        }

        const uint8_t bits = memory_.read8(static_cast<uint32_t>(i_ + row));
        for (size_t col = 0; col < 8; ++col) {
            if ((bits & (0x80u >> col)) == 0) continue;

            size_t px = x0 + col;
            if (px >= layout::kDisplayWidth) {
                if (!wrap) break;
                px %= layout::kDisplayWidth;
            }

            uint8_t& cell = display_[py * layout::kDisplayWidth + px];
            if (cell) collision = 1;
            cell ^= 1;
        }
    }

    v_[kVF] = collision;
    redraw_ = true;
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Time and input
// ─────────────────────────────────────────────────────────────────────────────

void Interpreter::advance_clock_us(uint64_t elapsed_us) noexcept {
    timer_accum_ += elapsed_us * config_.timer_hz;
    const uint64_t ticks = timer_accum_ / kUsPerSecond;
    timer_accum_ %= kUsPerSecond;
    if (ticks == 0) {
        return;
    }

    delay_timer_ = ticks >= delay_timer_ ? 0 : static_cast<uint8_t>(delay_timer_ - ticks);
    sound_timer_ = ticks >= sound_timer_ ? 0 : static_cast<uint8_t>(sound_timer_ - ticks);
}

void Interpreter::set_key(size_t index, bool pressed) {
    gsl_Expects(index < layout::kKeyCount);
    keys_[index] = pressed ? 1 : 0;
}

void Interpreter::set_keys(std::span<const uint8_t, layout::kKeyCount> keys) noexcept {
    std::transform(keys.begin(), keys.end(), keys_.begin(),
                   [](uint8_t k) { return static_cast<uint8_t>(k ? 1 : 0); });
}

bool Interpreter::pixel(size_t x, size_t y) const {
    gsl_Expects(x < layout::kDisplayWidth && y < layout::kDisplayHeight);
    return display_[y * layout::kDisplayWidth + x] != 0;
}

uint8_t Interpreter::register_value(size_t index) const {
    gsl_Expects(index < layout::kRegisterCount);
    return v_[index];
}

void Interpreter::set_register(size_t index, uint8_t value) {
    gsl_Expects(index < layout::kRegisterCount);
    v_[index] = value;
}

uint64_t Interpreter::state_hash() const noexcept {
    Fnv1a h;
    h.add(memory_.as_span());
    h.add(v_);
    h.add(i_);
    h.add(pc_);
    h.add(static_cast<uint64_t>(sp_));
    for (uint16_t ret : stack_) {
        h.add(ret);
    }
    h.add(delay_timer_);
    h.add(sound_timer_);
    h.add(timer_accum_);
    h.add(keys_);
    h.add(display_);
    h.add(static_cast<uint64_t>(mode_));
    h.add(wait_register_);
    h.add(key_snapshot_);
    return h.value();
}

} // namespace gr8
