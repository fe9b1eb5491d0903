/**
 * @file opcode.h
 * @brief CHIP-8 instruction codec.
 *
 * An Opcode is an immutable tagged value: the Operation plus operand
 * fields that are already extracted from the instruction word. Which
 * fields are meaningful depends on operand_format(operation()); the
 * others are zero.
 *
 * Decoding is stateless and total over the 16-bit instruction space:
 * every word either maps to exactly one Opcode or fails with
 * ErrorCode::UnsupportedInstruction. encode() is its exact inverse.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/error.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace gr8 {

/**
 * @brief The 35 instructions of the base CHIP-8 ISA.
 *
 * Comments give the encoding; X/Y are register indices, N a 4-bit
 * height, KK an 8-bit immediate and NNN a 12-bit address.
 */
enum class Operation : uint8_t {
    SysCall,         ///< 0NNN  call machine-code routine (unsupported at run time)
    ClearScreen,     ///< 00E0
    Return,          ///< 00EE
    Jump,            ///< 1NNN
    Call,            ///< 2NNN
    SkipEqImm,       ///< 3XKK
    SkipNeImm,       ///< 4XKK
    SkipEqReg,       ///< 5XY0
    LoadImm,         ///< 6XKK
    AddImm,          ///< 7XKK
    Move,            ///< 8XY0
    Or,              ///< 8XY1
    And,             ///< 8XY2
    Xor,             ///< 8XY3
    AddReg,          ///< 8XY4
    SubReg,          ///< 8XY5
    ShiftRight,      ///< 8XY6
    SubReversed,     ///< 8XY7
    ShiftLeft,       ///< 8XYE
    SkipNeReg,       ///< 9XY0
    LoadIndex,       ///< ANNN
    JumpOffset,      ///< BNNN
    Random,          ///< CXKK
    Draw,            ///< DXYN
    SkipKeyDown,     ///< EX9E
    SkipKeyUp,       ///< EXA1
    LoadDelay,       ///< FX07
    WaitKey,         ///< FX0A
    SetDelay,        ///< FX15
    SetSound,        ///< FX18
    AddIndex,        ///< FX1E
    LoadGlyph,       ///< FX29
    StoreBcd,        ///< FX33
    StoreRegisters,  ///< FX55
    LoadRegisters,   ///< FX65
};

inline constexpr size_t kOperationCount = 35;

/**
 * @brief Operation name ("Jump", "StoreBcd", ...).
 */
[[nodiscard]] const char* to_string(Operation op) noexcept;

/**
 * @brief Which operand fields an operation carries.
 */
enum class OperandFormat : uint8_t {
    None,             ///< 00E0, 00EE
    Address,          ///< nnn
    RegisterImmediate,///< x, kk
    RegisterPair,     ///< x, y
    Register,         ///< x
    Sprite,           ///< x, y, n
};

[[nodiscard]] OperandFormat operand_format(Operation op) noexcept;

/**
 * @brief The four nibbles of an instruction word, most significant first.
 */
struct Nibbles {
    uint8_t n0;
    uint8_t n1;
    uint8_t n2;
    uint8_t n3;

    bool operator==(const Nibbles&) const = default;
};

[[nodiscard]] constexpr Nibbles nibbles_of(uint16_t word) noexcept {
    return Nibbles{
        static_cast<uint8_t>((word >> 12) & 0xF),
        static_cast<uint8_t>((word >> 8) & 0xF),
        static_cast<uint8_t>((word >> 4) & 0xF),
        static_cast<uint8_t>(word & 0xF),
    };
}

/**
 * @brief A decoded instruction.
 *
 * Only the named constructors can set operands, and each one accepts only
 * the operations of its operand format with operands in range, so every
 * Opcode that exists encodes to exactly one word and decodes back to
 * itself. A default-constructed Opcode is 00E0.
 */
class Opcode {
public:
    constexpr Opcode() noexcept = default;

    bool operator==(const Opcode&) const = default;

    [[nodiscard]] constexpr Operation operation() const noexcept { return operation_; }
    [[nodiscard]] constexpr uint8_t x() const noexcept { return x_; }
    [[nodiscard]] constexpr uint8_t y() const noexcept { return y_; }
    [[nodiscard]] constexpr uint8_t n() const noexcept { return n_; }
    [[nodiscard]] constexpr uint8_t kk() const noexcept { return kk_; }
    [[nodiscard]] constexpr uint16_t nnn() const noexcept { return nnn_; }

    // ─────────────────────────────────────────────────────────────
    // Named constructors, one per operand format
    //
    // A wrong operation for the format, a register above 0xF, a height
    // above 0xF or an address above 0xFFF violates the precondition
    // (gsl_lite::fail_fast).
    // ─────────────────────────────────────────────────────────────

    /// OperandFormat::None
    [[nodiscard]] static Opcode bare(Operation op);

    /// OperandFormat::Address
    [[nodiscard]] static Opcode with_address(Operation op, uint16_t nnn);

    /// OperandFormat::Register
    [[nodiscard]] static Opcode with_register(Operation op, uint8_t x);

    /// OperandFormat::RegisterImmediate
    [[nodiscard]] static Opcode with_register_immediate(Operation op, uint8_t x, uint8_t kk);

    /// OperandFormat::RegisterPair
    [[nodiscard]] static Opcode with_registers(Operation op, uint8_t x, uint8_t y);

    /// DXYN
    [[nodiscard]] static Opcode draw_sprite(uint8_t x, uint8_t y, uint8_t n);

private:
    Operation operation_ = Operation::ClearScreen;
    uint8_t x_ = 0;
    uint8_t y_ = 0;
    uint8_t n_ = 0;
    uint8_t kk_ = 0;
    uint16_t nnn_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Codec
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Decode one instruction from its two bytes (big-endian).
 *
 * 00E0 and 00EE take precedence over the 0NNN catch-all.
 *
 * @return The Opcode, or UnsupportedInstruction carrying the raw word
 */
[[nodiscard]] Result<Opcode> decode(uint8_t byte0, uint8_t byte1);

/**
 * @brief Decode one instruction from a 16-bit word.
 */
[[nodiscard]] Result<Opcode> decode_word(uint16_t word);

/**
 * @brief Encode an Opcode back to its two bytes. Infallible.
 */
[[nodiscard]] std::array<uint8_t, 2> encode(const Opcode& op) noexcept;

/**
 * @brief Encode an Opcode to its 16-bit word.
 */
[[nodiscard]] uint16_t encode_word(const Opcode& op) noexcept;

/**
 * @brief Decode a whole program, two bytes at a time.
 *
 * Fails with MalformedProgram if the length is odd (offset of the dangling
 * byte attached), or with the first decode error (its byte offset
 * attached). An empty program decodes to an empty sequence.
 */
[[nodiscard]] Result<std::vector<Opcode>> decode_program(std::span<const uint8_t> bytes);

/**
 * @brief Assembly-style rendering, e.g. "LD V3, 0x2A" or "DRW V0, V1, 5".
 */
[[nodiscard]] std::string mnemonic(const Opcode& op);

} // namespace gr8
