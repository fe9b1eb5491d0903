/**
 * @file opcode.cpp
 * @brief CHIP-8 instruction decode / encode / disassembly.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/opcode.h"

#include "gr8/gsl.hpp"

namespace gr8 {

const char* to_string(Operation op) noexcept {
    switch (op) {
        case Operation::SysCall:        return "SysCall";
        case Operation::ClearScreen:    return "ClearScreen";
        case Operation::Return:         return "Return";
        case Operation::Jump:           return "Jump";
        case Operation::Call:           return "Call";
        case Operation::SkipEqImm:      return "SkipEqImm";
        case Operation::SkipNeImm:      return "SkipNeImm";
        case Operation::SkipEqReg:      return "SkipEqReg";
        case Operation::LoadImm:        return "LoadImm";
        case Operation::AddImm:         return "AddImm";
        case Operation::Move:           return "Move";
        case Operation::Or:             return "Or";
        case Operation::And:            return "And";
        case Operation::Xor:            return "Xor";
        case Operation::AddReg:         return "AddReg";
        case Operation::SubReg:         return "SubReg";
        case Operation::ShiftRight:     return "ShiftRight";
        case Operation::SubReversed:    return "SubReversed";
        case Operation::ShiftLeft:      return "ShiftLeft";
        case Operation::SkipNeReg:      return "SkipNeReg";
        case Operation::LoadIndex:      return "LoadIndex";
        case Operation::JumpOffset:     return "JumpOffset";
        case Operation::Random:         return "Random";
        case Operation::Draw:           return "Draw";
        case Operation::SkipKeyDown:    return "SkipKeyDown";
        case Operation::SkipKeyUp:      return "SkipKeyUp";
        case Operation::LoadDelay:      return "LoadDelay";
        case Operation::WaitKey:        return "WaitKey";
        case Operation::SetDelay:       return "SetDelay";
        case Operation::SetSound:       return "SetSound";
        case Operation::AddIndex:       return "AddIndex";
        case Operation::LoadGlyph:      return "LoadGlyph";
        case Operation::StoreBcd:       return "StoreBcd";
        case Operation::StoreRegisters: return "StoreRegisters";
        case Operation::LoadRegisters:  return "LoadRegisters";
    }
    return "Unknown";
}

OperandFormat operand_format(Operation op) noexcept {
    switch (op) {
        case Operation::ClearScreen:
        case Operation::Return:
            return OperandFormat::None;

        case Operation::SysCall:
        case Operation::Jump:
        case Operation::Call:
        case Operation::LoadIndex:
        case Operation::JumpOffset:
            return OperandFormat::Address;

        case Operation::SkipEqImm:
        case Operation::SkipNeImm:
        case Operation::LoadImm:
        case Operation::AddImm:
        case Operation::Random:
            return OperandFormat::RegisterImmediate;

        case Operation::SkipEqReg:
        case Operation::Move:
        case Operation::Or:
        case Operation::And:
        case Operation::Xor:
        case Operation::AddReg:
        case Operation::SubReg:
        case Operation::ShiftRight:
        case Operation::SubReversed:
        case Operation::ShiftLeft:
        case Operation::SkipNeReg:
            return OperandFormat::RegisterPair;

        case Operation::Draw:
            return OperandFormat::Sprite;

        case Operation::SkipKeyDown:
        case Operation::SkipKeyUp:
        case Operation::LoadDelay:
        case Operation::WaitKey:
        case Operation::SetDelay:
        case Operation::SetSound:
        case Operation::AddIndex:
        case Operation::LoadGlyph:
        case Operation::StoreBcd:
        case Operation::StoreRegisters:
        case Operation::LoadRegisters:
            return OperandFormat::Register;
    }
    return OperandFormat::None;
}

// ─────────────────────────────────────────────────────────────────────────────
// Opcode construction
// ─────────────────────────────────────────────────────────────────────────────

Opcode Opcode::bare(Operation op) {
    gsl_Expects(operand_format(op) == OperandFormat::None);
    Opcode o;
    o.operation_ = op;
    return o;
}

Opcode Opcode::with_address(Operation op, uint16_t nnn) {
    gsl_Expects(operand_format(op) == OperandFormat::Address);
    gsl_Expects(nnn <= 0x0FFF);
    Opcode o;
    o.operation_ = op;
    o.nnn_ = nnn;
    return o;
}

Opcode Opcode::with_register(Operation op, uint8_t x) {
    gsl_Expects(operand_format(op) == OperandFormat::Register);
    gsl_Expects(x <= 0xF);
    Opcode o;
    o.operation_ = op;
    o.x_ = x;
    return o;
}

Opcode Opcode::with_register_immediate(Operation op, uint8_t x, uint8_t kk) {
    gsl_Expects(operand_format(op) == OperandFormat::RegisterImmediate);
    gsl_Expects(x <= 0xF);
    Opcode o;
    o.operation_ = op;
    o.x_ = x;
    o.kk_ = kk;
    return o;
}

Opcode Opcode::with_registers(Operation op, uint8_t x, uint8_t y) {
    gsl_Expects(operand_format(op) == OperandFormat::RegisterPair);
    gsl_Expects(x <= 0xF && y <= 0xF);
    Opcode o;
    o.operation_ = op;
    o.x_ = x;
    o.y_ = y;
    return o;
}

Opcode Opcode::draw_sprite(uint8_t x, uint8_t y, uint8_t n) {
    gsl_Expects(x <= 0xF && y <= 0xF && n <= 0xF);
    Opcode o;
    o.operation_ = Operation::Draw;
    o.x_ = x;
    o.y_ = y;
    o.n_ = n;
    return o;
}

namespace {

// Fixed low bits for the 8XY? arithmetic group, indexed by n3.
Result<Operation> alu_operation(uint8_t n3) {
    switch (n3) {
        case 0x0: return Operation::Move;
        case 0x1: return Operation::Or;
        case 0x2: return Operation::And;
        case 0x3: return Operation::Xor;
        case 0x4: return Operation::AddReg;
        case 0x5: return Operation::SubReg;
        case 0x6: return Operation::ShiftRight;
        case 0x7: return Operation::SubReversed;
        case 0xE: return Operation::ShiftLeft;
        default:  return make_error(ErrorCode::UnsupportedInstruction, "unknown 8XY? variant");
    }
}

// FX?? group keyed by the low byte.
Result<Operation> misc_operation(uint8_t kk) {
    switch (kk) {
        case 0x07: return Operation::LoadDelay;
        case 0x0A: return Operation::WaitKey;
        case 0x15: return Operation::SetDelay;
        case 0x18: return Operation::SetSound;
        case 0x1E: return Operation::AddIndex;
        case 0x29: return Operation::LoadGlyph;
        case 0x33: return Operation::StoreBcd;
        case 0x55: return Operation::StoreRegisters;
        case 0x65: return Operation::LoadRegisters;
        default:   return make_error(ErrorCode::UnsupportedInstruction, "unknown FX?? variant");
    }
}

// Low bits fixed by each operation when re-encoding.
uint16_t fixed_low_bits(Operation op) noexcept {
    switch (op) {
        case Operation::ClearScreen:    return 0x00E0;
        case Operation::Return:         return 0x00EE;
        case Operation::Move:           return 0x0;
        case Operation::Or:             return 0x1;
        case Operation::And:            return 0x2;
        case Operation::Xor:            return 0x3;
        case Operation::AddReg:         return 0x4;
        case Operation::SubReg:         return 0x5;
        case Operation::ShiftRight:     return 0x6;
        case Operation::SubReversed:    return 0x7;
        case Operation::ShiftLeft:      return 0xE;
        case Operation::SkipKeyDown:    return 0x9E;
        case Operation::SkipKeyUp:      return 0xA1;
        case Operation::LoadDelay:      return 0x07;
        case Operation::WaitKey:        return 0x0A;
        case Operation::SetDelay:       return 0x15;
        case Operation::SetSound:       return 0x18;
        case Operation::AddIndex:       return 0x1E;
        case Operation::LoadGlyph:      return 0x29;
        case Operation::StoreBcd:       return 0x33;
        case Operation::StoreRegisters: return 0x55;
        case Operation::LoadRegisters:  return 0x65;
        default:                        return 0x0;
    }
}

uint16_t high_nibble(Operation op) noexcept {
    switch (op) {
        case Operation::SysCall:
        case Operation::ClearScreen:
        case Operation::Return:         return 0x0;
        case Operation::Jump:           return 0x1;
        case Operation::Call:           return 0x2;
        case Operation::SkipEqImm:      return 0x3;
        case Operation::SkipNeImm:      return 0x4;
        case Operation::SkipEqReg:      return 0x5;
        case Operation::LoadImm:        return 0x6;
        case Operation::AddImm:         return 0x7;
        case Operation::Move:
        case Operation::Or:
        case Operation::And:
        case Operation::Xor:
        case Operation::AddReg:
        case Operation::SubReg:
        case Operation::ShiftRight:
        case Operation::SubReversed:
        case Operation::ShiftLeft:      return 0x8;
        case Operation::SkipNeReg:      return 0x9;
        case Operation::LoadIndex:      return 0xA;
        case Operation::JumpOffset:     return 0xB;
        case Operation::Random:         return 0xC;
        case Operation::Draw:           return 0xD;
        case Operation::SkipKeyDown:
        case Operation::SkipKeyUp:      return 0xE;
        default:                        return 0xF;
    }
}

Error unsupported(uint16_t word) {
    return GR8_ERROR(ErrorCode::UnsupportedInstruction,
                     "unsupported instruction 0x%04X",
                     static_cast<unsigned>(word))
        .with_instruction(word);
}

} // namespace

Result<Opcode> decode_word(uint16_t word) {
    const Nibbles nb = nibbles_of(word);
    const auto nnn = static_cast<uint16_t>(word & 0x0FFF);
    const auto kk = static_cast<uint8_t>(word & 0x00FF);

    switch (nb.n0) {
        case 0x0:
            if (word == 0x00E0) return Opcode::bare(Operation::ClearScreen);
            if (word == 0x00EE) return Opcode::bare(Operation::Return);
            return Opcode::with_address(Operation::SysCall, nnn);
        case 0x1: return Opcode::with_address(Operation::Jump, nnn);
        case 0x2: return Opcode::with_address(Operation::Call, nnn);
        case 0x3: return Opcode::with_register_immediate(Operation::SkipEqImm, nb.n1, kk);
        case 0x4: return Opcode::with_register_immediate(Operation::SkipNeImm, nb.n1, kk);
        case 0x5:
            if (nb.n3 != 0) return Err(unsupported(word));
            return Opcode::with_registers(Operation::SkipEqReg, nb.n1, nb.n2);
        case 0x6: return Opcode::with_register_immediate(Operation::LoadImm, nb.n1, kk);
        case 0x7: return Opcode::with_register_immediate(Operation::AddImm, nb.n1, kk);
        case 0x8: {
            auto op = alu_operation(nb.n3);
            if (!op) return Err(unsupported(word));
            return Opcode::with_registers(*op, nb.n1, nb.n2);
        }
        case 0x9:
            if (nb.n3 != 0) return Err(unsupported(word));
            return Opcode::with_registers(Operation::SkipNeReg, nb.n1, nb.n2);
        case 0xA: return Opcode::with_address(Operation::LoadIndex, nnn);
        case 0xB: return Opcode::with_address(Operation::JumpOffset, nnn);
        case 0xC: return Opcode::with_register_immediate(Operation::Random, nb.n1, kk);
        case 0xD: return Opcode::draw_sprite(nb.n1, nb.n2, nb.n3);
        case 0xE:
            if (kk == 0x9E) return Opcode::with_register(Operation::SkipKeyDown, nb.n1);
            if (kk == 0xA1) return Opcode::with_register(Operation::SkipKeyUp, nb.n1);
            return Err(unsupported(word));
        case 0xF: {
            auto op = misc_operation(kk);
            if (!op) return Err(unsupported(word));
            return Opcode::with_register(*op, nb.n1);
        }
        default:
            break;
    }
    return Err(unsupported(word));
}

Result<Opcode> decode(uint8_t byte0, uint8_t byte1) {
    return decode_word(static_cast<uint16_t>((byte0 << 8) | byte1));
}

uint16_t encode_word(const Opcode& op) noexcept {
    const Operation operation = op.operation();
    const auto hi = static_cast<uint16_t>(high_nibble(operation) << 12);
    const auto x = static_cast<uint16_t>(op.x() << 8);
    const auto y = static_cast<uint16_t>(op.y() << 4);

    switch (operand_format(operation)) {
        case OperandFormat::None:
            return fixed_low_bits(operation);
        case OperandFormat::Address:
            return static_cast<uint16_t>(hi | op.nnn());
        case OperandFormat::RegisterImmediate:
            return static_cast<uint16_t>(hi | x | op.kk());
        case OperandFormat::RegisterPair:
            return static_cast<uint16_t>(hi | x | y | fixed_low_bits(operation));
        case OperandFormat::Register:
            return static_cast<uint16_t>(hi | x | fixed_low_bits(operation));
        case OperandFormat::Sprite:
            return static_cast<uint16_t>(hi | x | y | op.n());
    }
    return 0;
}

std::array<uint8_t, 2> encode(const Opcode& op) noexcept {
    const uint16_t word = encode_word(op);
    return {static_cast<uint8_t>(word >> 8), static_cast<uint8_t>(word & 0xFF)};
}

Result<std::vector<Opcode>> decode_program(std::span<const uint8_t> bytes) {
    std::vector<Opcode> program;
    program.reserve(bytes.size() / 2);

    size_t offset = 0;
    for (; offset + 1 < bytes.size(); offset += 2) {
        auto op = decode(bytes[offset], bytes[offset + 1]);
        if (!op) {
            return Err(std::move(op).error().at_offset(offset));
        }
        program.push_back(*op);
    }

    if (offset < bytes.size()) {
        return Err(GR8_ERROR(ErrorCode::MalformedProgram,
                             "program length %zu is odd; byte at offset %zu has no partner",
                             bytes.size(), offset)
                       .at_offset(offset));
    }
    return program;
}

std::string mnemonic(const Opcode& op) {
    const unsigned x = op.x();
    const unsigned y = op.y();
    const unsigned kk = op.kk();
    const unsigned nnn = op.nnn();
    const unsigned n = op.n();
    using detail::format_printf;

    switch (op.operation()) {
        case Operation::SysCall:        return format_printf("SYS 0x%03X", nnn);
        case Operation::ClearScreen:    return "CLS";
        case Operation::Return:         return "RET";
        case Operation::Jump:           return format_printf("JP 0x%03X", nnn);
        case Operation::Call:           return format_printf("CALL 0x%03X", nnn);
        case Operation::SkipEqImm:      return format_printf("SE V%X, 0x%02X", x, kk);
        case Operation::SkipNeImm:      return format_printf("SNE V%X, 0x%02X", x, kk);
        case Operation::SkipEqReg:      return format_printf("SE V%X, V%X", x, y);
        case Operation::LoadImm:        return format_printf("LD V%X, 0x%02X", x, kk);
        case Operation::AddImm:         return format_printf("ADD V%X, 0x%02X", x, kk);
        case Operation::Move:           return format_printf("LD V%X, V%X", x, y);
        case Operation::Or:             return format_printf("OR V%X, V%X", x, y);
        case Operation::And:            return format_printf("AND V%X, V%X", x, y);
        case Operation::Xor:            return format_printf("XOR V%X, V%X", x, y);
        case Operation::AddReg:         return format_printf("ADD V%X, V%X", x, y);
        case Operation::SubReg:         return format_printf("SUB V%X, V%X", x, y);
        case Operation::ShiftRight:     return format_printf("SHR V%X, V%X", x, y);
        case Operation::SubReversed:    return format_printf("SUBN V%X, V%X", x, y);
        case Operation::ShiftLeft:      return format_printf("SHL V%X, V%X", x, y);
        case Operation::SkipNeReg:      return format_printf("SNE V%X, V%X", x, y);
        case Operation::LoadIndex:      return format_printf("LD I, 0x%03X", nnn);
        case Operation::JumpOffset:     return format_printf("JP V0, 0x%03X", nnn);
        case Operation::Random:         return format_printf("RND V%X, 0x%02X", x, kk);
        case Operation::Draw:           return format_printf("DRW V%X, V%X, %u", x, y, n);
        case Operation::SkipKeyDown:    return format_printf("SKP V%X", x);
        case Operation::SkipKeyUp:      return format_printf("SKNP V%X", x);
        case Operation::LoadDelay:      return format_printf("LD V%X, DT", x);
        case Operation::WaitKey:        return format_printf("LD V%X, K", x);
        case Operation::SetDelay:       return format_printf("LD DT, V%X", x);
        case Operation::SetSound:       return format_printf("LD ST, V%X", x);
        case Operation::AddIndex:       return format_printf("ADD I, V%X", x);
        case Operation::LoadGlyph:      return format_printf("LD F, V%X", x);
        case Operation::StoreBcd:       return format_printf("LD B, V%X", x);
        case Operation::StoreRegisters: return format_printf("LD [I], V%X", x);
        case Operation::LoadRegisters:  return format_printf("LD V%X, [I]", x);
    }
    return "???";
}

} // namespace gr8
