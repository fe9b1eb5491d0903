/**
 * @file test_opcode.cpp
 * @brief Unit tests for the instruction codec.
 */

#include <gtest/gtest.h>
#include <gr8/opcode.h>
#include <array>
#include <vector>

using namespace gr8;

namespace {

Opcode must_decode(uint16_t word) {
    auto op = decode_word(word);
    EXPECT_TRUE(op.has_value()) << std::hex << word;
    return op ? *op : Opcode{};
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Nibbles
// ─────────────────────────────────────────────────────────────────────────────

TEST(NibblesTest, SplitsMostSignificantFirst) {
    constexpr Nibbles nb = nibbles_of(0xD12F);
    static_assert(nb.n0 == 0xD && nb.n1 == 0x1 && nb.n2 == 0x2 && nb.n3 == 0xF);
    EXPECT_EQ(nb, (Nibbles{0xD, 0x1, 0x2, 0xF}));
}

// ─────────────────────────────────────────────────────────────────────────────
// Decode: one case per operand format
// ─────────────────────────────────────────────────────────────────────────────

TEST(DecodeTest, ClearScreenAndReturnTakePrecedenceOverSys) {
    EXPECT_EQ(must_decode(0x00E0), Opcode::bare(Operation::ClearScreen));
    EXPECT_EQ(must_decode(0x00EE), Opcode::bare(Operation::Return));
    EXPECT_EQ(must_decode(0x0123), Opcode::with_address(Operation::SysCall, 0x123));
    EXPECT_EQ(must_decode(0x00E1), Opcode::with_address(Operation::SysCall, 0x0E1));
}

TEST(DecodeTest, AddressOperations) {
    EXPECT_EQ(must_decode(0x1ABC), Opcode::with_address(Operation::Jump, 0xABC));
    EXPECT_EQ(must_decode(0x2300), Opcode::with_address(Operation::Call, 0x300));
    EXPECT_EQ(must_decode(0xA050), Opcode::with_address(Operation::LoadIndex, 0x050));
    EXPECT_EQ(must_decode(0xBFFF), Opcode::with_address(Operation::JumpOffset, 0xFFF));
}

TEST(DecodeTest, RegisterImmediateOperations) {
    EXPECT_EQ(must_decode(0x3A42), Opcode::with_register_immediate(Operation::SkipEqImm, 0xA, 0x42));
    EXPECT_EQ(must_decode(0x4B00), Opcode::with_register_immediate(Operation::SkipNeImm, 0xB, 0x00));
    EXPECT_EQ(must_decode(0x632A), Opcode::with_register_immediate(Operation::LoadImm, 0x3, 0x2A));
    EXPECT_EQ(must_decode(0x7FFF), Opcode::with_register_immediate(Operation::AddImm, 0xF, 0xFF));
    EXPECT_EQ(must_decode(0xC10F), Opcode::with_register_immediate(Operation::Random, 0x1, 0x0F));
}

TEST(DecodeTest, ArithmeticGroup) {
    const std::array<std::pair<uint16_t, Operation>, 9> cases{{
        {0x8120, Operation::Move},
        {0x8121, Operation::Or},
        {0x8122, Operation::And},
        {0x8123, Operation::Xor},
        {0x8124, Operation::AddReg},
        {0x8125, Operation::SubReg},
        {0x8126, Operation::ShiftRight},
        {0x8127, Operation::SubReversed},
        {0x812E, Operation::ShiftLeft},
    }};
    for (const auto& [word, operation] : cases) {
        EXPECT_EQ(must_decode(word), Opcode::with_registers(operation, 0x1, 0x2)) << std::hex << word;
    }
}

TEST(DecodeTest, RegisterPairSkips) {
    EXPECT_EQ(must_decode(0x5AB0), Opcode::with_registers(Operation::SkipEqReg, 0xA, 0xB));
    EXPECT_EQ(must_decode(0x9AB0), Opcode::with_registers(Operation::SkipNeReg, 0xA, 0xB));
}

TEST(DecodeTest, DrawCarriesHeight) {
    EXPECT_EQ(must_decode(0xD125), Opcode::draw_sprite(0x1, 0x2, 5));
    EXPECT_EQ(must_decode(0xDAB0), Opcode::draw_sprite(0xA, 0xB, 0));
}

TEST(DecodeTest, KeyAndMiscGroups) {
    EXPECT_EQ(must_decode(0xE39E), Opcode::with_register(Operation::SkipKeyDown, 3));
    EXPECT_EQ(must_decode(0xE3A1), Opcode::with_register(Operation::SkipKeyUp, 3));
    EXPECT_EQ(must_decode(0xF507), Opcode::with_register(Operation::LoadDelay, 5));
    EXPECT_EQ(must_decode(0xF50A), Opcode::with_register(Operation::WaitKey, 5));
    EXPECT_EQ(must_decode(0xF515), Opcode::with_register(Operation::SetDelay, 5));
    EXPECT_EQ(must_decode(0xF518), Opcode::with_register(Operation::SetSound, 5));
    EXPECT_EQ(must_decode(0xF51E), Opcode::with_register(Operation::AddIndex, 5));
    EXPECT_EQ(must_decode(0xF529), Opcode::with_register(Operation::LoadGlyph, 5));
    EXPECT_EQ(must_decode(0xF533), Opcode::with_register(Operation::StoreBcd, 5));
    EXPECT_EQ(must_decode(0xF555), Opcode::with_register(Operation::StoreRegisters, 5));
    EXPECT_EQ(must_decode(0xF565), Opcode::with_register(Operation::LoadRegisters, 5));
}

TEST(DecodeTest, ByteFormMatchesWordForm) {
    auto from_bytes = decode(0xD1, 0x25);
    ASSERT_TRUE(from_bytes.has_value());
    EXPECT_EQ(*from_bytes, must_decode(0xD125));
}

// ─────────────────────────────────────────────────────────────────────────────
// Decode errors
// ─────────────────────────────────────────────────────────────────────────────

TEST(DecodeTest, UnsupportedWordsCarryTheWord) {
    for (uint16_t word : {0x5121, 0x912F, 0x8128, 0x812F, 0xE100, 0xE19F, 0xF000, 0xF1FF}) {
        auto op = decode_word(word);
        ASSERT_FALSE(op.has_value()) << std::hex << word;
        EXPECT_EQ(op.error().code(), ErrorCode::UnsupportedInstruction);
        ASSERT_TRUE(op.error().instruction().has_value());
        EXPECT_EQ(*op.error().instruction(), word);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Round trip
// ─────────────────────────────────────────────────────────────────────────────

TEST(EncodeTest, EveryDecodableWordReEncodesToItself) {
    size_t decodable = 0;
    for (uint32_t w = 0; w <= 0xFFFF; ++w) {
        const auto word = static_cast<uint16_t>(w);
        auto op = decode_word(word);
        if (!op) {
            continue;
        }
        ++decodable;
        ASSERT_EQ(encode_word(*op), word) << std::hex << word << " " << mnemonic(*op);

        const auto bytes = encode(*op);
        ASSERT_EQ(bytes[0], word >> 8);
        ASSERT_EQ(bytes[1], word & 0xFF);
    }
    // 5XY?/9XY? need n3 == 0, 8XY? has 9 variants, EX?? 2 and FX?? 9
    EXPECT_EQ(decodable, 48048u);
}

TEST(EncodeTest, EveryConstructibleOpcodeDecodesBackToItself) {
    const std::array<uint8_t, 4> registers{0x0, 0x3, 0xA, 0xF};
    const std::array<uint8_t, 3> immediates{0x00, 0x5A, 0xFF};
    const std::array<uint16_t, 3> addresses{0x000, 0x2A4, 0xFFF};

    std::vector<Opcode> built;
    for (size_t i = 0; i < kOperationCount; ++i) {
        const auto operation = static_cast<Operation>(i);
        switch (operand_format(operation)) {
            case OperandFormat::None:
                built.push_back(Opcode::bare(operation));
                break;
            case OperandFormat::Address:
                for (uint16_t nnn : addresses) built.push_back(Opcode::with_address(operation, nnn));
                break;
            case OperandFormat::Register:
                for (uint8_t x : registers) built.push_back(Opcode::with_register(operation, x));
                break;
            case OperandFormat::RegisterImmediate:
                for (uint8_t x : registers)
                    for (uint8_t kk : immediates)
                        built.push_back(Opcode::with_register_immediate(operation, x, kk));
                break;
            case OperandFormat::RegisterPair:
                for (uint8_t x : registers)
                    for (uint8_t y : registers)
                        built.push_back(Opcode::with_registers(operation, x, y));
                break;
            case OperandFormat::Sprite:
                for (uint8_t x : registers)
                    for (uint8_t y : registers)
                        for (uint8_t n : {0, 1, 15})
                            built.push_back(Opcode::draw_sprite(x, y, static_cast<uint8_t>(n)));
                break;
        }
    }

    for (const Opcode& op : built) {
        const auto bytes = encode(op);
        auto back = decode(bytes[0], bytes[1]);
        ASSERT_TRUE(back.has_value()) << mnemonic(op);
        EXPECT_EQ(*back, op) << mnemonic(op);
    }
}

TEST(OpcodeTest, DefaultIsClearScreen) {
    const Opcode op;
    EXPECT_EQ(op, Opcode::bare(Operation::ClearScreen));
    EXPECT_EQ(encode_word(op), 0x00E0);
}

TEST(OpcodeTest, AccessorsExposeOperands) {
    const Opcode draw = Opcode::draw_sprite(0x3, 0xC, 0x7);
    EXPECT_EQ(draw.operation(), Operation::Draw);
    EXPECT_EQ(draw.x(), 0x3);
    EXPECT_EQ(draw.y(), 0xC);
    EXPECT_EQ(draw.n(), 0x7);
    EXPECT_EQ(draw.kk(), 0);
    EXPECT_EQ(draw.nnn(), 0);

    const Opcode jump = Opcode::with_address(Operation::Jump, 0x234);
    EXPECT_EQ(jump.nnn(), 0x234);
    EXPECT_EQ(jump.x(), 0);
}

TEST(OpcodeTest, ConstructorsRejectOperationsOfAnotherFormat) {
    EXPECT_ANY_THROW((void)Opcode::with_register(Operation::AddReg, 2));
    EXPECT_ANY_THROW((void)Opcode::bare(Operation::Jump));
    EXPECT_ANY_THROW((void)Opcode::with_address(Operation::LoadImm, 0x100));
    EXPECT_ANY_THROW((void)Opcode::with_register_immediate(Operation::Move, 1, 2));
    EXPECT_ANY_THROW((void)Opcode::with_registers(Operation::StoreBcd, 1, 2));
}

TEST(OpcodeTest, ConstructorsRejectOutOfRangeOperands) {
    EXPECT_ANY_THROW((void)Opcode::with_address(Operation::Jump, 0x1234));
    EXPECT_ANY_THROW((void)Opcode::with_register(Operation::SkipKeyDown, 16));
    EXPECT_ANY_THROW((void)Opcode::with_register_immediate(Operation::LoadImm, 16, 0));
    EXPECT_ANY_THROW((void)Opcode::with_registers(Operation::Xor, 0, 16));
    EXPECT_ANY_THROW((void)Opcode::draw_sprite(0, 0, 16));
}

// ─────────────────────────────────────────────────────────────────────────────
// Programs
// ─────────────────────────────────────────────────────────────────────────────

TEST(DecodeProgramTest, EmptyProgramIsEmpty) {
    auto program = decode_program({});
    ASSERT_TRUE(program.has_value());
    EXPECT_TRUE(program->empty());
}

TEST(DecodeProgramTest, DecodesInOrder) {
    const std::vector<uint8_t> bytes{0x00, 0xE0, 0x63, 0x2A, 0x12, 0x00};
    auto program = decode_program(bytes);
    ASSERT_TRUE(program.has_value());
    ASSERT_EQ(program->size(), 3u);
    EXPECT_EQ((*program)[0].operation(), Operation::ClearScreen);
    EXPECT_EQ((*program)[1], Opcode::with_register_immediate(Operation::LoadImm, 3, 0x2A));
    EXPECT_EQ((*program)[2], Opcode::with_address(Operation::Jump, 0x200));
}

TEST(DecodeProgramTest, OddLengthIsMalformed) {
    const std::vector<uint8_t> bytes{0x00, 0xE0, 0x63};
    auto program = decode_program(bytes);
    ASSERT_FALSE(program.has_value());
    EXPECT_EQ(program.error().code(), ErrorCode::MalformedProgram);
    ASSERT_TRUE(program.error().offset().has_value());
    EXPECT_EQ(*program.error().offset(), 2u);
}

TEST(DecodeProgramTest, DecodeErrorReportsOffset) {
    const std::vector<uint8_t> bytes{0x00, 0xE0, 0x00, 0xEE, 0xF0, 0x00};
    auto program = decode_program(bytes);
    ASSERT_FALSE(program.has_value());
    EXPECT_EQ(program.error().code(), ErrorCode::UnsupportedInstruction);
    EXPECT_EQ(program.error().offset(), std::optional<size_t>(4));
    EXPECT_EQ(program.error().instruction(), std::optional<uint16_t>(0xF000));
}

// ─────────────────────────────────────────────────────────────────────────────
// Metadata and mnemonics
// ─────────────────────────────────────────────────────────────────────────────

TEST(OperationTest, EveryOperationHasAName) {
    for (size_t i = 0; i < kOperationCount; ++i) {
        const auto op = static_cast<Operation>(i);
        EXPECT_STRNE(to_string(op), "Unknown") << i;
    }
}

TEST(OperationTest, OperandFormats) {
    EXPECT_EQ(operand_format(Operation::ClearScreen), OperandFormat::None);
    EXPECT_EQ(operand_format(Operation::Call), OperandFormat::Address);
    EXPECT_EQ(operand_format(Operation::AddImm), OperandFormat::RegisterImmediate);
    EXPECT_EQ(operand_format(Operation::Xor), OperandFormat::RegisterPair);
    EXPECT_EQ(operand_format(Operation::StoreBcd), OperandFormat::Register);
    EXPECT_EQ(operand_format(Operation::Draw), OperandFormat::Sprite);
}

TEST(MnemonicTest, RendersOperands) {
    EXPECT_EQ(mnemonic(must_decode(0x00E0)), "CLS");
    EXPECT_EQ(mnemonic(must_decode(0x00EE)), "RET");
    EXPECT_EQ(mnemonic(must_decode(0x632A)), "LD V3, 0x2A");
    EXPECT_EQ(mnemonic(must_decode(0xD015)), "DRW V0, V1, 5");
    EXPECT_EQ(mnemonic(must_decode(0xA22A)), "LD I, 0x22A");
    EXPECT_EQ(mnemonic(must_decode(0xBABC)), "JP V0, 0xABC");
    EXPECT_EQ(mnemonic(must_decode(0xFE33)), "LD B, VE");
    EXPECT_EQ(mnemonic(must_decode(0xF265)), "LD V2, [I]");
    EXPECT_EQ(mnemonic(must_decode(0x8AB7)), "SUBN VA, VB");
}
