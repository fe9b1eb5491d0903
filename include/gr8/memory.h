/**
 * @file memory.h
 * @brief RAII wrapper for the guest address space.
 *
 * Every access is bounds-checked. The interpreter validates guest
 * addresses up front and reports MemoryOutOfBounds through Result<T>;
 * an access that still lands outside the buffer throws
 * MemoryAccessException, which indicates a host-side bug.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "exceptions.h"

#include <gsl-lite/gsl-lite.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>

namespace gr8 {

/**
 * @brief Owning, zero-initialised guest RAM.
 *
 * @note Non-copyable, movable. Moving transfers ownership.
 *
 * @invariant data_ != nullptr implies size_ > 0
 * @invariant After move, source has size_ == 0 and data_ == nullptr
 *
 * Example:
 * @code
 *   GuestMemory mem(layout::kMemorySize);
 *   mem.write8(0x200, 0x00);
 *   mem.write8(0x201, 0xE0);
 *   uint16_t word = mem.read16_be(0x200);  // 0x00E0
 * @endcode
 */
class GuestMemory {
public:
    /**
     * @brief Allocate and zero @p size_bytes of guest memory.
     * @throws std::bad_alloc if allocation fails
     * @pre size_bytes > 0
     */
    explicit GuestMemory(size_t size_bytes)
        : data_(std::make_unique<uint8_t[]>(size_bytes))
        , size_(size_bytes)
    {
        gsl_Expects(size_bytes > 0);
        std::memset(data_.get(), 0, size_bytes);
        gsl_Ensures(valid());
    }

    GuestMemory() noexcept : data_(nullptr), size_(0) {}
    ~GuestMemory() = default;

    GuestMemory(const GuestMemory&) = delete;
    GuestMemory& operator=(const GuestMemory&) = delete;

    GuestMemory(GuestMemory&& other) noexcept
        : data_(std::move(other.data_))
        , size_(other.size_)
    {
        other.size_ = 0;
    }

    GuestMemory& operator=(GuestMemory&& other) noexcept {
        if (this != &other) {
            data_ = std::move(other.data_);
            size_ = other.size_;
            other.size_ = 0;
        }
        return *this;
    }

    // ─────────────────────────────────────────────────────────────
    // Element access
    // ─────────────────────────────────────────────────────────────

    /**
     * @throws MemoryAccessException if addr >= size()
     */
    [[nodiscard]] uint8_t read8(uint32_t addr) const {
        validate_address(addr, 1);
        return data_[addr];
    }

    /**
     * @throws MemoryAccessException if addr >= size()
     */
    void write8(uint32_t addr, uint8_t val) {
        validate_address(addr, 1);
        data_[addr] = val;
    }

    /**
     * @brief Read a big-endian 16-bit word (instruction fetch order).
     * @throws MemoryAccessException if addr + 1 >= size()
     */
    [[nodiscard]] uint16_t read16_be(uint32_t addr) const {
        validate_address(addr, 2);
        return static_cast<uint16_t>((data_[addr] << 8) | data_[addr + 1]);
    }

    // ─────────────────────────────────────────────────────────────
    // Block operations
    // ─────────────────────────────────────────────────────────────

    /**
     * @brief Copy a host buffer into guest memory.
     * @throws MemoryAccessException if range exceeds bounds
     */
    void write_block(uint32_t addr, std::span<const uint8_t> src) {
        if (src.empty()) return;
        validate_address(addr, src.size());
        std::memcpy(&data_[addr], src.data(), src.size());
    }

    /**
     * @brief Copy guest memory out to a host buffer.
     * @throws MemoryAccessException if range exceeds bounds
     */
    void read_block(uint32_t addr, std::span<uint8_t> dest) const {
        if (dest.empty()) return;
        validate_address(addr, dest.size());
        std::memcpy(dest.data(), &data_[addr], dest.size());
    }

    /**
     * @throws MemoryAccessException if range exceeds bounds
     */
    void fill(uint32_t addr, uint8_t val, size_t len) {
        if (len == 0) return;
        validate_address(addr, len);
        std::memset(&data_[addr], val, len);
    }

    // ─────────────────────────────────────────────────────────────
    // View accessors
    // ─────────────────────────────────────────────────────────────

    [[nodiscard]] const uint8_t* data() const noexcept { return data_.get(); }
    [[nodiscard]] size_t size() const noexcept { return size_; }

    [[nodiscard]] bool valid() const noexcept {
        return data_ != nullptr && size_ > 0;
    }

    /**
     * @brief Check if [addr, addr + access_size) lies inside the buffer.
     */
    [[nodiscard]] bool in_bounds(uint32_t addr, size_t access_size = 1) const noexcept {
        return addr < size_ && static_cast<size_t>(addr) + access_size <= size_;
    }

    [[nodiscard]] std::span<const uint8_t> as_span() const noexcept {
        return std::span<const uint8_t>(data_.get(), size_);
    }

    /**
     * @throws MemoryAccessException if region exceeds bounds
     */
    [[nodiscard]] std::span<const uint8_t> subspan(uint32_t offset, size_t len) const {
        validate_address(offset, len);
        return std::span<const uint8_t>(&data_[offset], len);
    }

private:
    std::unique_ptr<uint8_t[]> data_;
    size_t size_;

    void validate_address(uint32_t addr, size_t access_size) const {
        if (!in_bounds(addr, access_size)) {
            throw MemoryAccessException(addr, access_size);
        }
    }
};

} // namespace gr8
