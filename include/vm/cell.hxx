#pragma once

#include <cstdint>

namespace bft {

/// @brief Operations the VM needs from a tape cell.
///
/// Specialize for each cell type. A specialization provides a zero value, wrapping
/// increment/decrement, a zero test for loops, and byte conversion for I/O.
/// The primary template is left undefined, so an unsupported cell type fails to compile.
template <typename CellT>
struct CellKind;

template <>
struct CellKind<uint8_t> {
    static constexpr uint8_t zero = 0;

    static void increment(uint8_t& cell) noexcept { cell = static_cast<uint8_t>(cell + 1u); }
    static void decrement(uint8_t& cell) noexcept { cell = static_cast<uint8_t>(cell - 1u); }
    static bool isZero(uint8_t cell) noexcept { return cell == 0; }
    static uint8_t getValue(uint8_t cell) noexcept { return cell; }
    static void setValue(uint8_t& cell, uint8_t value) noexcept { cell = value; }
};

}  // namespace bft
