#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "vm/cell.hxx"

namespace bft {

/// @brief Cell storage of the VM. Grows only at the high end, one cell at a time, and never
/// shrinks.
template <typename CellT>
class Tape {
   public:
    Tape(size_t length, bool extensible);

    size_t size() const noexcept { return cells.size(); }
    bool extensible() const noexcept { return allowExtend; }

    CellT& operator[](size_t i) noexcept { return cells[i]; }
    const CellT& operator[](size_t i) const noexcept { return cells[i]; }
    const std::vector<CellT>& data() const noexcept { return cells; }

    /// @brief Appends one zero cell if the tape is extensible.
    /// @return false for a fixed-size tape, which is left unchanged.
    bool grow();

   private:
    std::vector<CellT> cells;
    bool allowExtend;
};

extern template class Tape<uint8_t>;

}  // namespace bft
