#include "vm/memory.hxx"

#include <cstdint>

namespace bft {

template <typename CellT>
Tape<CellT>::Tape(size_t length, bool extensible)
    : cells(length, CellKind<CellT>::zero), allowExtend(extensible) {}

template <typename CellT>
bool Tape<CellT>::grow() {
    if (!allowExtend) return false;
    cells.push_back(CellKind<CellT>::zero);
    return true;
}

template class Tape<uint8_t>;

}  // namespace bft
