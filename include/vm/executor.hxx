#pragma once

// Included from vm.hxx after VmOptions and ProfileInfo are declared.

#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace bft {

/// @brief Runs one validated Program against a tape of CellT cells.
/// @tparam CellT Cell type, must have a CellKind specialization (uint8_t).
///
/// The VM borrows the program for its whole lifetime and owns the tape, the head and the
/// instruction cursor. It is meant for a single interpret() call; the tape stays readable
/// afterwards for dumps. Input and output are whatever streams the caller passes in,
/// diagnostics (trace, prompt, warnings) always go to std::cerr.
template <typename CellT>
class VirtualMachine {
   public:
    /// @param length Tape length in cells. 0 selects BFT_DEFAULT_TAPE_SIZE.
    /// @param extensible Allow the tape to grow by one cell when the head moves past its end.
    /// @param program Must outlive the VM and should have passed Program::validate().
    VirtualMachine(size_t length, bool extensible, const Program& program,
                   VmOptions options = {});

    /// @brief Executes the program until it ends or an instruction fails.
    ///
    /// Whatever the outcome, a newline is written to 'out' afterwards unless the last byte
    /// written was already one. A failure of that final write is only logged.
    /// @return The first error met, or success.
    Status interpret(std::istream& in, std::ostream& out);

    // Single operations, each acting on behalf of the instruction under the cursor.
    Status moveHeadRight();
    Status moveHeadLeft();
    void incrementCell() noexcept;
    void decrementCell() noexcept;
    Status readValue(std::istream& in);
    Status writeValue(std::ostream& out);
    Status startLoop();
    Status endLoop();

    size_t head() const noexcept { return headIdx; }
    size_t cursor() const noexcept { return pc; }
    const Tape<CellT>& tape() const noexcept { return cells; }
    const Program& program() const noexcept { return prog; }

   private:
    Status step(std::istream& in, std::ostream& out);
    void finish(std::ostream& out);
    instruction current(insType fallback) const;

    const Program& prog;
    Tape<CellT> cells;
    size_t headIdx = 0;
    size_t pc = 0;
    VmOptions opts;
    // Last byte successfully written, -1 before the first write.
    int tail = -1;
};

extern template class VirtualMachine<uint8_t>;

}  // namespace bft
