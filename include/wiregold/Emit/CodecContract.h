//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Spelling of codec-under-test operations in generated artifacts.
///
/// Generated sources reach the codec only through the symbols rendered here:
/// `Reader`, `Writer`, `Tag`, `readTag`/`writeTag`, `read<Kind>`/`write<Kind>`,
/// `readPacked`, `skipUnknown`, `DecodeError` and `DecodeErrorKind`.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_EMIT_CODECCONTRACT_H
#define WIREGOLD_EMIT_CODECCONTRACT_H

#include "wiregold/Domain/ScalarKind.h"
#include "wiregold/Domain/WireType.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <ostream>
#include <string>

namespace wiregold
{

/// @brief Optional helpers added to an artifact prelude.
struct PreludeOptions final
{
    /// @brief `floatBits`/`floatFromBits`.
    bool floatBits{false};

    /// @brief `doubleBits`/`doubleFromBits`.
    bool doubleBits{false};

    /// @brief `hexOf` for mismatch reports.
    bool hexOf{false};
};

class CodecContract final
{
public:
    /// @brief Binds the contract to one header and namespace.
    /// @param[in] header Include path of the codec header.
    /// @param[in] codecNamespace Namespace of the codec symbols, `::`-nested allowed.
    CodecContract(std::string header, std::string codecNamespace);

    [[nodiscard]] const std::string& header() const
    {
        return header_;
    }

    /// @brief Returns `<namespace>::<symbol>`.
    [[nodiscard]] std::string qualify(llvm::StringRef symbol) const;

    /// @brief Renders a read of one @p kind value from @p reader.
    ///
    /// @details Unwrapped kinds (zigzag, enum) get a trailing `.value`.
    /// Float kinds are read as their floating type; see @ref readBitsExpr.
    [[nodiscard]] std::string readExpr(ScalarKind kind, llvm::StringRef reader) const;

    /// @brief Renders a read yielding the IEEE-754 bit pattern of a float kind.
    [[nodiscard]] std::string readBitsExpr(ScalarKind kind, llvm::StringRef reader) const;

    /// @brief Renders a write statement (without `;`) of @p value to @p writer.
    [[nodiscard]] std::string writeExpr(ScalarKind kind, llvm::StringRef writer, llvm::StringRef value) const;

    /// @brief Renders a write of a float kind given its bit pattern.
    [[nodiscard]] std::string writeBitsExpr(ScalarKind kind, llvm::StringRef writer, llvm::StringRef bits) const;

    /// @brief Renders `writeTag(writer, N, W)` (without `;`).
    [[nodiscard]] std::string writeTagExpr(llvm::StringRef writer, std::uint32_t number, WireType wireType) const;

    /// @brief Writes the banner, includes and the anonymous-namespace prelude.
    ///
    /// @details The prelude always defines `Bytes`, `decodeFixture` and
    /// `runCheck`. Helpers selected in @p options are added after them.
    void emitPrelude(std::ostream& out, llvm::StringRef source, const PreludeOptions& options) const;

private:
    std::string header_;
    std::string namespace_;
};

/// @brief Renders a wire type as the unsigned literal used in tag checks (`2U`).
[[nodiscard]] std::string wireTypeLiteral(WireType type);

}  // namespace wiregold

#endif  // WIREGOLD_EMIT_CODECCONTRACT_H
