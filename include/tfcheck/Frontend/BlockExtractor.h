//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Block extraction entry points.
///
/// Extraction turns scanned lines into the block tree. It is the only place
/// that knows how headers and assignments are recognized, so a real HCL parser
/// can replace it without touching lint rules.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_FRONTEND_BLOCK_EXTRACTOR_H
#define TFCHECK_FRONTEND_BLOCK_EXTRACTOR_H

#include "tfcheck/Frontend/Block.h"
#include "tfcheck/Frontend/LineScanner.h"
#include "tfcheck/Frontend/SourceFile.h"

#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <system_error>

namespace tfcheck
{

/// @brief Structural failure that prevents extracting one file.
class ParseError final : public llvm::ErrorInfo<ParseError>
{
public:
    static char ID;

    /// @brief Constructs a parse error.
    /// @param[in] file Source path.
    /// @param[in] line 1-based line where the failure is attributed.
    /// @param[in] message Human-readable description.
    ParseError(std::string file, std::uint32_t line, std::string message);

    void log(llvm::raw_ostream& os) const override;

    [[nodiscard]] std::error_code convertToErrorCode() const override;

    /// @brief Returns the source path.
    [[nodiscard]] const std::string& file() const
    {
        return file_;
    }

    /// @brief Returns the 1-based line.
    [[nodiscard]] std::uint32_t line() const
    {
        return line_;
    }

    /// @brief Returns the description.
    [[nodiscard]] const std::string& description() const
    {
        return message_;
    }

private:
    std::string   file_;
    std::uint32_t line_;
    std::string   message_;
};

/// @brief Extracts the block tree from an already scanned file.
/// @param[in] source Source snapshot.
/// @param[in] scan Scanner output for the same snapshot.
/// @return Synthetic root block or a @ref ParseError.
[[nodiscard]] llvm::Expected<Block> extractBlocks(const SourceFile& source, const ScanResult& scan);

/// @brief Scans and extracts one file.
/// @param[in] source Source snapshot.
/// @return Synthetic root block or a @ref ParseError.
[[nodiscard]] llvm::Expected<Block> extractBlocks(const SourceFile& source);

}  // namespace tfcheck

#endif  // TFCHECK_FRONTEND_BLOCK_EXTRACTOR_H
