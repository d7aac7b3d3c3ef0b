//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Line-oriented lexical scanner for Terraform source text.
///
/// The scanner tracks quoted strings (including template interpolation),
/// line and block comments, and heredoc bodies across lines. It classifies
/// every line and records the bracket events that occur in code, which the
/// block extractor and the formatting rules consume. No expression grammar
/// is involved.
///
//===----------------------------------------------------------------------===//
#ifndef TFCHECK_FRONTEND_LINE_SCANNER_H
#define TFCHECK_FRONTEND_LINE_SCANNER_H

#include "tfcheck/Frontend/SourceFile.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tfcheck
{

/// @brief Lexical classification of one source line.
enum class LineClass
{
    /// @brief Line carries code, possibly followed by a comment.
    Code,

    /// @brief Line is empty or whitespace only.
    Blank,

    /// @brief Line carries only a `#`, `//` or single-line `/* */` comment.
    CommentOnly,

    /// @brief Line lies inside a `/* ... */` comment spanning lines.
    BlockCommentBody,

    /// @brief Line lies inside a heredoc body.
    HeredocBody,

    /// @brief Line closes a heredoc.
    HeredocTerminator,
};

/// @brief Comment marker that starts the comment on a line.
enum class CommentMarker
{
    /// @brief `#` comment.
    Hash,

    /// @brief `//` comment.
    DoubleSlash,

    /// @brief `/*` comment.
    Block,
};

/// @brief One bracket seen in code outside strings and comments.
struct BracketEvent final
{
    /// @brief Bracket character, one of `{}[]()`.
    char bracket{'{'};

    /// @brief 0-based column.
    std::uint32_t column{0};

    /// @brief True for `{`, `[` and `(`.
    [[nodiscard]] bool isOpening() const
    {
        return bracket == '{' || bracket == '[' || bracket == '(';
    }
};

/// @brief Lexical facts about one line.
struct ScannedLine final
{
    /// @brief Line classification.
    LineClass kind{LineClass::Blank};

    /// @brief True when the line starts inside a template interpolation opened on an earlier line.
    bool startsInInterpolation{false};

    /// @brief 0-based column of the first comment marker outside strings, when present.
    std::optional<std::uint32_t> commentColumn;

    /// @brief Marker of the first comment on the line.
    CommentMarker commentMarker{CommentMarker::Hash};

    /// @brief Code text with comments removed and trailing whitespace trimmed; string contents kept.
    std::string code;

    /// @brief Raw line with string contents masked by `x` and comments blanked.
    ///
    /// Columns match the raw line, so structural patterns can be matched on the
    /// skeleton and names cut from the raw text at the same positions.
    std::string skeleton;

    /// @brief Brackets in code order, outside strings, interpolations and comments.
    std::vector<BracketEvent> brackets;

    /// @brief Bracket nesting level at the start of the line, after the line's leading closers.
    ///
    /// Brackets opened on one line count as a single level.
    std::uint32_t indentLevel{0};

    /// @brief True when the line opens a heredoc whose body starts on the next line.
    bool opensHeredoc{false};
};

/// @brief Lexical failure detected by the scanner.
struct LexicalProblem final
{
    /// @brief 1-based line where the failure is attributed.
    std::uint32_t line{1};

    /// @brief Human-readable description.
    std::string message;
};

/// @brief Full scan output for one file.
struct ScanResult final
{
    /// @brief One entry per source line; line `n` lives at index `n - 1`.
    std::vector<ScannedLine> lines;

    /// @brief First lexical failure, when any.
    std::optional<LexicalProblem> problem;

    /// @brief Returns one line by 1-based number.
    [[nodiscard]] const ScannedLine& line(std::uint32_t number) const
    {
        return lines[number - 1];
    }

    /// @brief Returns true when the 1-based line is part of a heredoc body or terminator.
    [[nodiscard]] bool isHeredocLine(std::uint32_t number) const;

    /// @brief Returns true when the 1-based line is blank.
    [[nodiscard]] bool isBlankLine(std::uint32_t number) const;
};

/// @brief Scans a source file line by line.
/// @param[in] source Source snapshot.
/// @return Per-line lexical facts and the first lexical problem, if any.
[[nodiscard]] ScanResult scanLines(const SourceFile& source);

}  // namespace tfcheck

#endif  // TFCHECK_FRONTEND_LINE_SCANNER_H
