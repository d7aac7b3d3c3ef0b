//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the line-oriented lexical scanner.
///
/// The scanner is a small state machine over characters. Quoted strings may
/// contain `${ }` and `%{ }` template sequences whose contents are code again,
/// so string and interpolation modes are kept on a stack. Heredoc markers are
/// queued while a line is scanned and their bodies are consumed verbatim on the
/// following lines.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Frontend/LineScanner.h"

#include <cctype>
#include <cstddef>
#include <deque>
#include <utility>

namespace tfcheck
{

namespace
{

std::string trimRight(std::string text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.pop_back();
    }
    return text;
}

std::string trimLeft(const std::string& text)
{
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
    {
        ++i;
    }
    return text.substr(i);
}

bool isIdentifierStart(const char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(const char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool matches(const char open, const char close)
{
    return (open == '{' && close == '}') || (open == '[' && close == ']') || (open == '(' && close == ')');
}

class LineScanner final
{
public:
    explicit LineScanner(const SourceFile& source)
        : source_(source)
    {
    }

    ScanResult scan()
    {
        result_.lines.reserve(source_.lines.size());
        for (std::uint32_t number = 1; number <= source_.lineCount(); ++number)
        {
            result_.lines.push_back(scanLine(number, source_.line(number)));
        }
        finish();
        return std::move(result_);
    }

private:
    enum class ModeKind
    {
        String,
        Interpolation,
    };

    struct Mode final
    {
        ModeKind      kind{ModeKind::String};
        std::uint32_t braceDepth{0};
    };

    struct Heredoc final
    {
        std::string   marker;
        bool          indented{false};
        std::uint32_t openedAt{0};
    };

    struct OpenBracket final
    {
        char          bracket{'{'};
        std::uint32_t line{0};
    };

    void fail(const std::uint32_t line, std::string message)
    {
        if (!result_.problem)
        {
            result_.problem = LexicalProblem{line, std::move(message)};
        }
    }

    [[nodiscard]] bool inString() const
    {
        return !modes_.empty() && modes_.back().kind == ModeKind::String;
    }

    ScannedLine scanLine(const std::uint32_t number, const std::string& text)
    {
        ScannedLine out;
        if (activeHeredoc_)
        {
            const bool closes = activeHeredoc_->indented ? trimLeft(text) == activeHeredoc_->marker
                                                         : text == activeHeredoc_->marker;
            if (closes)
            {
                out.kind = LineClass::HeredocTerminator;
                activeHeredoc_.reset();
                activateNextHeredoc();
            }
            else
            {
                out.kind = LineClass::HeredocBody;
            }
            out.indentLevel = currentLevel(0);
            return out;
        }

        out.startsInInterpolation        = !modes_.empty();
        const bool  startedInBlockComment = inBlockComment_;
        std::string code;
        std::string skeleton = text;
        std::size_t i        = 0;
        while (i < text.size())
        {
            const char c    = text[i];
            const char next = i + 1 < text.size() ? text[i + 1] : '\0';

            if (inBlockComment_)
            {
                skeleton[i] = ' ';
                if (c == '*' && next == '/')
                {
                    inBlockComment_ = false;
                    skeleton[i + 1] = ' ';
                    code.push_back(' ');
                    i += 2;
                    continue;
                }
                ++i;
                continue;
            }

            if (inString())
            {
                code.push_back(c);
                if (c == '"')
                {
                    modes_.pop_back();
                    ++i;
                    continue;
                }
                skeleton[i] = 'x';
                if (c == '\\' && i + 1 < text.size())
                {
                    code.push_back(next);
                    skeleton[i + 1] = 'x';
                    i += 2;
                    continue;
                }
                if ((c == '$' || c == '%') && next == c && i + 2 < text.size() && text[i + 2] == '{')
                {
                    // `$${` and `%%{` are literal escapes.
                    code.append(text, i + 1, 2);
                    skeleton.replace(i + 1, 2, 2, 'x');
                    i += 3;
                    continue;
                }
                if ((c == '$' || c == '%') && next == '{')
                {
                    code.push_back(next);
                    skeleton[i + 1] = 'x';
                    modes_.push_back(Mode{ModeKind::Interpolation, 0});
                    i += 2;
                    continue;
                }
                ++i;
                continue;
            }

            if (c == '#' || (c == '/' && next == '/'))
            {
                noteComment(out, static_cast<std::uint32_t>(i), c == '#' ? CommentMarker::Hash
                                                                         : CommentMarker::DoubleSlash);
                skeleton.replace(i, skeleton.size() - i, skeleton.size() - i, ' ');
                break;
            }
            if (c == '/' && next == '*')
            {
                noteComment(out, static_cast<std::uint32_t>(i), CommentMarker::Block);
                inBlockComment_ = true;
                skeleton[i]     = ' ';
                skeleton[i + 1] = ' ';
                i += 2;
                continue;
            }
            if (c == '"')
            {
                modes_.push_back(Mode{ModeKind::String, 0});
                code.push_back(c);
                ++i;
                continue;
            }
            if (c == '<' && next == '<')
            {
                const std::size_t consumed = tryHeredocMarker(text, i, number);
                if (consumed > 0)
                {
                    if (!modes_.empty())
                    {
                        skeleton.replace(i, consumed, consumed, 'x');
                    }
                    out.opensHeredoc = true;
                    code.append(text, i, consumed);
                    i += consumed;
                    continue;
                }
            }

            if (!modes_.empty())
            {
                skeleton[i]         = 'x';
                Mode& interpolation = modes_.back();
                if (c == '{')
                {
                    ++interpolation.braceDepth;
                }
                else if (c == '}')
                {
                    if (interpolation.braceDepth == 0)
                    {
                        modes_.pop_back();
                    }
                    else
                    {
                        --interpolation.braceDepth;
                    }
                }
                code.push_back(c);
                ++i;
                continue;
            }

            if (c == '{' || c == '}' || c == '[' || c == ']' || c == '(' || c == ')')
            {
                out.brackets.push_back(BracketEvent{c, static_cast<std::uint32_t>(i)});
            }
            code.push_back(c);
            ++i;
        }

        if (inString())
        {
            fail(number, "unterminated string literal");
            modes_.clear();
        }

        out.code     = trimRight(std::move(code));
        out.skeleton = trimRight(std::move(skeleton));
        if (out.code.find_first_not_of(" \t") == std::string::npos)
        {
            out.code.clear();
            out.skeleton.clear();
            if (startedInBlockComment)
            {
                out.kind = LineClass::BlockCommentBody;
            }
            else if (out.commentColumn)
            {
                out.kind = LineClass::CommentOnly;
            }
            else
            {
                out.kind = LineClass::Blank;
            }
        }
        else
        {
            out.kind = LineClass::Code;
        }

        out.indentLevel = currentLevel(leadingClosers(out));
        applyBrackets(number, out);
        if (!activeHeredoc_)
        {
            activateNextHeredoc();
        }
        return out;
    }

    static void noteComment(ScannedLine& out, const std::uint32_t column, const CommentMarker marker)
    {
        if (!out.commentColumn)
        {
            out.commentColumn = column;
            out.commentMarker = marker;
        }
    }

    std::size_t tryHeredocMarker(const std::string& text, const std::size_t at, const std::uint32_t number)
    {
        std::size_t j        = at + 2;
        bool        indented = false;
        if (j < text.size() && text[j] == '-')
        {
            indented = true;
            ++j;
        }
        if (j >= text.size() || !isIdentifierStart(text[j]))
        {
            return 0;
        }
        const std::size_t markerStart = j;
        while (j < text.size() && isIdentifierChar(text[j]))
        {
            ++j;
        }
        pendingHeredocs_.push_back(Heredoc{text.substr(markerStart, j - markerStart), indented, number});
        return j - at;
    }

    void activateNextHeredoc()
    {
        if (!pendingHeredocs_.empty())
        {
            activeHeredoc_ = std::move(pendingHeredocs_.front());
            pendingHeredocs_.pop_front();
        }
    }

    static std::uint32_t leadingClosers(const ScannedLine& line)
    {
        if (line.startsInInterpolation)
        {
            return 0;
        }
        std::uint32_t count = 0;
        for (const char c : line.code)
        {
            if (c == '}' || c == ']' || c == ')')
            {
                ++count;
            }
            else if (c != ' ' && c != '\t')
            {
                break;
            }
        }
        return count;
    }

    [[nodiscard]] std::uint32_t currentLevel(const std::uint32_t closers) const
    {
        const std::size_t remaining = closers >= open_.size() ? 0 : open_.size() - closers;
        std::uint32_t     level     = 0;
        for (std::size_t k = 0; k < remaining; ++k)
        {
            if (k == 0 || open_[k].line != open_[k - 1].line)
            {
                ++level;
            }
        }
        return level;
    }

    void applyBrackets(const std::uint32_t number, const ScannedLine& line)
    {
        for (const BracketEvent& event : line.brackets)
        {
            if (event.isOpening())
            {
                open_.push_back(OpenBracket{event.bracket, number});
                continue;
            }
            if (open_.empty())
            {
                fail(number, std::string("unexpected '") + event.bracket + "' without matching opener");
                continue;
            }
            if (!matches(open_.back().bracket, event.bracket))
            {
                fail(number,
                     std::string("'") + event.bracket + "' does not match '" + open_.back().bracket +
                         "' opened at line " + std::to_string(open_.back().line));
            }
            open_.pop_back();
        }
    }

    void finish()
    {
        const std::uint32_t last = source_.lineCount() == 0 ? 1 : source_.lineCount();
        if (activeHeredoc_)
        {
            fail(activeHeredoc_->openedAt,
                 "unterminated heredoc '" + activeHeredoc_->marker + "' opened at line " +
                     std::to_string(activeHeredoc_->openedAt));
        }
        if (inBlockComment_)
        {
            fail(last, "unterminated block comment at end of file");
        }
        if (!modes_.empty())
        {
            fail(last, "unterminated template interpolation at end of file");
        }
        if (!open_.empty())
        {
            fail(open_.back().line,
                 std::string("unterminated '") + open_.back().bracket + "' opened at line " +
                     std::to_string(open_.back().line));
        }
    }

    const SourceFile&        source_;
    ScanResult               result_;
    std::vector<Mode>        modes_;
    std::vector<OpenBracket> open_;
    std::deque<Heredoc>      pendingHeredocs_;
    std::optional<Heredoc>   activeHeredoc_;
    bool                     inBlockComment_{false};
};

}  // namespace

bool ScanResult::isHeredocLine(const std::uint32_t number) const
{
    const LineClass kind = line(number).kind;
    return kind == LineClass::HeredocBody || kind == LineClass::HeredocTerminator;
}

bool ScanResult::isBlankLine(const std::uint32_t number) const
{
    return line(number).kind == LineClass::Blank;
}

ScanResult scanLines(const SourceFile& source)
{
    return LineScanner(source).scan();
}

}  // namespace tfcheck
