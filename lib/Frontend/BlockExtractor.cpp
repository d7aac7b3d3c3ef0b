//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements block extraction over scanned lines.
///
/// Extraction walks each code line's bracket events in order. Text between
/// two events is a segment; a segment at the start of a statement may be an
/// assignment, and a segment right before `{` may be a block header. A frame
/// stack mirrors the open brackets so that parameters land in the innermost
/// block or object literal and multi-line values get their end line when the
/// bracket that carries them closes.
///
//===----------------------------------------------------------------------===//

#include "tfcheck/Frontend/BlockExtractor.h"

#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>
#include <utility>
#include <vector>

namespace tfcheck
{

char ParseError::ID = 0;

ParseError::ParseError(std::string file, const std::uint32_t line, std::string message)
    : file_(std::move(file))
    , line_(line)
    , message_(std::move(message))
{
}

void ParseError::log(llvm::raw_ostream& os) const
{
    os << file_ << ':' << line_ << ": " << message_;
}

std::error_code ParseError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

namespace
{

const std::regex& headerPattern()
{
    static const std::regex pattern(
        R"(^\s*([A-Za-z_][A-Za-z0-9_-]*)(?:\s+("[^"]*"|'[^']*'|[A-Za-z_][A-Za-z0-9_-]*))?)"
        R"((?:\s+("[^"]*"|'[^']*'|[A-Za-z_][A-Za-z0-9_-]*))?\s*$)");
    return pattern;
}

const std::regex& assignmentPattern()
{
    static const std::regex pattern(R"(^(\s*)("[^"]*"|[A-Za-z_][A-Za-z0-9_-]*)\s*=(?![=>]))");
    return pattern;
}

std::string trim(const std::string& text)
{
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos)
    {
        return {};
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

bool isBlankRange(const std::string& text, const std::size_t begin, const std::size_t end)
{
    for (std::size_t i = begin; i < end && i < text.size(); ++i)
    {
        if (text[i] != ' ' && text[i] != '\t' && text[i] != ',')
        {
            return false;
        }
    }
    return true;
}

BlockKind topLevelKind(const std::string& keyword)
{
    if (keyword == "resource")
    {
        return BlockKind::Resource;
    }
    if (keyword == "data")
    {
        return BlockKind::Data;
    }
    if (keyword == "variable")
    {
        return BlockKind::Variable;
    }
    if (keyword == "output")
    {
        return BlockKind::Output;
    }
    if (keyword == "locals")
    {
        return BlockKind::Locals;
    }
    if (keyword == "terraform")
    {
        return BlockKind::Terraform;
    }
    if (keyword == "provider")
    {
        return BlockKind::Provider;
    }
    if (keyword == "module")
    {
        return BlockKind::Module;
    }
    return BlockKind::Other;
}

class BlockExtractor final
{
public:
    BlockExtractor(const SourceFile& source, const ScanResult& scan)
        : source_(source)
        , scan_(scan)
    {
        root_.kind      = BlockKind::Root;
        root_.startLine = 1;
        root_.endLine   = source.lineCount() == 0 ? 1 : source.lineCount();
    }

    llvm::Expected<Block> extract()
    {
        if (scan_.problem)
        {
            return llvm::make_error<ParseError>(source_.path, scan_.problem->line, scan_.problem->message);
        }

        frames_.push_back(Frame{FrameKind::Block, &root_, &root_.parameters, nullptr, 0, 0});
        for (std::uint32_t n = 1; n <= source_.lineCount(); ++n)
        {
            const ScannedLine& line = scan_.line(n);
            switch (line.kind)
            {
            case LineClass::Code:
                if (llvm::Error err = processCodeLine(n, line))
                {
                    return std::move(err);
                }
                break;
            case LineClass::HeredocBody:
                if (heredocOwner_ != nullptr)
                {
                    heredocOwner_->value += "\n" + source_.line(n);
                }
                break;
            case LineClass::HeredocTerminator:
                if (heredocOwner_ != nullptr)
                {
                    heredocOwner_->value += "\n" + source_.line(n);
                    heredocOwner_->endLine = n;
                    if (n == source_.lineCount() || !scan_.isHeredocLine(n + 1))
                    {
                        heredocOwner_ = nullptr;
                    }
                }
                break;
            case LineClass::Blank:
            case LineClass::CommentOnly:
            case LineClass::BlockCommentBody:
                break;
            }
        }
        if (frames_.size() != 1)
        {
            const Frame& open = frames_.back();
            return llvm::make_error<ParseError>(source_.path, open.openedLine, "unterminated block at end of file");
        }
        return std::move(root_);
    }

private:
    enum class FrameKind
    {
        Block,
        Object,
        List,
        Opaque,
    };

    struct Frame final
    {
        FrameKind               kind{FrameKind::Opaque};
        Block*                  block{nullptr};
        std::vector<Parameter>* members{nullptr};
        Parameter*              owner{nullptr};
        std::uint32_t           openedLine{0};
        std::uint32_t           ownerValueColumn{0};
    };

    [[nodiscard]] static bool isBody(const Frame& frame)
    {
        return frame.kind == FrameKind::Block || frame.kind == FrameKind::Object;
    }

    /// Raw text of the code portion of line `n`, comments excluded.
    [[nodiscard]] std::string codeText(const std::uint32_t n) const
    {
        const std::string& raw = source_.line(n);
        return raw.substr(0, std::min(raw.size(), scan_.line(n).skeleton.size()));
    }

    llvm::Error processCodeLine(const std::uint32_t n, const ScannedLine& line)
    {
        const std::string& raw      = source_.line(n);
        const std::string& skeleton = line.skeleton;
        bool               start    = !line.startsInInterpolation;
        std::size_t        segStart = 0;
        valueParam_                 = nullptr;

        for (const BracketEvent& event : line.brackets)
        {
            const bool startBefore = start;
            Parameter* assigned    = consumeSegment(n, raw, skeleton, segStart, event.column, start);
            if (event.isOpening())
            {
                openFrame(n, raw, skeleton, segStart, event, startBefore, assigned, start);
            }
            else if (llvm::Error err = closeFrame(n, event.column, start))
            {
                return err;
            }
            segStart = event.column + 1;
        }
        consumeSegment(n, raw, skeleton, segStart, skeleton.size(), start);

        heredocOwner_ = line.opensHeredoc ? valueParam_ : nullptr;
        valueParam_   = nullptr;
        return llvm::Error::success();
    }

    Parameter* consumeSegment(const std::uint32_t n,
                              const std::string&  raw,
                              const std::string&  skeleton,
                              std::size_t         begin,
                              const std::size_t   end,
                              bool&               start)
    {
        Frame& top = frames_.back();
        if (!isBody(top))
        {
            start = false;
            return nullptr;
        }

        Parameter* created = nullptr;
        while (begin < end)
        {
            std::size_t stop = end;
            if (top.kind == FrameKind::Object)
            {
                const std::size_t comma = skeleton.find(',', begin);
                if (comma != std::string::npos && comma < end)
                {
                    stop = comma;
                }
            }
            if (start)
            {
                if (Parameter* parameter = tryAssignment(n, raw, skeleton, begin, stop, top))
                {
                    created = parameter;
                }
            }
            if (!isBlankRange(skeleton, begin, stop))
            {
                start = false;
            }
            if (stop < end)
            {
                finishValueAt(n, raw, stop);
                start   = true;
                created = nullptr;
                begin   = stop + 1;
                continue;
            }
            break;
        }
        return created;
    }

    Parameter* tryAssignment(const std::uint32_t n,
                             const std::string&  raw,
                             const std::string&  skeleton,
                             const std::size_t   begin,
                             const std::size_t   end,
                             Frame&              top)
    {
        const std::string piece = skeleton.substr(begin, end - begin);
        std::smatch       match;
        if (!std::regex_search(piece, match, assignmentPattern()))
        {
            return nullptr;
        }

        const std::size_t nameColumn = begin + static_cast<std::size_t>(match.length(1));
        std::string       name       = raw.substr(nameColumn, static_cast<std::size_t>(match.length(2)));
        Parameter         parameter;
        parameter.isQuotedName = !name.empty() && name.front() == '"';
        if (parameter.isQuotedName)
        {
            name = name.substr(1, name.size() - 2);
        }
        parameter.name         = std::move(name);
        parameter.line         = n;
        parameter.endLine      = n;
        parameter.indent       = static_cast<std::uint32_t>(nameColumn);
        parameter.equalsColumn = static_cast<std::uint32_t>(begin + static_cast<std::size_t>(match.length(0)) - 1);
        parameter.isMeta       = top.kind == FrameKind::Block && isMetaArgumentName(parameter.name);
        const std::size_t valueColumn = parameter.equalsColumn + 1;
        const std::string code        = codeText(n);
        parameter.value               = trim(code.substr(std::min(valueColumn, code.size())));

        top.members->push_back(std::move(parameter));
        valueParam_      = &top.members->back();
        valueFrameIndex_ = frames_.size() - 1;
        valueColumn_     = static_cast<std::uint32_t>(valueColumn);
        return valueParam_;
    }

    /// Cuts the value of the parameter assigned on this line at `column`.
    void finishValueAt(const std::uint32_t n, const std::string& raw, const std::size_t column)
    {
        if (valueParam_ == nullptr || valueParam_->line != n || valueFrameIndex_ != frames_.size() - 1)
        {
            return;
        }
        if (column >= valueColumn_)
        {
            valueParam_->value = trim(raw.substr(valueColumn_, column - valueColumn_));
        }
        valueParam_ = nullptr;
    }

    void openFrame(const std::uint32_t n,
                   const std::string&  raw,
                   const std::string&  skeleton,
                   const std::size_t   segStart,
                   const BracketEvent& event,
                   const bool          startBefore,
                   Parameter*          assigned,
                   bool&               start)
    {
        Frame&            top    = frames_.back();
        const std::size_t column = event.column;
        const bool        comprehension = startsWithForKeyword(skeleton, column + 1);

        if (assigned != nullptr && isBlankRange(skeleton, assigned->equalsColumn + 1, column) &&
            event.bracket != '(')
        {
            assigned->shape = ParameterShape::CollectionLiteral;
            if (comprehension)
            {
                pushOwned(FrameKind::Opaque, nullptr, assigned, n, column);
            }
            else if (event.bracket == '{')
            {
                pushOwned(FrameKind::Object, &assigned->entries, assigned, n, column);
                start = true;
            }
            else
            {
                pushOwned(FrameKind::List, &assigned->entries, assigned, n, column);
            }
            return;
        }

        if (assigned != nullptr)
        {
            pushOwned(FrameKind::Opaque, nullptr, assigned, n, column);
            return;
        }

        if (event.bracket == '{' && top.kind == FrameKind::Block && startBefore && !comprehension)
        {
            std::smatch       match;
            const std::string head = skeleton.substr(segStart, column - segStart);
            if (std::regex_search(head, match, headerPattern()))
            {
                pushBlock(n, raw, segStart, match);
                start = true;
                return;
            }
        }

        if (event.bracket == '{' && top.kind == FrameKind::List && top.members != nullptr && !comprehension &&
            isBlankRange(skeleton, segStart, column))
        {
            Parameter anonymous;
            anonymous.line    = n;
            anonymous.endLine = n;
            anonymous.indent  = static_cast<std::uint32_t>(column);
            anonymous.shape   = ParameterShape::CollectionLiteral;
            top.members->push_back(std::move(anonymous));
            Parameter* entry = &top.members->back();
            pushOwned(FrameKind::Object, &entry->entries, entry, n, column);
            start = true;
            return;
        }

        pushOwned(FrameKind::Opaque, nullptr, nullptr, n, column);
    }

    void pushOwned(const FrameKind           kind,
                   std::vector<Parameter>*   members,
                   Parameter*                owner,
                   const std::uint32_t       n,
                   const std::size_t         column)
    {
        std::uint32_t valueColumn = 0;
        if (owner != nullptr)
        {
            valueColumn = owner->name.empty() ? static_cast<std::uint32_t>(column) : owner->equalsColumn + 1;
        }
        frames_.push_back(Frame{kind, nullptr, members, owner, n, valueColumn});
    }

    void pushBlock(const std::uint32_t n, const std::string& raw, const std::size_t segStart, const std::smatch& match)
    {
        Block& parent = *frames_.back().block;

        Block block;
        block.keyword   = match.str(1);
        block.startLine = n;
        block.endLine   = n;
        block.indent    = static_cast<std::uint32_t>(segStart + static_cast<std::size_t>(match.position(1)));
        block.depth     = parent.kind == BlockKind::Root ? 0 : parent.depth + 1;
        if (parent.kind == BlockKind::Root)
        {
            block.kind = topLevelKind(block.keyword);
        }
        else
        {
            block.kind = block.keyword == "dynamic" ? BlockKind::Dynamic : BlockKind::NestedStructure;
        }
        block.typeLabel = makeLabel(raw, segStart, match, 2);
        block.nameLabel = makeLabel(raw, segStart, match, 3);

        parent.children.push_back(std::move(block));
        Block* child = &parent.children.back();
        frames_.push_back(Frame{FrameKind::Block, child, &child->parameters, nullptr, n, 0});
    }

    static std::optional<BlockLabel> makeLabel(const std::string& raw,
                                               const std::size_t  segStart,
                                               const std::smatch& match,
                                               const std::size_t  group)
    {
        if (!match[group].matched)
        {
            return std::nullopt;
        }
        const std::size_t column = segStart + static_cast<std::size_t>(match.position(group));
        std::string       text   = raw.substr(column, static_cast<std::size_t>(match.length(group)));
        BlockLabel        label;
        label.column = static_cast<std::uint32_t>(column);
        if (!text.empty() && (text.front() == '"' || text.front() == '\''))
        {
            label.quote = text.front();
            text        = text.substr(1, text.size() - 2);
        }
        label.text = std::move(text);
        return label;
    }

    static bool startsWithForKeyword(const std::string& skeleton, std::size_t at)
    {
        while (at < skeleton.size() && (skeleton[at] == ' ' || skeleton[at] == '\t'))
        {
            ++at;
        }
        if (skeleton.compare(at, 3, "for") != 0)
        {
            return false;
        }
        return at + 3 >= skeleton.size() || !(std::isalnum(static_cast<unsigned char>(skeleton[at + 3])) ||
                                              skeleton[at + 3] == '_');
    }

    llvm::Error closeFrame(const std::uint32_t n, const std::uint32_t column, bool& start)
    {
        if (frames_.size() <= 1)
        {
            return llvm::make_error<ParseError>(source_.path, n, "closing bracket without matching block");
        }
        if (valueParam_ != nullptr && valueFrameIndex_ == frames_.size() - 1)
        {
            finishValueAt(n, source_.line(n), column);
        }

        const Frame frame = frames_.back();
        frames_.pop_back();
        if (frame.block != nullptr)
        {
            frame.block->endLine = n;
        }
        if (frame.owner != nullptr)
        {
            frame.owner->endLine = n;
            if (frame.openedLine < n)
            {
                frame.owner->value = joinValue(frame.openedLine, frame.ownerValueColumn, n, column);
            }
        }
        start = false;
        return llvm::Error::success();
    }

    [[nodiscard]] std::string joinValue(const std::uint32_t firstLine,
                                        const std::uint32_t firstColumn,
                                        const std::uint32_t lastLine,
                                        const std::uint32_t lastColumn) const
    {
        std::string       value;
        const std::string first = codeText(firstLine);
        value += trim(first.substr(std::min<std::size_t>(firstColumn, first.size())));
        for (std::uint32_t k = firstLine + 1; k < lastLine; ++k)
        {
            value += "\n" + (scan_.isHeredocLine(k) ? source_.line(k) : codeText(k));
        }
        const std::string last = codeText(lastLine);
        value += "\n" + trim(last.substr(0, std::min<std::size_t>(lastColumn + 1, last.size())));
        return value;
    }

    const SourceFile&  source_;
    const ScanResult&  scan_;
    Block              root_;
    std::vector<Frame> frames_;
    Parameter*         valueParam_{nullptr};
    std::size_t        valueFrameIndex_{0};
    std::uint32_t      valueColumn_{0};
    Parameter*         heredocOwner_{nullptr};
};

}  // namespace

llvm::Expected<Block> extractBlocks(const SourceFile& source, const ScanResult& scan)
{
    return BlockExtractor(source, scan).extract();
}

llvm::Expected<Block> extractBlocks(const SourceFile& source)
{
    const ScanResult scan = scanLines(source);
    return extractBlocks(source, scan);
}

}  // namespace tfcheck
