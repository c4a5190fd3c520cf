//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the line-oriented checklist parser.  Lines are sliced out of the
// input as string_views and only the pieces kept in a BindingRecord are
// copied.  Columns in diagnostics are 1-based byte offsets into the line.
//
//===----------------------------------------------------------------------===//

#include "coverage/ChecklistParser.hpp"

#include "support/options.hpp"
#include "support/text_file.hpp"

#include <unordered_map>

namespace mpvbind::coverage
{
namespace
{

constexpr std::string_view kBoundMarker = "- [X] ";
constexpr std::string_view kUnboundMarker = "- [ ] ";
constexpr std::string_view kHeadingPrefix = "# ";
constexpr std::string_view kMalformed = "malformed checklist line: ";

constexpr bool isWhitespace(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\v' || ch == '\f';
}

std::string_view trimRight(std::string_view text)
{
    while (!text.empty() && isWhitespace(text.back()))
        text.remove_suffix(1);
    return text;
}

bool isBlank(std::string_view line)
{
    return trimRight(line).empty();
}

support::Diag malformed(support::SourceLoc loc, std::size_t offset, std::string_view what)
{
    loc.column = static_cast<uint32_t>(offset + 1);
    std::string msg(kMalformed);
    msg += what;
    return support::makeError(loc, std::move(msg));
}

/// @brief Index of the first non-whitespace character, or npos.
std::size_t firstNonBlank(std::string_view line)
{
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (!isWhitespace(line[i]))
            return i;
    }
    return std::string_view::npos;
}

} // namespace

/// @brief Parse one "- [X] `name` (annotation)" line.
///
/// @details The marker must be exactly "- [X] " or "- [ ] "; lowercase "x"
///          and other fillers are rejected so every record has exactly two
///          states.  The symbol name sits between the first pair of backticks
///          and may not contain whitespace.  Anything after the closing
///          backtick must be a single " (...)" annotation ending the line.
support::Expected<BindingRecord> parseChecklistLine(std::string_view line, support::SourceLoc loc)
{
    line = trimRight(line);

    BindingRecord record;
    if (line.substr(0, kBoundMarker.size()) == kBoundMarker)
        record.bound = true;
    else if (line.substr(0, kUnboundMarker.size()) == kUnboundMarker)
        record.bound = false;
    else
        return malformed(loc, 0, "expected '- [ ]' or '- [X]' marker");

    std::size_t pos = kBoundMarker.size();
    if (pos >= line.size() || line[pos] != '`')
        return malformed(loc, pos, "expected '`' before symbol name");

    const std::size_t nameBegin = pos + 1;
    const std::size_t close = line.find('`', nameBegin);
    if (close == std::string_view::npos)
        return malformed(loc, pos, "unterminated symbol name");
    if (close == nameBegin)
        return malformed(loc, nameBegin, "empty symbol name");

    const std::string_view name = line.substr(nameBegin, close - nameBegin);
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        if (isWhitespace(name[i]))
            return malformed(loc, nameBegin + i, "whitespace in symbol name");
    }

    std::string_view tail = line.substr(close + 1);
    if (!tail.empty())
    {
        const std::size_t tailOffset = close + 1;
        if (tail.size() < 3 || tail.substr(0, 2) != " (" || tail.back() != ')')
            return malformed(loc, tailOffset, "unexpected text after symbol name");
        const std::string_view annotation = tail.substr(2, tail.size() - 3);
        if (annotation.empty())
            return malformed(loc, tailOffset + 2, "empty annotation");
        record.annotation = std::string(annotation);
        record.internal = annotation == support::kInternalAnnotation;
    }

    record.name = std::string(name);
    record.loc = loc;
    record.loc.column = static_cast<uint32_t>(nameBegin + 1);
    return record;
}

/// @brief Parse a checklist document line by line.
///
/// @details Blank lines close the current group; runs of blank lines close it
///          only once.  The heading must be the first non-blank line, and only
///          one heading is allowed.  Duplicate names are reported at the
///          second occurrence; the message names the line of the first.
support::Expected<Checklist> parseChecklist(std::string_view text, uint32_t fileId)
{
    Checklist checklist;
    bool sawHeading = false;
    ChecklistGroup current;
    std::unordered_map<std::string, uint32_t> firstSeen;

    uint32_t lineNo = 0;
    std::size_t start = 0;
    while (start <= text.size())
    {
        std::size_t end = text.find('\n', start);
        const bool last = end == std::string_view::npos;
        if (last)
            end = text.size();
        const std::string_view line = text.substr(start, end - start);
        ++lineNo;
        start = end + 1;

        // A trailing newline does not start another line.
        if (last && line.empty())
            break;

        const support::SourceLoc loc{fileId, lineNo, 0};
        if (isBlank(line))
        {
            if (!current.records.empty())
            {
                checklist.groups.push_back(std::move(current));
                current = ChecklistGroup{};
            }
            if (last)
                break;
            continue;
        }

        if (line.substr(0, 1) == "#")
        {
            if (sawHeading)
                return malformed(loc, 0, "unexpected second heading");
            if (line.substr(0, kHeadingPrefix.size()) != kHeadingPrefix)
                return malformed(loc, 0, "expected '# ' heading");
            const std::string_view title = trimRight(line.substr(kHeadingPrefix.size()));
            const std::size_t titleStart = firstNonBlank(title);
            if (titleStart == std::string_view::npos)
                return malformed(loc, kHeadingPrefix.size(), "empty heading");
            checklist.title = std::string(title.substr(titleStart));
            sawHeading = true;
        }
        else
        {
            if (!sawHeading)
                return malformed(loc, 0, "checklist must start with a '# ' heading");

            auto parsed = parseChecklistLine(line, loc);
            if (!parsed)
                return parsed.error();

            BindingRecord &record = parsed.value();
            auto [it, inserted] = firstSeen.emplace(record.name, lineNo);
            if (!inserted)
            {
                return support::makeError(record.loc,
                                          "duplicate symbol '" + record.name +
                                              "' (first listed on line " +
                                              std::to_string(it->second) + ")");
            }
            current.records.push_back(std::move(record));
        }

        if (last)
            break;
    }

    if (!sawHeading)
        return support::makeError({fileId, 0, 0}, "empty checklist: missing '# ' heading");

    if (!current.records.empty())
        checklist.groups.push_back(std::move(current));
    return checklist;
}

support::Expected<Checklist> loadChecklistFile(const std::string &path, support::SourceManager &sm)
{
    std::string buffer;
    auto fileId = support::loadTextFile(path, buffer, sm);
    if (!fileId)
        return fileId.error();
    return parseChecklist(buffer, fileId.value());
}

} // namespace mpvbind::coverage
