//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements ChecklistWriter.  Records print their annotation verbatim, so
// the writer never decides whether a record is internal; registryChecklist()
// and the parser set the annotation text.
//
//===----------------------------------------------------------------------===//

#include "coverage/ChecklistWriter.hpp"

#include "coverage/Registry.hpp"

#include <sstream>

namespace mpvbind::coverage
{

std::string ChecklistWriter::formatRecord(const BindingRecord &record)
{
    std::string line = record.bound ? "- [X] `" : "- [ ] `";
    line += record.name;
    line += '`';
    if (!record.annotation.empty())
    {
        line += " (";
        line += record.annotation;
        line += ')';
    }
    return line;
}

void ChecklistWriter::write(const Checklist &checklist, std::ostream &os)
{
    os << "# " << checklist.title << '\n';
    for (const auto &group : checklist.groups)
    {
        if (group.records.empty())
            continue;
        os << '\n';
        for (const auto &record : group.records)
            os << formatRecord(record) << '\n';
    }
}

std::string ChecklistWriter::toString(const Checklist &checklist)
{
    std::ostringstream os;
    write(checklist, os);
    return os.str();
}

std::string ChecklistWriter::renderRegistry(const support::CoverageOptions &options)
{
    return toString(registryChecklist(options));
}

} // namespace mpvbind::coverage
