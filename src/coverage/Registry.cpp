//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the binding registry.  Rows come from ApiSymbols.def and are
// materialized into BindingRecords on first access.  A stable sort by group
// keeps the table order within each group while guaranteeing ApiGroup order
// even if a row is appended out of place.  Debug builds validate the table
// during construction and assert on violations; release builds rely on
// selfCheckBindingRegistry() being called by tests.
//
//===----------------------------------------------------------------------===//

#include "coverage/Registry.hpp"

#include "support/diag_expected.hpp"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <iterator>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace mpvbind::coverage
{
namespace
{

struct SymbolRow
{
    ApiGroup group;
    std::string_view name;
    bool bound;
    bool internal;
};

constexpr SymbolRow kSymbolRows[] = {
#define MPV_SYMBOL(group, symbol, bound, internal) {ApiGroup::group, #symbol, bound, internal},
#include "coverage/ApiSymbols.def"
#undef MPV_SYMBOL
};

/// @brief Check uniqueness and internal-implies-bound over @p records.
bool validateRecords(const std::vector<BindingRecord> &records, support::DiagnosticEngine &de)
{
    bool valid = true;
    std::unordered_set<std::string_view> seen;
    for (const auto &record : records)
    {
        if (!seen.insert(record.name).second)
        {
            de.report(support::makeError({}, "duplicate registry symbol '" + record.name + "'"));
            valid = false;
        }
        if (record.internal && !record.bound)
        {
            de.report(support::makeError(
                {}, "registry symbol '" + record.name + "' is internal but not bound"));
            valid = false;
        }
    }
    return valid;
}

/// @brief Name index over bindingRegistry(); built on first lookup.
const std::unordered_map<std::string_view, std::size_t> &registryIndex()
{
    static const std::unordered_map<std::string_view, std::size_t> index = []
    {
        std::unordered_map<std::string_view, std::size_t> map;
        const auto &records = bindingRegistry();
        map.reserve(records.size());
        for (std::size_t i = 0; i < records.size(); ++i)
            map.emplace(records[i].name, i);
        return map;
    }();
    return index;
}

} // namespace

const std::vector<BindingRecord> &bindingRegistry()
{
    static const std::vector<BindingRecord> registry = []
    {
        std::vector<BindingRecord> records;
        records.reserve(std::size(kSymbolRows));
        for (const auto &row : kSymbolRows)
        {
            BindingRecord record;
            record.name = std::string(row.name);
            record.bound = row.bound;
            record.internal = row.internal;
            record.group = row.group;
            if (row.internal)
                record.annotation = support::kInternalAnnotation;
            records.push_back(std::move(record));
        }
        std::stable_sort(records.begin(),
                         records.end(),
                         [](const BindingRecord &lhs, const BindingRecord &rhs)
                         { return apiGroupIndex(*lhs.group) < apiGroupIndex(*rhs.group); });
#ifndef NDEBUG
        support::DiagnosticEngine de;
        if (!validateRecords(records, de))
        {
            for (const auto &d : de.diagnostics())
                std::fprintf(stderr, "[FATAL] %s\n", d.message.c_str());
            assert(false && "invalid binding registry");
        }
#endif
        return records;
    }();
    return registry;
}

/// @brief Resolve @p name through the hash index.
///
/// @details The index stores positions rather than pointers so it can be built
///          from the registry vector without depending on its address.
const BindingRecord *findBinding(std::string_view name)
{
    const auto &index = registryIndex();
    auto it = index.find(name);
    if (it == index.end())
        return nullptr;
    return &bindingRegistry()[it->second];
}

std::vector<const BindingRecord *> bindingsInGroup(ApiGroup group)
{
    std::vector<const BindingRecord *> out;
    for (const auto &record : bindingRegistry())
    {
        if (record.group == group)
            out.push_back(&record);
    }
    return out;
}

bool selfCheckBindingRegistry(support::DiagnosticEngine &de)
{
    return validateRecords(bindingRegistry(), de);
}

/// @brief Project the registry onto a checklist document.
///
/// @details Internal records carry the internal-use annotation unless
///          @c options.annotateInternal is false.  Without the annotation an
///          internal record renders like a public one and reads back as public.
Checklist registryChecklist(const support::CoverageOptions &options)
{
    Checklist checklist;
    checklist.title = options.title;
    for (auto group : kApiGroups)
    {
        ChecklistGroup out;
        for (const auto *record : bindingsInGroup(group))
        {
            if (record->internal && !options.includeInternal)
                continue;
            BindingRecord copy = *record;
            if (!options.annotateInternal)
                copy.annotation.clear();
            out.records.push_back(std::move(copy));
        }
        if (!out.records.empty())
            checklist.groups.push_back(std::move(out));
    }
    return checklist;
}

} // namespace mpvbind::coverage
