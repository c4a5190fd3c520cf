//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/coverage/ReconcileTests.cpp
// Purpose: Verify reconciliation of a parsed checklist against the registry.
// Key invariants: Status disagreements are errors; unknown and missing
//                 symbols are warnings.
// Ownership/Lifetime: Tests own all checklists and diagnostic engines.
// Links: src/coverage/Reconcile.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "coverage/ChecklistParser.hpp"
#include "coverage/ChecklistWriter.hpp"
#include "coverage/Reconcile.hpp"
#include "coverage/Registry.hpp"

#include <algorithm>
#include <sstream>

using namespace mpvbind::coverage;
using mpvbind::support::CoverageOptions;
using mpvbind::support::DiagnosticEngine;

namespace
{

std::vector<BindingRecord> smallRegistry()
{
    return {
        {"mpv_free", true, true, "not public, internal use only", ApiGroup::Lifecycle, {}},
        {"mpv_create", true, false, "", ApiGroup::Lifecycle, {}},
        {"mpv_destroy", false, false, "", ApiGroup::Lifecycle, {}},
    };
}

Checklist parseOrDie(const char *text)
{
    auto parsed = parseChecklist(text);
    EXPECT_TRUE(parsed);
    return parsed ? parsed.value() : Checklist{};
}

} // namespace

TEST(Reconcile, RegistryRenderingAgrees)
{
    auto parsed = parseChecklist(ChecklistWriter::renderRegistry());
    ASSERT_TRUE(parsed);
    DiagnosticEngine de;
    ReconcileReport report = reconcile(parsed.value(), bindingRegistry(), {}, de);
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.unknown.empty());
    EXPECT_TRUE(report.missing.empty());
    EXPECT_TRUE(de.diagnostics().empty());
}

TEST(Reconcile, BoundMismatchIsError)
{
    Checklist checklist = parseOrDie("# t\n\n"
                                     "- [X] `mpv_free` (not public, internal use only)\n"
                                     "- [X] `mpv_create`\n"
                                     "- [X] `mpv_destroy`\n");
    DiagnosticEngine de;
    ReconcileReport report = reconcile(checklist, smallRegistry(), {}, de);
    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.mismatched.size(), 1u);
    EXPECT_EQ(report.mismatched.front(), "mpv_destroy");
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.diagnostics().front().message,
              "status mismatch for 'mpv_destroy': checklist says bound, registry says unbound");
    EXPECT_EQ(de.diagnostics().front().loc.line, 5u);
}

TEST(Reconcile, VisibilityMismatch)
{
    Checklist checklist = parseOrDie("# t\n\n"
                                     "- [X] `mpv_free`\n"
                                     "- [X] `mpv_create`\n"
                                     "- [ ] `mpv_destroy`\n");
    DiagnosticEngine de;
    ReconcileReport report = reconcile(checklist, smallRegistry(), {}, de);
    ASSERT_EQ(report.mismatched.size(), 1u);
    EXPECT_EQ(report.mismatched.front(), "mpv_free");
    EXPECT_NE(de.diagnostics().front().message.find("checklist says public, registry says internal"),
              std::string::npos);

    CoverageOptions plain;
    plain.annotateInternal = false;
    DiagnosticEngine quiet;
    EXPECT_TRUE(reconcile(checklist, smallRegistry(), plain, quiet).ok());
    EXPECT_EQ(quiet.errorCount(), 0u);
}

TEST(Reconcile, UnknownAndMissingAreWarnings)
{
    Checklist checklist = parseOrDie("# t\n\n"
                                     "- [X] `mpv_create`\n"
                                     "- [ ] `mpv_frobnicate`\n");
    DiagnosticEngine de;
    ReconcileReport report = reconcile(checklist, smallRegistry(), {}, de);
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.unknown.size(), 1u);
    EXPECT_EQ(report.unknown.front(), "mpv_frobnicate");
    EXPECT_EQ(report.missing, (std::vector<std::string>{"mpv_free", "mpv_destroy"}));
    EXPECT_EQ(de.errorCount(), 0u);
    EXPECT_EQ(de.warningCount(), 3u);

    std::ostringstream os;
    de.printAll(os);
    EXPECT_NE(os.str().find("line 4: warning: unknown symbol 'mpv_frobnicate'"),
              std::string::npos);
    EXPECT_NE(os.str().find("warning: missing symbol 'mpv_destroy'"), std::string::npos);
}

TEST(Reconcile, ExcludedInternalRecordsAreNotMissing)
{
    Checklist checklist = parseOrDie("# t\n\n"
                                     "- [X] `mpv_create`\n"
                                     "- [ ] `mpv_destroy`\n");
    CoverageOptions options;
    options.includeInternal = false;
    DiagnosticEngine de;
    ReconcileReport report = reconcile(checklist, smallRegistry(), options, de);
    EXPECT_TRUE(report.missing.empty());
    EXPECT_TRUE(de.diagnostics().empty());
}
