//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/coverage/ChecklistWriterTests.cpp
// Purpose: Verify checklist rendering and the committed docs/coverage.md.
// Key invariants: Rendering a parsed checklist reproduces its input;
//                 docs/coverage.md matches the registry rendering.
// Ownership/Lifetime: Tests own all checklists.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "coverage/ChecklistParser.hpp"
#include "coverage/ChecklistWriter.hpp"
#include "coverage/Registry.hpp"
#include "support/source_manager.hpp"
#include "support/text_file.hpp"

#include <string>

using namespace mpvbind::coverage;
using mpvbind::support::CoverageOptions;

TEST(ChecklistWriter, FormatRecord)
{
    BindingRecord bound{"mpv_create", true, false, "", std::nullopt, {}};
    EXPECT_EQ(ChecklistWriter::formatRecord(bound), "- [X] `mpv_create`");

    BindingRecord internal{
        "mpv_free", true, true, "not public, internal use only", std::nullopt, {}};
    EXPECT_EQ(ChecklistWriter::formatRecord(internal),
              "- [X] `mpv_free` (not public, internal use only)");

    BindingRecord unbound{"mpv_render_context_free", false, false, "", std::nullopt, {}};
    EXPECT_EQ(ChecklistWriter::formatRecord(unbound), "- [ ] `mpv_render_context_free`");
}

TEST(ChecklistWriter, RoundTripIsStable)
{
    const std::string text = "# bindings\n"
                             "\n"
                             "- [X] `mpv_create`\n"
                             "- [X] `mpv_free` (not public, internal use only)\n"
                             "\n"
                             "- [ ] `mpv_del_property` (needs mpv 2.1)\n";
    auto parsed = parseChecklist(text);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(ChecklistWriter::toString(parsed.value()), text);
}

TEST(ChecklistWriter, NormalizesBlankRuns)
{
    auto parsed = parseChecklist("# t\n\n\n\n- [X] `mpv_create`  \n\n\n- [ ] `mpv_destroy`\n\n");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(ChecklistWriter::toString(parsed.value()),
              "# t\n\n- [X] `mpv_create`\n\n- [ ] `mpv_destroy`\n");
}

TEST(ChecklistWriter, RegistryRenderingStartsWithInternalRecords)
{
    const std::string text = ChecklistWriter::renderRegistry();
    EXPECT_EQ(text.rfind("# libmpv binding coverage\n\n"
                         "- [X] `mpv_client_api_version` (not public, internal use only)\n",
                         0),
              0u);
    EXPECT_NE(text.find("- [ ] `mpv_render_context_create`\n"), std::string::npos);
}

TEST(ChecklistWriter, RegistryRenderingParsesBack)
{
    auto parsed = parseChecklist(ChecklistWriter::renderRegistry());
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().recordCount(), bindingRegistry().size());
    for (const auto &record : bindingRegistry())
    {
        const BindingRecord *listed = parsed.value().find(record.name);
        ASSERT_NE(listed, nullptr) << record.name;
        EXPECT_EQ(listed->bound, record.bound) << record.name;
        EXPECT_EQ(listed->internal, record.internal) << record.name;
    }
}

TEST(ChecklistWriter, ExcludeInternal)
{
    CoverageOptions options;
    options.includeInternal = false;
    options.title = "public surface";
    const std::string text = ChecklistWriter::renderRegistry(options);
    EXPECT_EQ(text.rfind("# public surface\n", 0), 0u);
    EXPECT_EQ(text.find("`mpv_free`"), std::string::npos);
    EXPECT_EQ(text.find("`mpv_error_string`"), std::string::npos);
    EXPECT_EQ(text.find("`mpv_client_api_version`"), std::string::npos);
    EXPECT_NE(text.find("`mpv_free_node_contents`"), std::string::npos);
    EXPECT_EQ(text.find("internal use only"), std::string::npos);
    EXPECT_NE(text.find("`mpv_create`"), std::string::npos);
}

TEST(ChecklistWriter, UnannotatedInternalRecords)
{
    CoverageOptions options;
    options.annotateInternal = false;
    const std::string text = ChecklistWriter::renderRegistry(options);
    EXPECT_NE(text.find("- [X] `mpv_free`\n"), std::string::npos);
    EXPECT_EQ(text.find("internal use only"), std::string::npos);
}

TEST(ChecklistWriter, CommittedChecklistIsCurrent)
{
    mpvbind::support::SourceManager sm;
    std::string committed;
    auto loaded = mpvbind::support::loadTextFile(
        std::string(MPVBIND_SOURCE_DIR) + "/docs/coverage.md", committed, sm);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(committed, ChecklistWriter::renderRegistry());

    auto parsed = parseChecklist(committed, loaded.value());
    ASSERT_TRUE(parsed) << parsed.error().message;
}
