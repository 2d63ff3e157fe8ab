#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include <memPlan/error/error_handler.hpp>
#include <memPlan/layout/layout_builder.hpp>
#include <memPlan/layout/report.hpp>

namespace memPlan::error {
namespace {

using ::testing::HasSubstr;

u32 callback_calls = 0;
error_code last_callback_code = error_code::success;

void count_errors(const error_context& ctx) noexcept {
    ++callback_calls;
    last_callback_code = ctx.diag.code;
}

class DiagnosticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_global_error_handler().reset();
        get_global_error_handler().set_callback(nullptr);
        callback_calls = 0;
        last_callback_code = error_code::success;
    }

    void TearDown() override { get_global_error_handler().set_callback(nullptr); }
};

TEST_F(DiagnosticsTest, OverlapNamesBothRegionsAndAddresses) {
    const diagnostic d(error_code::overlap, "RAM_SHARED1", "RAM",
                       0x20020000U, 0x20030028U, 0x20000008U, 0x20030000U);
    const std::string line(describe(d).c_str());
    EXPECT_THAT(line, HasSubstr("OverlapError"));
    EXPECT_THAT(line, HasSubstr("'RAM_SHARED1' [0x20020000, 0x20030028)"));
    EXPECT_THAT(line, HasSubstr("'RAM' [0x20000008, 0x20030000)"));
}

TEST_F(DiagnosticsTest, OverflowNamesSectionAndRegion) {
    const diagnostic d(error_code::region_overflow, "TAIL", "RAM_SHARED1",
                       0x20030010U, 0x20030029U, 0x20030000U, 0x20030028U);
    const std::string line(describe(d).c_str());
    EXPECT_THAT(line, HasSubstr("RegionOverflow"));
    EXPECT_THAT(line, HasSubstr("'TAIL'"));
    EXPECT_THAT(line, HasSubstr("'RAM_SHARED1'"));
    EXPECT_THAT(line, HasSubstr("0x20030029"));
}

TEST_F(DiagnosticsTest, MismatchNamesBothAddresses) {
    const diagnostic d(error_code::address_mismatch, "RAM_SHARED1", "origin", 0x20030000U, 0x20038000U);
    const std::string line(describe(d).c_str());
    EXPECT_THAT(line, HasSubstr("AddressMismatch"));
    EXPECT_THAT(line, HasSubstr("origin is 0x20030000 in one image and 0x20038000"));
}

TEST_F(DiagnosticsTest, EveryCodeHasAName) {
    EXPECT_STREQ(code_name(error_code::duplicate_region_name), "DuplicateRegionName");
    EXPECT_STREQ(code_name(error_code::unknown_region), "UnknownRegion");
    EXPECT_STREQ(code_name(error_code::invalid_alignment), "InvalidAlignment");
    EXPECT_STREQ(code_name(error_code::missing_placement), "MissingPlacement");
    EXPECT_STREQ(code_name(error_code::duplicate_symbol_name), "DuplicateSymbolName");
    EXPECT_STREQ(code_name(error_code::shared_entry_missing), "SharedEntryMissing");
}

TEST_F(DiagnosticsTest, RejectedDeclarationsReachTheCallback) {
    get_global_error_handler().set_callback(&count_errors);

    layout::layout_builder builder;
    ASSERT_TRUE(builder.define_region("RAM", 0x20000000U, 0x1000U, layout::attributes::ram()).is_ok());
    EXPECT_TRUE(builder.define_region("RAM", 0x30000000U, 0x1000U, layout::attributes::ram()).is_error());
    EXPECT_TRUE(builder.declare_section(".data", "SRAM", layout::load_behavior::initialized, 4, 16).is_error());

    EXPECT_EQ(callback_calls, 2U);
    EXPECT_EQ(last_callback_code, error_code::unknown_region);
    EXPECT_EQ(get_global_error_handler().get_error_count(), 2U);
    EXPECT_EQ(get_global_error_handler().get_last_error().severity, error_severity::fatal);
    EXPECT_EQ(get_global_error_handler().get_last_error().diag.subject, "SRAM");
}

TEST_F(DiagnosticsTest, ResetClearsStatistics) {
    (void)raise(diagnostic(error_code::table_frozen, ".late"));
    EXPECT_EQ(get_global_error_handler().get_error_count(), 1U);
    get_global_error_handler().reset();
    EXPECT_EQ(get_global_error_handler().get_error_count(), 0U);
    EXPECT_EQ(get_global_error_handler().get_last_error().diag.code, error_code::success);
}

TEST_F(DiagnosticsTest, ReportLabelsFlagsAndSymbolKinds) {
    EXPECT_EQ(layout::attribute_flags(layout::attributes::flash()), "r-xL");
    EXPECT_EQ(layout::attribute_flags(layout::attributes::shared_ram()), "rw-S");
    EXPECT_STREQ(layout::kind_name(layout::symbol_kind::section_end), "section-end");

    layout::layout_builder builder;
    ASSERT_TRUE(builder.define_region("RAM", 0x20000000U, 0x1000U, layout::attributes::ram(),
                                      {{"_sram", layout::symbol_edge::start}}).is_ok());
    ASSERT_TRUE(builder.declare_section(".data", "RAM", layout::load_behavior::initialized, 4, 16).is_ok());
    auto res = builder.resolve();
    ASSERT_TRUE(res.is_ok());
    layout::log_report(res.value());
    EXPECT_EQ(get_global_error_handler().get_error_count(), 0U);
}

}  // namespace
}  // namespace memPlan::error
