#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memPlan/device/stm32wb55.hpp>
#include <memPlan/layout/linker_script.hpp>

namespace memPlan::layout {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

class LinkerScriptTest : public ::testing::Test {
protected:
    void SetUp() override {
        error::get_global_error_handler().reset();
        ASSERT_TRUE(device::stm32wb55::build_mailbox_layout(builder).is_ok());
        ASSERT_TRUE(builder.declare_section(".data", "RAM", load_behavior::initialized, 4, 0x180).is_ok());
        auto res = builder.resolve();
        ASSERT_TRUE(res.is_ok());
        resolved = res.value();
    }

    layout_builder builder;
    resolution resolved;
};

TEST_F(LinkerScriptTest, MemoryBlockListsEveryRegion) {
    script_t script;
    ASSERT_TRUE(render_linker_script(resolved, script).is_ok());
    const std::string text(script.c_str());

    EXPECT_THAT(text, HasSubstr("MEMORY\n{\n"));
    EXPECT_THAT(text, HasSubstr("(rx) : ORIGIN = 0x08000000, LENGTH = 0x00080000"));
    EXPECT_THAT(text, HasSubstr("ORIGIN = 0x20000008, LENGTH = 0x0002FFF8"));
    EXPECT_THAT(text, HasSubstr("(rw) : ORIGIN = 0x20030000, LENGTH = 0x00000028"));
    EXPECT_THAT(text, HasSubstr("ORIGIN = 0x20030028, LENGTH = 0x000027D8"));
}

TEST_F(LinkerScriptTest, MailboxSectionsArePinnedAndNotLoaded) {
    script_t script;
    ASSERT_TRUE(render_linker_script(resolved, script).is_ok());
    const std::string text(script.c_str());

    EXPECT_THAT(text, HasSubstr("  TL_REF_TABLE 0x20030000 (NOLOAD) :"));
    EXPECT_THAT(text, HasSubstr("  MB_MEM1 0x20030028 (NOLOAD) :"));
    EXPECT_THAT(text, HasSubstr("  MB_MEM2 0x200300D8 (NOLOAD) :\n  {\n    _sMB_MEM2 = .;\n    KEEP(*(MB_MEM2))\n    _eMB_MEM2 = .;\n  } >RAM_SHARED2\n"));
    EXPECT_THAT(text, HasSubstr("ASSERT(SIZEOF(MB_MEM2) <= 0xA84, \"MB_MEM2 outgrew its placement\")"));
    EXPECT_THAT(text, HasSubstr("  .data 0x20000008 :"));
    EXPECT_THAT(text, Not(HasSubstr(".data 0x20000008 (NOLOAD)")));
}

TEST_F(LinkerScriptTest, InitializedDataLoadsFromFlash) {
    script_t script;
    ASSERT_TRUE(render_linker_script(resolved, script).is_ok());
    const std::string text(script.c_str());

    EXPECT_THAT(text, HasSubstr("    KEEP(*(.data))\n  } >RAM AT>FLASH\n"));
    EXPECT_THAT(text, Not(HasSubstr("RAM_SHARED2 AT>")));
    EXPECT_THAT(text, Not(HasSubstr("RAM_SHARED1 AT>")));
}

TEST_F(LinkerScriptTest, NoBootImageRegionMeansNoLoadAddress) {
    layout_builder b;
    ASSERT_TRUE(b.define_region("RAM", 0x20000000U, 0x1000U, attributes::ram()).is_ok());
    ASSERT_TRUE(b.declare_section(".data", "RAM", load_behavior::initialized, 4, 16).is_ok());
    auto res = b.resolve();
    ASSERT_TRUE(res.is_ok());

    script_t script;
    ASSERT_TRUE(render_linker_script(res.value(), script).is_ok());
    const std::string text(script.c_str());
    EXPECT_THAT(text, HasSubstr("  } >RAM\n"));
    EXPECT_THAT(text, Not(HasSubstr("AT>")));
}

TEST_F(LinkerScriptTest, RegionSymbolsAreAbsolute) {
    layout_builder b;
    ASSERT_TRUE(b.define_region("RAM", 0x20000008U, 0x2FFF8U, attributes::ram(),
                                {{"_sram", symbol_edge::start}, {"_estack", symbol_edge::end}}).is_ok());
    auto res = b.resolve();
    ASSERT_TRUE(res.is_ok());

    script_t script;
    ASSERT_TRUE(render_linker_script(res.value(), script).is_ok());
    const std::string text(script.c_str());
    EXPECT_THAT(text, HasSubstr("_sram = 0x20000008;\n"));
    EXPECT_THAT(text, HasSubstr("_estack = 0x20030000;\n"));
}

TEST_F(LinkerScriptTest, SmallBufferIsReportedNotTruncated) {
    string<64> tiny;
    auto rendered = render_linker_script(resolved, tiny);
    ASSERT_TRUE(rendered.is_error());
    EXPECT_EQ(rendered.error().code, error_code::capacity_exceeded);
    EXPECT_EQ(rendered.error().data[0], 64U);
    EXPECT_LE(tiny.size(), 64U);
    EXPECT_EQ(error::get_global_error_handler().get_error_count(), 1U);
}

}  // namespace
}  // namespace memPlan::layout
