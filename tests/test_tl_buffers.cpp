#include <gtest/gtest.h>

#include <memPlan/device/stm32wb55.hpp>
#include <memPlan/mailbox/tl_buffers.hpp>
#include <memPlan/mailbox/contract.hpp>

namespace memPlan::mailbox {
namespace {

namespace wb = device::stm32wb55;

TEST(TlBuffersTest, CatalogSizesMatchCoprocessorStructures) {
    static_assert(config::target_pointer_bytes == 4, "catalog checks assume 32-bit pointers");
    EXPECT_EQ(tl::ref_table_bytes, 40U);
    EXPECT_EQ(tl::mb_mem1_bytes, 176U);
    EXPECT_EQ(tl::cmd_packet_bytes, 267U);
    EXPECT_EQ(tl::spare_evt_bytes, 266U);
    EXPECT_EQ(tl::cs_buffer_bytes, 15U);
    EXPECT_EQ(tl::acl_data_bytes, 264U);
    EXPECT_EQ(tl::evt_pool_bytes, 1340U);
    EXPECT_EQ(tl::mb_mem2_bytes, 2692U);
}

TEST(TlBuffersTest, BuffersAreWordAlignedInsideTheirSection) {
    EXPECT_EQ(offset_of(tl::mb_mem2_objects, 0), 0U);
    EXPECT_EQ(offset_of(tl::mb_mem2_objects, 1), 16U);   // CS_BUFFER padded to a word
    EXPECT_EQ(offset_of(tl::mb_mem2_objects, 2), 1356U);
    EXPECT_EQ(offset_of(tl::mb_mem2_objects, 3), 1624U);
    EXPECT_EQ(offset_of(tl::mb_mem2_objects, 6), 2428U);
    EXPECT_EQ(max_alignment(tl::mb_mem2_objects), 4U);
    EXPECT_EQ(offset_of(tl::mb_mem1_objects, 13), 168U);
}

class Stm32wb55Test : public ::testing::Test {
protected:
    void SetUp() override { error::get_global_error_handler().reset(); }
};

TEST_F(Stm32wb55Test, MailboxSectionsLandAtFixedAddresses) {
    layout::layout_builder builder;
    ASSERT_TRUE(wb::build_mailbox_layout(builder).is_ok());
    auto res = builder.resolve();
    ASSERT_TRUE(res.is_ok());
    const layout::resolution& out = res.value();

    const layout::placement* ref = out.find_placement(tl::ref_table_section);
    const layout::placement* mem1 = out.find_placement(tl::mb_mem1_section);
    const layout::placement* mem2 = out.find_placement(tl::mb_mem2_section);
    ASSERT_NE(ref, nullptr);
    ASSERT_NE(mem1, nullptr);
    ASSERT_NE(mem2, nullptr);

    EXPECT_EQ(ref->start, 0x20030000U);
    EXPECT_EQ(ref->end, 0x20030028U);
    EXPECT_EQ(mem1->start, 0x20030028U);
    EXPECT_EQ(mem1->end, 0x200300D8U);
    EXPECT_EQ(mem2->start, 0x200300D8U);
    EXPECT_EQ(mem2->end, 0x20030B5CU);
    EXPECT_EQ(mem2->behavior, layout::load_behavior::no_load);

    auto window = out.symbol_range(tl::mb_mem2_start_symbol, tl::mb_mem2_end_symbol);
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window.value().start, 0x200300D8U);
    EXPECT_EQ(window.value().end, 0x20030B5CU);
    EXPECT_TRUE(window.value().contains(mem2->start + offset_of(tl::mb_mem2_objects, 2), tl::cmd_packet_bytes));
    EXPECT_FALSE(window.value().contains(mem1->start));
}

TEST_F(Stm32wb55Test, ReferenceTableFillsItsRegion) {
    layout::layout_builder builder;
    ASSERT_TRUE(wb::build_mailbox_layout(builder).is_ok());
    auto res = builder.resolve();
    ASSERT_TRUE(res.is_ok());

    auto shared1 = builder.regions().find(wb::shared1_region);
    ASSERT_TRUE(shared1.has_value());
    EXPECT_EQ(res.value().free_bytes(shared1.value()), 0U);
}

TEST_F(Stm32wb55Test, ApplicationAndCoprocessorAgree) {
    layout::layout_builder app;
    ASSERT_TRUE(wb::build_mailbox_layout(app).is_ok());
    ASSERT_TRUE(app.declare_section(".text", wb::flash_region, layout::load_behavior::initialized, 4, 0x6400).is_ok());
    ASSERT_TRUE(app.declare_section(".bss", wb::ram_region, layout::load_behavior::initialized, 8, 0x2210).is_ok());

    layout::layout_builder coprocessor;
    ASSERT_TRUE(wb::build_mailbox_layout(coprocessor).is_ok());

    auto app_res = app.resolve();
    auto cop_res = coprocessor.resolve();
    ASSERT_TRUE(app_res.is_ok());
    ASSERT_TRUE(cop_res.is_ok());
    EXPECT_TRUE(verify(app_res.value(), cop_res.value()).is_ok());
    EXPECT_NE(app_res.value(), cop_res.value());
}

TEST_F(Stm32wb55Test, DeclaringTwiceIsRejected) {
    layout::layout_builder builder;
    ASSERT_TRUE(wb::build_mailbox_layout(builder).is_ok());
    auto again = tl::declare_tl_sections(builder, wb::shared1_region, wb::shared2_region);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, error_code::duplicate_section_name);
    EXPECT_EQ(again.error().subject, "TL_REF_TABLE");
}

}  // namespace
}  // namespace memPlan::mailbox
