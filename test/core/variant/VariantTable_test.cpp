#include "core/variant/VariantTable.hpp"
#include "core/RTLExceptions.hpp"
#include "sparta/utils/SpartaTester.hpp"

TEST_INIT

void testNEORV32Variants()
{
    const auto & variants = rtlbridge::getNEORV32Variants();

    EXPECT_TRUE(variants.contains("standard"));
    EXPECT_FALSE(variants.contains("Standard"));

    const auto & standard = variants.lookup("standard");
    EXPECT_EQUAL(standard.id, "standard");
    EXPECT_EQUAL(standard.flags.size(), 2);
    EXPECT_EQUAL(standard.flags[0], "-march=rv32i");
    EXPECT_EQUAL(standard.flags[1], "-mabi=ilp32");

    // Same entry every time
    EXPECT_TRUE(&variants.lookup("standard") == &standard);

    const auto ids = variants.getVariantIds();
    EXPECT_EQUAL(ids.size(), 1);
    EXPECT_EQUAL(ids[0], "standard");
}

void testUnknownVariant()
{
    const auto & variants = rtlbridge::getNEORV32Variants();

    EXPECT_THROW(variants.lookup("imc"));
    EXPECT_THROW(variants.lookup(""));

    bool caught = false;
    try {
        variants.lookup("minimal");
    }
    catch(const rtlbridge::UnknownVariant & ex) {
        caught = true;
        EXPECT_EQUAL(ex.getVariant(), "minimal");
        EXPECT_TRUE(std::string(ex.what()).find("standard") != std::string::npos);
    }
    EXPECT_TRUE(caught);
}

void testCustomTable()
{
    const rtlbridge::VariantTable table {
        {"minimal",  {"-march=rv32e", "-mabi=ilp32e"}},
        {"standard", {"-march=rv32i", "-mabi=ilp32"}},
        {"full",     {"-march=rv32imac", "-mabi=ilp32"}}
    };

    // Declaration order is kept
    const auto ids = table.getVariantIds();
    EXPECT_EQUAL(ids.size(), 3);
    EXPECT_EQUAL(ids[0], "minimal");
    EXPECT_EQUAL(ids[2], "full");

    EXPECT_EQUAL(table.lookup("full").flags[0], "-march=rv32imac");
    EXPECT_EQUAL(table.lookup("minimal").flags[1], "-mabi=ilp32e");
}

void runTest(int argc, char **argv)
{
    (void)argc;
    (void)argv;

    testNEORV32Variants();
    testUnknownVariant();
    testCustomTable();
}

int main(int argc, char **argv)
{
    runTest(argc, argv);

    REPORT_ERROR;
    return (int)ERROR_CODE;
}
