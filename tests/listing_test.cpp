// gadgetgen - Listing Reader Tests

#include "gadgetgen/listing/reader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace gadgetgen;
using namespace gadgetgen::gadget;
using namespace gadgetgen::listing;
namespace fs = std::filesystem;

// ============================================================================
// Source
// ============================================================================

TEST(SourceTest, LineAccessStripsLineEndings) {
    auto src = Source::from_string("first\r\nsecond\nthird", "<t>");
    EXPECT_EQ(src.line_count(), 3u);
    EXPECT_EQ(src.line(1), "first");
    EXPECT_EQ(src.line(2), "second");
    EXPECT_EQ(src.line(3), "third");
    EXPECT_EQ(src.line(0), "");
    EXPECT_EQ(src.line(4), "");
    EXPECT_EQ(src.filename(), "<t>");
}

TEST(SourceTest, MissingFileIsAnError) {
    auto loaded = Source::from_file("/nonexistent/gadgetgen/listing.gg");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_NE(unwrap_err(loaded).find("listing.gg"), std::string::npos);
}

TEST(SourceTest, LoadsFromDisk) {
    auto path = fs::temp_directory_path() / "gadgetgen_source_test.gg";
    {
        std::ofstream f(path);
        f << "input a\n";
    }
    auto loaded = Source::from_file(path.string());
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).line(1), "input a");
    fs::remove(path);
}

// ============================================================================
// Listing
// ============================================================================

class ListingTest : public ::testing::Test {
protected:
    auto parse(const std::string& text) -> Result<Listing, std::vector<GadgetError>> {
        return parse_listing(Source::from_string(text, "test.gg"));
    }
};

TEST_F(ListingTest, ParsesExampleCircuit) {
    auto result = parse(R"(# spend authority
input maybe_pk r G

p = witness "load pk" maybe_pk
assert_not_small_order "pk order" p
r_bits = fr_as_binary_le "r bits" r
rg = ec_mul_const "r*G" r_bits G   # fixed generator
s = ec_add "sum" p rg
emit_ec "expose s" s
)");
    ASSERT_TRUE(is_ok(result));
    const auto& listing = unwrap(result);

    ASSERT_EQ(listing.inputs.size(), 3u);
    EXPECT_EQ(listing.inputs[2].str(), "G");

    ASSERT_EQ(listing.records.size(), 6u);
    const auto& mul = listing.records[3];
    EXPECT_EQ(mul.kind, OperationKind::FixedBaseScalarMul);
    EXPECT_EQ(mul.label, "r*G");
    EXPECT_EQ(mul.output->str(), "rg");
    EXPECT_EQ(mul.operands[0].str(), "r_bits");
    EXPECT_EQ(mul.operands[1].str(), "G");
    EXPECT_EQ(mul.line, 7u);

    EXPECT_FALSE(listing.records[5].output.has_value());
}

TEST_F(ListingTest, AcceptsDisplayNamesAndTightSpacing) {
    auto result = parse("s=PointAdd \"sum\" p rg\nExposeInput\"x\"s\n");
    ASSERT_TRUE(is_ok(result));
    const auto& records = unwrap(result).records;
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].kind, OperationKind::PointAdd);
    EXPECT_EQ(records[1].kind, OperationKind::ExposeInput);
    EXPECT_EQ(records[1].operands[0].str(), "s");
}

TEST_F(ListingTest, LabelEscapes) {
    auto result = parse(R"(emit_ec "say \"hi\" \\ bye" s)");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).records[0].label, "say \"hi\" \\ bye");
}

TEST_F(ListingTest, HashInsideLabelIsNotAComment) {
    auto result = parse(R"(emit_ec "item #1" s)");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).records[0].label, "item #1");
}

TEST_F(ListingTest, InputCanStillBeAnOutputName) {
    auto result = parse("input = witness \"w\" src\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).records[0].output->str(), "input");
}

TEST_F(ListingTest, ReportsEveryBadLine) {
    auto result = parse("p = witness \"w\" a\n"
                        "q = ec_double \"d\" p\n"
                        "s = ec_add \"sum\" p\n"
                        "emit_ec \"unterminated s\n"
                        "emit_ec s\n"
                        "x = = ec_add \"a\" p q\n");
    ASSERT_TRUE(is_err(result));
    const auto& errors = unwrap_err(result);
    ASSERT_EQ(errors.size(), 5u);

    EXPECT_EQ(errors[0].line, 2u);
    EXPECT_EQ(errors[0].kind, ErrorKind::UnresolvableKind);

    EXPECT_EQ(errors[1].line, 3u);
    EXPECT_EQ(errors[1].code, ErrorCodes::ARITY_MISMATCH);

    EXPECT_EQ(errors[2].line, 4u);
    EXPECT_EQ(errors[2].kind, ErrorKind::ListingSyntax);

    EXPECT_EQ(errors[3].line, 5u);
    EXPECT_EQ(errors[3].kind, ErrorKind::ListingSyntax);

    EXPECT_EQ(errors[4].line, 6u);
    EXPECT_EQ(errors[4].kind, ErrorKind::ListingSyntax);
}

TEST_F(ListingTest, BadInputDeclarations) {
    Listing out;
    EXPECT_TRUE(is_err(parse_line("input", 1, out)));
    EXPECT_TRUE(is_err(parse_line("input a \"b\"", 1, out)));
    EXPECT_TRUE(is_err(parse_line("input 9lives", 1, out)));
    EXPECT_TRUE(out.inputs.empty());
}

TEST_F(ListingTest, UnsupportedEscape) {
    Listing out;
    auto parsed = parse_line(R"(emit_ec "a\nb" s)", 4, out);
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(unwrap_err(parsed).code, ErrorCodes::LISTING_SYNTAX);
    EXPECT_EQ(unwrap_err(parsed).line, 4u);
}

TEST_F(ListingTest, BlankAndCommentLinesOnly) {
    auto result = parse("\n   \n# nothing here\n\t# indented comment\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).records.empty());
    EXPECT_TRUE(unwrap(result).inputs.empty());
}
