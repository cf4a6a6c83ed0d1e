// gadgetgen - Operation Record Tests
// Construction-time validation of kind names, identifiers, arity and output

#include "gadgetgen/gadget/record.hpp"

#include <gtest/gtest.h>

using namespace gadgetgen;
using namespace gadgetgen::gadget;

namespace {

auto id(std::string_view text) -> Identifier {
    return unwrap(Identifier::parse(text));
}

} // namespace

TEST(RecordTest, BuildsFromText) {
    auto rec = make_record("r*G", "ec_mul_const", "rg", {"r_bits", "G"}, 7);
    ASSERT_TRUE(is_ok(rec)) << unwrap_err(rec).to_string();

    const auto& r = unwrap(rec);
    EXPECT_EQ(r.label, "r*G");
    EXPECT_EQ(r.kind, OperationKind::FixedBaseScalarMul);
    ASSERT_TRUE(r.output.has_value());
    EXPECT_EQ(r.output->str(), "rg");
    ASSERT_EQ(r.operands.size(), 2u);
    EXPECT_EQ(r.operands[0].str(), "r_bits");
    EXPECT_EQ(r.operands[1].str(), "G");
    EXPECT_EQ(r.line, 7u);
}

TEST(RecordTest, BuildsFromParts) {
    auto rec = make_record("pk order", OperationKind::AssertNotSmallOrder, std::nullopt, {id("p")});
    ASSERT_TRUE(is_ok(rec));
    EXPECT_FALSE(unwrap(rec).output.has_value());
}

TEST(RecordTest, UnknownKindName) {
    auto rec = make_record("x", "ec_double", "d", {"p"}, 2);
    ASSERT_TRUE(is_err(rec));
    EXPECT_EQ(unwrap_err(rec).kind, ErrorKind::UnresolvableKind);
    EXPECT_EQ(unwrap_err(rec).line, 2u);
    EXPECT_NE(unwrap_err(rec).message.find("ec_double"), std::string::npos);
}

TEST(RecordTest, PointAddWithOneOperand) {
    auto rec = make_record("sum", "ec_add", "s", {"p"}, 5);
    ASSERT_TRUE(is_err(rec));

    const auto& err = unwrap_err(rec);
    EXPECT_EQ(err.kind, ErrorKind::MalformedRecord);
    EXPECT_EQ(err.code, ErrorCodes::ARITY_MISMATCH);
    EXPECT_EQ(err.expected, 2u);
    EXPECT_EQ(err.actual, 1u);
    EXPECT_EQ(err.line, 5u);
    EXPECT_EQ(err.to_string(), "line 5: error[G002]: ec_add takes 2 operands, got 1");
}

TEST(RecordTest, WitnessWithTooManyOperands) {
    auto rec = make_record("w", OperationKind::Witness, id("p"), {id("a"), id("b")});
    ASSERT_TRUE(is_err(rec));
    EXPECT_EQ(unwrap_err(rec).expected, 1u);
    EXPECT_EQ(unwrap_err(rec).actual, 2u);
    EXPECT_EQ(unwrap_err(rec).to_string(), "error[G002]: witness takes 1 operand, got 2");
}

TEST(RecordTest, NoOperandsAtAll) {
    auto rec = make_record("e", "emit_ec", std::nullopt, {});
    ASSERT_TRUE(is_err(rec));
    EXPECT_EQ(unwrap_err(rec).code, ErrorCodes::ARITY_MISMATCH);
    EXPECT_EQ(unwrap_err(rec).actual, 0u);
}

TEST(RecordTest, OutputRequiredForProducingKinds) {
    auto rec = make_record("bits", "fr_as_binary_le", std::nullopt, {"r"});
    ASSERT_TRUE(is_err(rec));
    EXPECT_EQ(unwrap_err(rec).code, ErrorCodes::OUTPUT_MISMATCH);
    EXPECT_NE(unwrap_err(rec).message.find("requires an output"), std::string::npos);
}

TEST(RecordTest, OutputRejectedForCheckKinds) {
    auto rec = make_record("expose", "emit_ec", "x", {"s"});
    ASSERT_TRUE(is_err(rec));
    EXPECT_EQ(unwrap_err(rec).code, ErrorCodes::OUTPUT_MISMATCH);
    EXPECT_NE(unwrap_err(rec).message.find("does not produce"), std::string::npos);
}

TEST(RecordTest, InvalidOperandIdentifier) {
    auto rec = make_record("sum", "ec_add", "s", {"p", "r-g"}, 11);
    ASSERT_TRUE(is_err(rec));
    EXPECT_EQ(unwrap_err(rec).kind, ErrorKind::InvalidIdentifier);
    EXPECT_EQ(unwrap_err(rec).line, 11u);
}

TEST(RecordTest, InvalidOutputIdentifier) {
    auto rec = make_record("sum", "ec_add", "let", {"p", "rg"});
    ASSERT_TRUE(is_err(rec));
    EXPECT_EQ(unwrap_err(rec).code, ErrorCodes::INVALID_IDENTIFIER);
}

TEST(RecordTest, ValidateShapeOnHandBuiltRecord) {
    OperationRecord ok{"sum", OperationKind::PointAdd, id("s"), {id("p"), id("rg")}};
    EXPECT_TRUE(is_ok(validate_shape(ok)));

    OperationRecord bad = ok;
    bad.operands.pop_back();
    EXPECT_TRUE(is_err(validate_shape(bad)));
}

TEST(RecordTest, ValidateShapeRejectsKindOutsideCatalog) {
    OperationRecord rec{"x", static_cast<OperationKind>(KIND_COUNT), std::nullopt, {id("p")}, 3};
    auto shape = validate_shape(rec);
    ASSERT_TRUE(is_err(shape));
    EXPECT_EQ(unwrap_err(shape).code, ErrorCodes::UNRESOLVABLE_KIND);
    EXPECT_EQ(unwrap_err(shape).line, 3u);
}

TEST(RecordTest, DefaultConstructedRecordIsWellDefined) {
    OperationRecord rec;
    EXPECT_EQ(rec.kind, OperationKind::Witness);
    EXPECT_EQ(rec.line, 0u);

    auto shape = validate_shape(rec);
    ASSERT_TRUE(is_err(shape));
    EXPECT_EQ(unwrap_err(shape).code, ErrorCodes::ARITY_MISMATCH);
}
