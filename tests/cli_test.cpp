// gadgetgen - CLI Tests
// Option parsing and end-to-end generation through run_generate()

#include "cli/driver.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace gadgetgen;
using namespace gadgetgen::cli;
namespace fs = std::filesystem;

namespace {

auto parse_args(std::vector<std::string> args) -> Result<CliOptions, std::string> {
    args.insert(args.begin(), "gadgetgen");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return parse_cli_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

// ============================================================================
// Option Parsing
// ============================================================================

TEST(CliOptionsTest, ParsesAllFlags) {
    auto parsed = parse_args({"--strict", "--keep-going", "--input=G", "--input=r", "-o",
                              "out.rs", "circuit.gg", "-vv", "--log-level=debug"});
    ASSERT_TRUE(is_ok(parsed)) << unwrap_err(parsed);
    const auto& opts = unwrap(parsed);
    EXPECT_TRUE(opts.strict);
    EXPECT_TRUE(opts.keep_going);
    EXPECT_EQ(opts.inputs, (std::vector<std::string>{"G", "r"}));
    EXPECT_EQ(opts.output_path, "out.rs");
    EXPECT_EQ(opts.listing_path, "circuit.gg");
}

TEST(CliOptionsTest, OutputLongForm) {
    auto parsed = parse_args({"--output=x.rs", "a.gg"});
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed).output_path, "x.rs");
}

TEST(CliOptionsTest, RejectsUnknownOption) {
    auto parsed = parse_args({"--frobnicate", "a.gg"});
    ASSERT_TRUE(is_err(parsed));
    EXPECT_NE(unwrap_err(parsed).find("--frobnicate"), std::string::npos);
}

TEST(CliOptionsTest, RejectsSecondListing) {
    EXPECT_TRUE(is_err(parse_args({"a.gg", "b.gg"})));
}

TEST(CliOptionsTest, MissingOutputName) {
    EXPECT_TRUE(is_err(parse_args({"a.gg", "-o"})));
}

TEST(CliOptionsTest, HelpVersionListKinds) {
    auto parsed = parse_args({"-h", "-V", "--list-kinds"});
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_TRUE(unwrap(parsed).help);
    EXPECT_TRUE(unwrap(parsed).version);
    EXPECT_TRUE(unwrap(parsed).list_kinds);
}

TEST(CliOptionsTest, PrintKindsListsCatalog) {
    std::ostringstream out;
    print_kinds(out);
    EXPECT_NE(out.str().find("ec_mul_const (FixedBaseScalarMul): scalar, base -> output"),
              std::string::npos);
    EXPECT_NE(out.str().find("emit_ec (ExposeInput): point\n"), std::string::npos);
}

// ============================================================================
// Generation
// ============================================================================

class GenerateTest : public ::testing::Test {
protected:
    fs::path listing_file;
    fs::path output_file;

    void SetUp() override {
        listing_file = fs::temp_directory_path() / "gadgetgen_cli_test.gg";
        output_file = fs::temp_directory_path() / "gadgetgen_cli_test.rs";
        fs::remove(output_file);
    }

    void TearDown() override {
        fs::remove(listing_file);
        fs::remove(output_file);
    }

    void write_listing(const std::string& text) {
        std::ofstream f(listing_file);
        f << text;
    }

    auto read_output() -> std::string {
        std::ifstream f(output_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(GenerateTest, WritesFragmentsToStdout) {
    write_listing("s = ec_add \"sum\" p rg\nemit_ec \"expose s\" s\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 0);
    EXPECT_EQ(out.str(), "let s = p.add(cs.namespace(|| \"sum\"), &rg)?;\n"
                         "s.inputize(cs.namespace(|| \"expose s\"))?;\n");
    EXPECT_TRUE(err.str().empty()) << err.str();
}

TEST_F(GenerateTest, WritesFragmentsToFile) {
    write_listing("emit_ec \"e\" s\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    opts.output_path = output_file.string();
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 0);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(read_output(), "s.inputize(cs.namespace(|| \"e\"))?;\n");
}

TEST_F(GenerateTest, ListingErrorsCarryFileAndLine) {
    write_listing("emit_ec \"ok\" s\ns = ec_add \"sum\" p\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find(listing_file.string() + ":2: error[G002]"), std::string::npos)
        << err.str();
}

TEST_F(GenerateTest, StrictModeUsesListingAndFlagInputs) {
    write_listing("input maybe_pk\np = witness \"load\" maybe_pk\ns = ec_add \"sum\" p G\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    opts.strict = true;
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 1);
    EXPECT_NE(err.str().find(":3: error[G006]"), std::string::npos) << err.str();

    opts.inputs = {"G"};
    std::ostringstream out2, err2;
    EXPECT_EQ(run_generate(opts, out2, err2), 0) << err2.str();
    EXPECT_NE(out2.str().find("let s = p.add"), std::string::npos);
}

TEST_F(GenerateTest, StoppedRunWritesNoOutputFile) {
    write_listing("input maybe_pk\np = witness \"load\" maybe_pk\ns = ec_add \"sum\" p G\n"
                  "emit_ec \"e\" s\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    opts.output_path = output_file.string();
    opts.strict = true;
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 1);
    EXPECT_NE(err.str().find(":3: error[G006]"), std::string::npos) << err.str();
    EXPECT_FALSE(fs::exists(output_file));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(GenerateTest, StoppedRunWritesNothingToStdout) {
    write_listing("input maybe_pk\np = witness \"load\" maybe_pk\ns = ec_add \"sum\" p G\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    opts.strict = true;
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 1);
    EXPECT_TRUE(out.str().empty()) << out.str();
}

TEST_F(GenerateTest, KeepGoingStillWritesRenderedFragments) {
    write_listing("input maybe_pk\np = witness \"load\" maybe_pk\ns = ec_add \"sum\" p G\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    opts.output_path = output_file.string();
    opts.strict = true;
    opts.keep_going = true;
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 1);
    EXPECT_NE(read_output().find("let p = ecc::EdwardsPoint::witness("), std::string::npos);
}

TEST_F(GenerateTest, InvalidInputFlag) {
    write_listing("emit_ec \"e\" s\n");

    CliOptions opts;
    opts.listing_path = listing_file.string();
    opts.inputs = {"not-an-ident"};
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 1);
    EXPECT_NE(err.str().find("error[G005]"), std::string::npos);
}

TEST_F(GenerateTest, MissingListingFile) {
    CliOptions opts;
    opts.listing_path = (fs::temp_directory_path() / "gadgetgen_missing.gg").string();
    std::ostringstream out, err;

    EXPECT_EQ(run_generate(opts, out, err), 1);
    EXPECT_NE(err.str().find("error[G008]"), std::string::npos);
}
