//! # Listing Reader
//!
//! Parses the line-oriented operation listing into operation records.
//!
//! ## Format
//!
//! ```text
//! # comment
//! input maybe_pk G
//! p = witness "load pk" maybe_pk
//! assert_not_small_order "pk order" p
//! rg = ec_mul_const "r*G" r_bits G
//! ```
//!
//! - blank lines and `#` comments are skipped
//! - `input` declares external names for strict mode
//! - labels are double-quoted; `\"` and `\\` are the only escapes
//! - kind names go through the catalog (`lookup_kind`)
//!
//! Every line is parsed even after an error, so one run reports all of them.

#ifndef GADGETGEN_LISTING_READER_HPP
#define GADGETGEN_LISTING_READER_HPP

#include "gadgetgen/common.hpp"
#include "gadgetgen/gadget/error.hpp"
#include "gadgetgen/gadget/identifier.hpp"
#include "gadgetgen/gadget/record.hpp"
#include "gadgetgen/listing/source.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace gadgetgen::listing {

/// Parsed listing contents.
struct Listing {
    std::vector<gadget::Identifier> inputs;
    std::vector<gadget::OperationRecord> records;
};

/// Parses a single listing line into `out`.
///
/// Blank and comment lines leave `out` untouched and succeed.
[[nodiscard]] auto parse_line(std::string_view text, uint32_t line, Listing& out)
    -> Result<bool, gadget::GadgetError>;

/// Parses a whole listing.
[[nodiscard]] auto parse_listing(const Source& source)
    -> Result<Listing, std::vector<gadget::GadgetError>>;

} // namespace gadgetgen::listing

#endif // GADGETGEN_LISTING_READER_HPP
