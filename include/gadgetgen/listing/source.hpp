//! # Listing Source
//!
//! Owns the text of an operation listing and provides line access for the
//! reader and for diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("circuit.gg");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result) << "\n";
//!     return;
//! }
//! Source source = std::move(unwrap(result));
//! std::string_view first = source.line(1);
//! ```

#ifndef GADGETGEN_LISTING_SOURCE_HPP
#define GADGETGEN_LISTING_SOURCE_HPP

#include "gadgetgen/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gadgetgen::listing {

/// A listing file held in memory with a line index.
///
/// String views returned by `content()` and `line()` stay valid as long as
/// the Source exists.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    /// Returns the content of a line (1-indexed) without its line ending.
    ///
    /// Returns an empty view if the line number is out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a listing from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a listing from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<std::size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace gadgetgen::listing

#endif // GADGETGEN_LISTING_SOURCE_HPP
