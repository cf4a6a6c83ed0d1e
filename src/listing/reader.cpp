//! # Listing Reader
//!
//! Tokenizes one listing line at a time and maps the token shape onto
//! operation records or input declarations.

#include "gadgetgen/listing/reader.hpp"

#include "gadgetgen/log/log.hpp"

#include <optional>
#include <string>

namespace gadgetgen::listing {

using gadget::GadgetError;
using gadget::Identifier;

namespace {

enum class TokenKind { Word, Equals, String };

struct Token {
    TokenKind kind;
    std::string text; ///< Word text, or the unescaped string contents.
};

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

auto tokenize(std::string_view text, uint32_t line) -> Result<std::vector<Token>, GadgetError> {
    std::vector<Token> tokens;
    size_t i = 0;

    while (i < text.size()) {
        char c = text[i];

        if (is_space(c)) {
            ++i;
        } else if (c == '#') {
            break;
        } else if (c == '=') {
            tokens.push_back({TokenKind::Equals, "="});
            ++i;
        } else if (c == '"') {
            std::string value;
            ++i;
            bool closed = false;
            while (i < text.size()) {
                char s = text[i];
                if (s == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                if (s == '\\') {
                    if (i + 1 >= text.size()) {
                        break;
                    }
                    char next = text[i + 1];
                    if (next != '"' && next != '\\') {
                        return GadgetError::listing_syntax(
                            "unsupported escape '\\" + std::string(1, next) + "' in label", line);
                    }
                    value += next;
                    i += 2;
                    continue;
                }
                value += s;
                ++i;
            }
            if (!closed) {
                return GadgetError::listing_syntax("unterminated label string", line);
            }
            tokens.push_back({TokenKind::String, std::move(value)});
        } else {
            size_t start = i;
            while (i < text.size() && !is_space(text[i]) && text[i] != '=' && text[i] != '"' &&
                   text[i] != '#') {
                ++i;
            }
            tokens.push_back({TokenKind::Word, std::string(text.substr(start, i - start))});
        }
    }

    return tokens;
}

auto parse_inputs(const std::vector<Token>& tokens, uint32_t line, Listing& out)
    -> Result<bool, GadgetError> {
    if (tokens.size() < 2) {
        return GadgetError::listing_syntax("'input' needs at least one name", line);
    }

    std::vector<Identifier> names;
    for (size_t i = 1; i < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::Word) {
            return GadgetError::listing_syntax("'input' takes only names", line);
        }
        auto id = Identifier::parse(tokens[i].text, line);
        if (is_err(id)) {
            return unwrap_err(id);
        }
        names.push_back(std::move(unwrap(id)));
    }

    for (auto& name : names) {
        out.inputs.push_back(std::move(name));
    }
    return true;
}

} // namespace

auto parse_line(std::string_view text, uint32_t line, Listing& out)
    -> Result<bool, GadgetError> {
    auto lexed = tokenize(text, line);
    if (is_err(lexed)) {
        return unwrap_err(lexed);
    }
    const auto& tokens = unwrap(lexed);

    if (tokens.empty()) {
        return true;
    }

    bool has_binding = tokens.size() >= 2 && tokens[1].kind == TokenKind::Equals;

    if (!has_binding && tokens[0].kind == TokenKind::Word && tokens[0].text == "input") {
        return parse_inputs(tokens, line, out);
    }

    // [<output> =] <kind> "<label>" <operand>...
    size_t pos = 0;
    std::optional<std::string_view> output;
    if (has_binding) {
        if (tokens[0].kind != TokenKind::Word) {
            return GadgetError::listing_syntax("expected an output name before '='", line);
        }
        output = tokens[0].text;
        pos = 2;
    }

    if (pos >= tokens.size() || tokens[pos].kind != TokenKind::Word) {
        return GadgetError::listing_syntax("expected a gadget kind", line);
    }
    std::string_view kind_name = tokens[pos].text;
    ++pos;

    if (pos >= tokens.size() || tokens[pos].kind != TokenKind::String) {
        return GadgetError::listing_syntax("expected a quoted label after '" +
                                               std::string(kind_name) + "'",
                                           line);
    }
    std::string label = tokens[pos].text;
    ++pos;

    std::vector<std::string_view> operands;
    for (; pos < tokens.size(); ++pos) {
        if (tokens[pos].kind != TokenKind::Word) {
            return GadgetError::listing_syntax("operands must be names", line);
        }
        operands.push_back(tokens[pos].text);
    }

    auto record = gadget::make_record(std::move(label), kind_name, output, operands, line);
    if (is_err(record)) {
        return unwrap_err(record);
    }
    out.records.push_back(std::move(unwrap(record)));
    return true;
}

auto parse_listing(const Source& source) -> Result<Listing, std::vector<GadgetError>> {
    Listing listing;
    std::vector<GadgetError> errors;

    for (uint32_t n = 1; n <= source.line_count(); ++n) {
        auto parsed = parse_line(source.line(n), n, listing);
        if (is_err(parsed)) {
            errors.push_back(std::move(unwrap_err(parsed)));
        }
    }

    GADGETGEN_LOG_DEBUG("listing", source.filename() << ": " << listing.records.size()
                                                     << " record(s), " << listing.inputs.size()
                                                     << " input(s), " << errors.size()
                                                     << " error(s)");

    if (!errors.empty()) {
        return errors;
    }
    return listing;
}

} // namespace gadgetgen::listing
