#pragma once
#include "ffistub/ast.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace rustdecl {

struct ParseResult {
    bool success{false};
    std::vector<ffistub::Item> items; // Declarations in source order
    std::vector<std::string> sources; // Verbatim text of each item, attributes included
    std::string error_message;        // If !success, human-readable message
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse Rust source text into declarations. Items without a declaration
    // counterpart (use, mod, impl, trait, extern blocks, macro calls) are skipped.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;

    // Same as parse_string but throws ffistub::conversion_error (FS0301) on failure.
    // `line_offset` is added to every reported line.
    std::vector<ffistub::Item> parse_items(std::string_view src, const std::string& origin, int line_offset = 0) const;

    // Parse a single type, e.g. "&'a mut [u8; 4]". Throws FS0301.
    ffistub::type_ptr parse_type(std::string_view src) const;
};

} // namespace rustdecl
