#pragma once
#include "ffistub/ast.hpp"
#include "ffistub/type_rewriter.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace ffistub {

// Rust edition of the generated file; 2024 spells the export marker #[unsafe(no_mangle)].
enum class Edition { Rust2021, Rust2024 };
std::optional<Edition> parse_edition(std::string_view text);
Attribute no_mangle_attribute(Edition edition);

// Build the `pub extern "C"` forwarding stub of a source function:
//   #[no_mangle]
//   pub unsafe extern "C" fn f(p: *const Foo) -> u32 {
//       my_crate::f(unsafe { std::mem::transmute(&*p) })
//   }
// Parameter and return types go through the rewriter (pairs are recorded in
// `pairs`). Receivers and non-identifier patterns are rejected (FS0203, FS0204).
Declaration convert_to_stub(const Declaration& function, const TypeRewriter& rewriter, Edition edition,
                            TransmutePairs& pairs, const SourceLocation& loc);

} // namespace ffistub
