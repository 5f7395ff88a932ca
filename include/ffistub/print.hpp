// Rust text rendering of the declaration model.
// The type rendering doubles as the textual key used by equivalence pairs.
#pragma once
#include "ffistub/ast.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace ffistub {

std::string to_string(const Type& t);
std::string to_string(const type_ptr& t);
std::string to_string(const Path& p);
std::string to_string(const Attribute& a);
std::string to_string(const Declaration& d);

// Render the forwarding call of a stub, e.g. `my_crate::f(&*a, b)`.
std::string call_expression(const StubCall& call);

// Write items as a single compilation unit. With `with_locations` each item
// is preceded by a `// file:line:column` comment.
void write_items(std::ostream& os, const std::vector<Item>& items, bool with_locations = false);

} // namespace ffistub
