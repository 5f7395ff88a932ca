#pragma once
#include "ffistub/ast.hpp"
#include "ffistub/type_rewriter.hpp"
#include <vector>

namespace ffistub {

extern const char* const kSizeMismatchMessage;
extern const char* const kAlignMismatchMessage;

Declaration make_assertion(AssertionBody::Metric metric, type_ptr local, type_ptr origin);

// Two compile-time checks (size and alignment) per pair. Pairs involving
// function pointer types are skipped. Order is unspecified.
std::vector<Item> generate_assertions(const TransmutePairs& pairs);

} // namespace ffistub
