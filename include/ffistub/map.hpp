// Item-to-item stages applied between filtering and conversion.
#pragma once
#include "ffistub/ast.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ffistub {

// Remove traits from #[derive(...)] lists; an emptied derive is dropped.
class StripDerives {
public:
    StripDerives& strip(std::string trait_name){ names_.insert(std::move(trait_name)); return *this; }
    Declaration apply(const Declaration& d) const;
    Item operator()(Item item) const { item.decl = apply(item.decl); return item; }

private:
    std::vector<Attribute> strip_attrs(const std::vector<Attribute>& attrs) const;
    std::set<std::string> names_;
};

// Remove attributes whose path mentions one of the names (on items, fields and variants).
class StripMacros {
public:
    StripMacros& strip(std::string macro_name){ names_.insert(std::move(macro_name)); return *this; }
    Declaration apply(const Declaration& d) const;
    Item operator()(Item item) const { item.decl = apply(item.decl); return item; }

private:
    std::vector<Attribute> strip_attrs(const std::vector<Attribute>& attrs) const;
    std::set<std::string> names_;
};

// Replace a leading path in every type, e.g. "Option" -> "std::option::Option".
class ReplaceTypes {
public:
    // Throws conversion_error (FS0102) for malformed paths.
    ReplaceTypes& replace(const std::string& from, const std::string& to);
    type_ptr apply(const type_ptr& t) const;
    Declaration apply(const Declaration& d) const;
    Item operator()(Item item) const { item.decl = apply(item.decl); return item; }

private:
    std::vector<std::pair<Path, Path>> rules_;
};

} // namespace ffistub
