// Rewriting of type expressions into their FFI-stable local form, with
// recording of the local/origin pairs that must stay layout compatible.
#pragma once
#include "ffistub/ast.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ffistub {

// Names of the type declarations of the source crate. Keys are `Name`, or
// `Name#<cfg attributes joined by |>` for declarations guarded by cfg, so that
// per-configuration variants are tracked separately. Lookups use the bare name.
class ExportedTypeIndex {
public:
    static std::string key_for(const Declaration& d);

    void insert(const std::string& key);
    bool contains(const std::string& name) const { return names_.count(name) > 0; }
    const std::set<std::string>& keys() const { return keys_; }
    size_t size() const { return keys_.size(); }

private:
    std::set<std::string> keys_;
    std::set<std::string> names_;
};

// name -> primitive it resolves to
using PrimitiveTable = std::map<std::string, std::string>;
PrimitiveTable default_primitives();
std::vector<Path> default_allowed_prefixes();

struct TransmutePair {
    type_ptr local;
    type_ptr origin;
    SourceLocation location; // first location that needed the pair
};

// Deduplicated set of pairs keyed by the textual forms of both sides.
class TransmutePairs {
public:
    // Returns false when the pair was already known (the first location is kept).
    bool insert(type_ptr local, type_ptr origin, const SourceLocation& loc);
    bool contains(const std::string& local, const std::string& origin) const;
    size_t size() const { return pairs_.size(); }
    bool empty() const { return pairs_.empty(); }
    void clear() { pairs_.clear(); }
    std::vector<TransmutePair> values() const;

private:
    std::map<std::pair<std::string, std::string>, TransmutePair> pairs_;
};

struct RewriteConfig {
    std::string crate_name; // qualifier, '-' already mapped to '_'
    const ExportedTypeIndex* exported = nullptr;
    const PrimitiveTable* primitives = nullptr;
    std::vector<Path> allowed_prefixes;
    std::vector<Path> transparent_wrappers;
    std::vector<Path> prefixed_exported_types;
};

struct LocalType {
    type_ptr type;
    bool changed{false}; // local and origin forms are not equivalent
};

// Bottom-up rebuild of a type: `fn` sees every node after its children were rebuilt.
type_ptr transform_type(const type_ptr& t, const std::function<type_ptr(const type_ptr&)>& fn);

// Every reference and generic lifetime argument becomes 'static.
type_ptr with_static_lifetimes(const type_ptr& t);

class TypeRewriter {
public:
    explicit TypeRewriter(const RewriteConfig& cfg) : cfg_(&cfg) {}

    // Generic type parameters of the enclosing declaration count as FFI safe.
    TypeRewriter& with_generic_params(const std::vector<std::string>& names);
    // Replace lifetimes of the local form with 'static (stubs have no generics).
    TypeRewriter& erase_lifetimes(bool value);

    LocalType convert(const type_ptr& original, TransmutePairs& pairs, const SourceLocation& loc, const std::string& context) const;

    // The source crate's spelling of a type, qualified with the crate name.
    type_ptr origin_form(const type_ptr& t) const;
    type_ptr strip_wrappers(const type_ptr& t, bool& stripped) const;
    bool equivalent(const Type& a, const Type& b) const;
    // Throws conversion_error (FS0201, FS0202) for types that cannot cross the boundary.
    void validate(const type_ptr& t, const std::string& context, const SourceLocation& loc) const;

    const RewriteConfig& config() const { return *cfg_; }

private:
    type_ptr strip_impl(const type_ptr& t, bool& stripped, bool wrappers) const;
    type_ptr localize(const type_ptr& t, const std::string& context, const SourceLocation& loc) const;
    type_ptr localize_bare_fn(const BareFnType& f, const std::string& context, const SourceLocation& loc) const;
    bool path_is_ffi_safe(const Path& p) const;
    std::optional<std::string> primitive_of(const Type& t) const;

    const RewriteConfig* cfg_;
    std::set<std::string> generic_params_;
    bool erase_lifetimes_ = false;
};

// Convert every type slot of a type, const or static declaration.
Declaration rewrite_declaration_types(const Declaration& d, const TypeRewriter& rewriter, TransmutePairs& pairs, const SourceLocation& loc);

} // namespace ffistub
