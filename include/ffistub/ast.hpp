// Declaration model for the Rust item subset handled by the converter.
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ffistub {

struct SourceLocation {
    std::string file;
    int line{0};
    int column{0};

    bool known() const { return !file.empty() || line > 0; }
    // file:line:column
    std::string to_string() const;
};

struct Type;
using type_ptr = std::shared_ptr<const Type>;

struct GenericArg {
    enum class Kind { Type, Lifetime, Const, Binding } kind{Kind::Type};
    type_ptr type;    // Type, Binding (bound type)
    std::string text; // Lifetime ("'a"), Const (verbatim), Binding (name)
};

struct PathSegment {
    std::string ident;
    std::vector<GenericArg> args;
};

struct Path {
    bool leading_colon{false};
    std::vector<PathSegment> segments;

    bool empty() const { return segments.empty(); }
    const std::string& last_ident() const { return segments.back().ident; }
};

struct PathType { Path path; };
struct ReferenceType {
    std::optional<std::string> lifetime;
    bool is_mut{false};
    type_ptr elem;
};
struct PointerType {
    bool is_mut{false};
    type_ptr elem;
};
struct ArrayType {
    type_ptr elem;
    std::string len;
};
struct SliceType { type_ptr elem; };
struct TupleType { std::vector<type_ptr> elems; };
struct BareFnParam {
    std::optional<std::string> name;
    type_ptr type;
};
struct BareFnType {
    bool is_unsafe{false};
    std::optional<std::string> abi; // nullopt = Rust ABI, "" never stored; `extern fn` means "C"
    std::vector<BareFnParam> params;
    bool variadic{false};
    type_ptr ret; // null = unit
};
// dyn/impl bounds, never, infer: never rewritten, kept verbatim.
struct OpaqueType { std::string text; };

using type_data = std::variant<PathType, ReferenceType, PointerType, ArrayType, SliceType, TupleType, BareFnType, OpaqueType>;

struct Type {
    type_data data;

    template<typename T> bool is() const { return std::holds_alternative<T>(data); }
    template<typename T> const T& as() const { return std::get<T>(data); }
};

inline type_ptr make_type(type_data d){ return std::make_shared<const Type>(Type{std::move(d)}); }
type_ptr make_path_type(std::string_view text); // "std::mem::MaybeUninit" style, no generics
type_ptr make_unit_type();

// Parse `a::b::C` / `::a::B` (no generic arguments). Returns nullopt for malformed text.
std::optional<Path> parse_path(std::string_view text);
// Segment-identifier equality; generic arguments are ignored.
bool same_idents(const Path& a, const Path& b);
bool starts_with_idents(const Path& path, const Path& prefix);

// Attribute: #[name(tokens)], #[name = tokens] or #[name].
struct Attribute {
    enum class Style { Word, List, NameValue } style{Style::Word};
    std::string name; // path text, e.g. "cfg", "repr", "unsafe"
    std::string tokens;

    bool is_cfg() const { return style == Style::List && name == "cfg"; }
    static Attribute list(std::string name, std::string tokens){ return Attribute{Style::List, std::move(name), std::move(tokens)}; }
    static Attribute word(std::string name){ return Attribute{Style::Word, std::move(name), {}}; }
};

struct Field {
    std::vector<Attribute> attrs;
    std::string vis;
    std::optional<std::string> name; // nullopt for tuple fields
    type_ptr type;
};

struct Fields {
    enum class Style { Named, Tuple, Unit } style{Style::Unit};
    std::vector<Field> fields;
};

struct Variant {
    std::vector<Attribute> attrs;
    std::string name;
    Fields fields;
    std::optional<std::string> discriminant;
};

struct FnParam {
    enum class Pattern { Ident, Wildcard, Receiver, Other } pattern{Pattern::Ident};
    std::vector<Attribute> attrs;
    std::string name;  // Ident: binding name; Receiver/Other: verbatim text
    bool by_mut{false}; // `mut x`
    type_ptr type;     // null for shorthand receivers
};

struct Signature {
    bool is_const{false};
    bool is_async{false};
    bool is_unsafe{false};
    std::optional<std::string> abi;
    std::vector<FnParam> params;
    bool variadic{false};
    type_ptr ret; // null = no return type
    std::string where_clause;
};

// Forwarding call synthesized for stubs.
enum class Reborrow { None, Shared, Mut };
struct StubArg {
    std::string name;
    Reborrow reborrow{Reborrow::None};
    bool transmute{false};
};
struct StubCall {
    Path callee;
    std::vector<StubArg> args;
    bool transmute_result{false};
};

struct StructBody { Fields fields; };
struct EnumBody { std::vector<Variant> variants; };
struct UnionBody { std::vector<Field> fields; };
struct AliasBody { type_ptr target; };
struct ConstBody {
    type_ptr type;
    std::string value; // empty when declared without initializer
    bool is_static{false};
    bool is_mut{false};
};
struct FunctionBody {
    Signature sig;
    std::optional<std::string> block; // verbatim `{ ... }` of the source function
    std::optional<StubCall> stub;
};
struct AssertionBody {
    enum class Metric { Size, Align } metric{Metric::Size};
    type_ptr local;
    type_ptr origin;
    std::string message;
};

using decl_body = std::variant<StructBody, EnumBody, UnionBody, AliasBody, ConstBody, FunctionBody, AssertionBody>;

enum class DeclKind { Struct, Enum, Union, TypeAlias, Const, Static, Function, Assertion };
const char* kind_name(DeclKind k);

struct Declaration {
    std::vector<Attribute> attrs;
    std::string vis;
    std::string name;
    std::string generics; // verbatim `<...>` or empty
    decl_body body;

    DeclKind kind() const;
    bool is_type() const; // struct, enum, union or type alias
    template<typename T> bool is() const { return std::holds_alternative<T>(body); }
    template<typename T> const T& as() const { return std::get<T>(body); }
    template<typename T> T& as() { return std::get<T>(body); }
};

struct Item {
    Declaration decl;
    SourceLocation location;
};

// Pull-based item stream: returns nullopt at end of stream.
using ItemSource = std::function<std::optional<Item>()>;

ItemSource from_items(std::vector<Item> items);
std::vector<Item> drain(ItemSource& src);

// Stage adapter: any object with `std::optional<Item> call(ItemSource&)`.
template<typename Stage>
ItemSource chain(ItemSource src, Stage& stage){
    auto upstream = std::make_shared<ItemSource>(std::move(src));
    return [upstream, &stage]() { return stage.call(*upstream); };
}
ItemSource map_items(ItemSource src, std::function<Item(Item)> fn);

// Names of type (not lifetime/const) generic parameters in a `<...>` list.
std::vector<std::string> generic_type_params(std::string_view generics);

// Rebuild a declaration with `fn(type, context)` applied to every type slot
// (fields, variant fields, alias target, const/static type, parameters, return).
using TypeMapFn = std::function<type_ptr(const type_ptr&, const std::string& context)>;
Declaration map_declaration_types(const Declaration& d, const TypeMapFn& fn);

} // namespace ffistub
