#include "parser.hpp"
#include "pegtl/grammar.hpp"
#include "ffistub/diagnostics.hpp"
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>
#include <cctype>

namespace rustdecl {
using namespace rustdecl::grammar;
using tree_node = tao::pegtl::parse_tree::node;

namespace {

std::string trim(std::string_view s){
    while(!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
    while(!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
    return std::string(s);
}

// Collapse whitespace runs to a single space.
std::string normalize(std::string_view s){
    std::string out;
    bool pending = false;
    for(char c: s){
        if(std::isspace((unsigned char)c)){ pending = !out.empty(); continue; }
        if(pending){ out += ' '; pending = false; }
        out += c;
    }
    return out;
}

std::string unquote(std::string_view s){
    if(s.size()>=2 && s.front()=='"' && s.back()=='"') return std::string(s.substr(1, s.size()-2));
    return std::string(s);
}

template<typename Rule>
const tree_node* child(const tree_node& n){
    for(auto& c: n.children) if(c->is_type<Rule>()) return c.get();
    return nullptr;
}

bool is_type_node(const tree_node& n){
    return n.is_type<path_type>() || n.is_type<ref_type>() || n.is_type<ptr_type>() || n.is_type<bracket_type>()
        || n.is_type<tuple_type>() || n.is_type<never_type>() || n.is_type<infer_type>() || n.is_type<dyn_type>()
        || n.is_type<impl_type>() || n.is_type<qualified_type>() || n.is_type<bare_fn_type>();
}

const tree_node* type_child(const tree_node& n){
    for(auto& c: n.children) if(is_type_node(*c)) return c.get();
    return nullptr;
}

ffistub::type_ptr lower_type(const tree_node& n);

ffistub::type_ptr lower_type_child(const tree_node& n){
    auto* t = type_child(n);
    return t ? lower_type(*t) : ffistub::make_unit_type();
}

ffistub::Path lower_path(const tree_node& n){
    ffistub::Path p;
    for(auto& c: n.children){
        if(c->is_type<path_root>()){ p.leading_colon = true; continue; }
        if(!c->is_type<path_seg>()) continue;
        ffistub::PathSegment seg;
        for(auto& a: c->children){
            using Kind = ffistub::GenericArg::Kind;
            if(a->is_type<seg_ident>()) seg.ident = a->string();
            else if(a->is_type<lifetime>()) seg.args.push_back({Kind::Lifetime, nullptr, a->string()});
            else if(a->is_type<binding_arg>()) seg.args.push_back({Kind::Binding, lower_type_child(*a), child<binding_name>(*a)->string()});
            else if(a->is_type<const_arg>()) seg.args.push_back({Kind::Const, nullptr, normalize(a->string_view())});
            else if(is_type_node(*a)) seg.args.push_back({Kind::Type, lower_type(*a), {}});
        }
        p.segments.push_back(std::move(seg));
    }
    return p;
}

ffistub::type_ptr lower_type(const tree_node& n){
    using namespace ffistub;
    if(n.is_type<path_type>()) return make_type(PathType{lower_path(n)});
    if(n.is_type<ref_type>()){
        ReferenceType r;
        if(auto* lt = child<lifetime>(n)) r.lifetime = lt->string();
        r.is_mut = child<ref_mut>(n) != nullptr;
        r.elem = lower_type_child(n);
        return make_type(std::move(r));
    }
    if(n.is_type<ptr_type>()) return make_type(PointerType{child<ptr_mut>(n) != nullptr, lower_type_child(n)});
    if(n.is_type<bracket_type>()){
        auto elem = lower_type_child(n);
        if(auto* len = child<array_len>(n)) return make_type(ArrayType{elem, normalize(len->string_view())});
        return make_type(SliceType{elem});
    }
    if(n.is_type<tuple_type>()){
        std::vector<type_ptr> elems;
        for(auto& c: n.children) if(is_type_node(*c)) elems.push_back(lower_type(*c));
        if(elems.size()==1 && !child<trailing_comma>(n)) return elems.front();
        return make_type(TupleType{std::move(elems)});
    }
    if(n.is_type<bare_fn_type>()){
        BareFnType f;
        f.is_unsafe = child<fn_unsafe>(n) != nullptr;
        if(auto* ext = child<fn_extern>(n)){
            auto* a = child<abi>(*ext);
            f.abi = a ? unquote(a->string_view()) : std::string("C");
        }
        for(auto& c: n.children){
            if(c->is_type<bare_param>()){
                BareFnParam p;
                if(auto* nm = child<bare_param_name>(*c)) p.name = nm->string();
                p.type = lower_type_child(*c);
                f.params.push_back(std::move(p));
            } else if(c->is_type<bare_variadic>()){
                f.variadic = true;
            } else if(c->is_type<bare_ret>()){
                f.ret = lower_type_child(*c);
            }
        }
        return make_type(std::move(f));
    }
    // never, infer, dyn/impl bounds and qualified paths stay textual
    return make_type(OpaqueType{normalize(n.string_view())});
}

ffistub::Attribute lower_attr(const tree_node& n){
    ffistub::Attribute a;
    auto path = child<attr_path>(n)->string();
    for(char c: path) if(!std::isspace((unsigned char)c)) a.name += c;
    if(auto* args = child<attr_args>(n)){
        auto sv = args->string_view();
        a.style = ffistub::Attribute::Style::List;
        a.tokens = trim(sv.substr(1, sv.size()-2));
    } else if(auto* v = child<attr_value>(n)){
        a.style = ffistub::Attribute::Style::NameValue;
        a.tokens = trim(v->string_view());
    }
    return a;
}

std::vector<ffistub::Attribute> attrs_of(const tree_node& n){
    std::vector<ffistub::Attribute> out;
    for(auto& c: n.children) if(c->is_type<outer_attr>()) out.push_back(lower_attr(*c));
    return out;
}

std::string vis_of(const tree_node& n){
    auto* v = child<vis>(n);
    return v ? normalize(v->string_view()) : std::string();
}

std::vector<ffistub::Field> lower_field_list(const tree_node& n){
    std::vector<ffistub::Field> out;
    for(auto& c: n.children){
        if(!c->is_type<named_field>() && !c->is_type<tuple_field>()) continue;
        ffistub::Field f;
        f.attrs = attrs_of(*c);
        f.vis = vis_of(*c);
        if(auto* nm = child<field_name>(*c)) f.name = nm->string();
        f.type = lower_type_child(*c);
        out.push_back(std::move(f));
    }
    return out;
}

ffistub::Fields lower_fields(const tree_node* named, const tree_node* tuple){
    ffistub::Fields out;
    if(named){ out.style = ffistub::Fields::Style::Named; out.fields = lower_field_list(*named); }
    else if(tuple){ out.style = ffistub::Fields::Style::Tuple; out.fields = lower_field_list(*tuple); }
    return out;
}

ffistub::FnParam lower_param(const tree_node& n, bool& variadic){
    ffistub::FnParam p;
    p.attrs = attrs_of(n);
    if(auto* r = child<receiver>(n)){
        p.pattern = ffistub::FnParam::Pattern::Receiver;
        p.name = normalize(r->string_view());
        return p;
    }
    if(child<variadic_param>(n)){
        variadic = true;
        return p;
    }
    auto* tp = child<typed_param>(n);
    if(child<wildcard_pat>(*tp)){
        p.pattern = ffistub::FnParam::Pattern::Wildcard;
        p.name = "_";
    } else if(auto* ip = child<ident_pat>(*tp)){
        p.pattern = ffistub::FnParam::Pattern::Ident;
        p.by_mut = child<pat_mut>(*ip) != nullptr;
        p.name = child<pat_name>(*ip)->string();
    } else {
        p.pattern = ffistub::FnParam::Pattern::Other;
        p.name = normalize(child<other_pat>(*tp)->string_view());
    }
    p.type = lower_type_child(*tp);
    return p;
}

ffistub::FunctionBody lower_fn(const tree_node& n){
    ffistub::FunctionBody f;
    auto& s = f.sig;
    s.is_const = child<q_const>(n) != nullptr;
    s.is_async = child<q_async>(n) != nullptr;
    s.is_unsafe = child<q_unsafe>(n) != nullptr;
    if(auto* ext = child<q_extern>(n)){
        auto* a = child<abi>(*ext);
        s.abi = a ? unquote(a->string_view()) : std::string("C");
    }
    for(auto& c: n.children){
        if(!c->is_type<fn_param>()) continue;
        bool variadic = false;
        auto p = lower_param(*c, variadic);
        if(variadic) s.variadic = true;
        else s.params.push_back(std::move(p));
    }
    if(auto* r = child<ret_type>(n)) s.ret = lower_type_child(*r);
    if(auto* w = child<where_clause>(n)) s.where_clause = normalize(w->string_view());
    if(auto* b = child<fn_block>(n)) f.block = b->string();
    return f;
}

ffistub::Declaration lower_item(const tree_node& item_node, const tree_node& k){
    using namespace ffistub;
    Declaration d;
    d.attrs = attrs_of(item_node);
    d.vis = vis_of(item_node);
    d.name = child<item_name>(k)->string();
    if(auto* g = child<generics>(k)) d.generics = normalize(g->string_view());

    if(k.is_type<struct_item>()) d.body = StructBody{lower_fields(child<named_fields>(k), child<tuple_fields>(k))};
    else if(k.is_type<union_item>()) d.body = UnionBody{lower_field_list(*child<named_fields>(k))};
    else if(k.is_type<enum_item>()){
        EnumBody e;
        for(auto& c: k.children){
            if(!c->is_type<variant>()) continue;
            Variant v;
            v.attrs = attrs_of(*c);
            v.name = child<variant_name>(*c)->string();
            v.fields = lower_fields(child<named_fields>(*c), child<tuple_fields>(*c));
            if(auto* disc = child<discriminant>(*c)) v.discriminant = trim(disc->string_view());
            e.variants.push_back(std::move(v));
        }
        d.body = std::move(e);
    }
    else if(k.is_type<type_item>()) d.body = AliasBody{lower_type_child(k)};
    else if(k.is_type<const_item>() || k.is_type<static_item>()){
        ConstBody c;
        c.type = lower_type_child(k);
        if(auto* v = child<const_value>(k)) c.value = trim(v->string_view());
        c.is_static = k.is_type<static_item>();
        c.is_mut = child<static_mut>(k) != nullptr;
        d.body = std::move(c);
    }
    else d.body = lower_fn(k);
    return d;
}

const tree_node* kind_node(const tree_node& item_node){
    for(auto& c: item_node.children){
        if(c->is_type<struct_item>() || c->is_type<enum_item>() || c->is_type<union_item>() || c->is_type<type_item>()
           || c->is_type<const_item>() || c->is_type<static_item>() || c->is_type<fn_item>())
            return c.get();
    }
    return nullptr;
}

} // namespace

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    tao::pegtl::memory_input<> in(src.data(), src.size(), std::string(filename));
    ParseResult r;
    try {
        auto root = tao::pegtl::parse_tree::parse< file_rule, selector >(in);
        if(!root){ r.error_message = "expected an item"; r.line = 1; r.column = 1; return r; }
        for(auto& c: root->children){
            if(!c->is_type<item>()) continue;
            auto* k = kind_node(*c);
            if(!k) continue;
            auto pos = c->begin();
            ffistub::SourceLocation loc{std::string(filename), static_cast<int>(pos.line), static_cast<int>(pos.column)};
            r.items.push_back(ffistub::Item{lower_item(*c, *k), std::move(loc)});
            r.sources.push_back(c->string());
        }
        r.success = true;
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        r.items.clear();
        r.sources.clear();
        r.error_message = "expected an item or end of input";
        r.line = static_cast<int>(p.line);
        r.column = static_cast<int>(p.column);
    }
    return r;
}

std::vector<ffistub::Item> Parser::parse_items(std::string_view src, const std::string& origin, int line_offset) const {
    auto r = parse_string(src, origin);
    if(!r.success)
        throw ffistub::conversion_error(ffistub::ErrorKind::Parse, "FS0301", "cannot parse declarations: " + r.error_message,
                                        ffistub::SourceLocation{origin, r.line + line_offset, r.column});
    for(auto& it: r.items) it.location.line += line_offset;
    return std::move(r.items);
}

ffistub::type_ptr Parser::parse_type(std::string_view src) const {
    tao::pegtl::memory_input<> in(src.data(), src.size(), std::string("type"));
    try {
        auto root = tao::pegtl::parse_tree::parse< type_root, selector >(in);
        if(root){
            for(auto& c: root->children) if(is_type_node(*c)) return lower_type(*c);
        }
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw ffistub::conversion_error(ffistub::ErrorKind::Parse, "FS0301", "cannot parse type '" + trim(src) + "'",
                                        ffistub::SourceLocation{"", static_cast<int>(p.line), static_cast<int>(p.column)});
    }
    throw ffistub::conversion_error(ffistub::ErrorKind::Parse, "FS0301", "cannot parse type '" + trim(src) + "'");
}

} // namespace rustdecl
