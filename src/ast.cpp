#include "ffistub/ast.hpp"
#include <cctype>

namespace ffistub {

std::string SourceLocation::to_string() const {
    return (file.empty() ? std::string("<unknown>") : file) + ":" + std::to_string(line) + ":" + std::to_string(column);
}

static bool is_ident_text(std::string_view s){
    if(s.empty()) return false;
    if(!(std::isalpha((unsigned char)s[0]) || s[0]=='_')) return false;
    for(char c: s) if(!(std::isalnum((unsigned char)c) || c=='_')) return false;
    return true;
}

std::optional<Path> parse_path(std::string_view text){
    while(!text.empty() && std::isspace((unsigned char)text.front())) text.remove_prefix(1);
    while(!text.empty() && std::isspace((unsigned char)text.back())) text.remove_suffix(1);
    Path p;
    if(text.substr(0,2)=="::"){ p.leading_colon = true; text.remove_prefix(2); }
    while(true){
        auto pos = text.find("::");
        auto seg = text.substr(0, pos);
        while(!seg.empty() && std::isspace((unsigned char)seg.back())) seg.remove_suffix(1);
        while(!seg.empty() && std::isspace((unsigned char)seg.front())) seg.remove_prefix(1);
        if(!is_ident_text(seg)) return std::nullopt;
        p.segments.push_back(PathSegment{std::string(seg), {}});
        if(pos==std::string_view::npos) break;
        text.remove_prefix(pos+2);
    }
    return p;
}

type_ptr make_path_type(std::string_view text){
    auto p = parse_path(text);
    return make_type(PathType{p ? *p : Path{false, {PathSegment{std::string(text), {}}}}});
}

type_ptr make_unit_type(){ return make_type(TupleType{}); }

bool same_idents(const Path& a, const Path& b){
    if(a.segments.size()!=b.segments.size()) return false;
    for(size_t i=0;i<a.segments.size();++i) if(a.segments[i].ident!=b.segments[i].ident) return false;
    return true;
}

bool starts_with_idents(const Path& path, const Path& prefix){
    if(prefix.segments.empty() || prefix.segments.size()>path.segments.size()) return false;
    for(size_t i=0;i<prefix.segments.size();++i) if(path.segments[i].ident!=prefix.segments[i].ident) return false;
    return true;
}

const char* kind_name(DeclKind k){
    switch(k){
        case DeclKind::Struct: return "struct";
        case DeclKind::Enum: return "enum";
        case DeclKind::Union: return "union";
        case DeclKind::TypeAlias: return "type";
        case DeclKind::Const: return "const";
        case DeclKind::Static: return "static";
        case DeclKind::Function: return "fn";
        case DeclKind::Assertion: return "assertion";
    }
    return "?";
}

DeclKind Declaration::kind() const {
    struct V {
        DeclKind operator()(const StructBody&) const { return DeclKind::Struct; }
        DeclKind operator()(const EnumBody&) const { return DeclKind::Enum; }
        DeclKind operator()(const UnionBody&) const { return DeclKind::Union; }
        DeclKind operator()(const AliasBody&) const { return DeclKind::TypeAlias; }
        DeclKind operator()(const ConstBody& c) const { return c.is_static ? DeclKind::Static : DeclKind::Const; }
        DeclKind operator()(const FunctionBody&) const { return DeclKind::Function; }
        DeclKind operator()(const AssertionBody&) const { return DeclKind::Assertion; }
    };
    return std::visit(V{}, body);
}

bool Declaration::is_type() const {
    auto k = kind();
    return k==DeclKind::Struct || k==DeclKind::Enum || k==DeclKind::Union || k==DeclKind::TypeAlias;
}

ItemSource from_items(std::vector<Item> items){
    auto state = std::make_shared<std::pair<std::vector<Item>, size_t>>(std::move(items), 0);
    return [state]() -> std::optional<Item> {
        if(state->second >= state->first.size()) return std::nullopt;
        return std::move(state->first[state->second++]);
    };
}

std::vector<Item> drain(ItemSource& src){
    std::vector<Item> out;
    while(auto it = src()) out.push_back(std::move(*it));
    return out;
}

ItemSource map_items(ItemSource src, std::function<Item(Item)> fn){
    auto upstream = std::make_shared<ItemSource>(std::move(src));
    return [upstream, fn = std::move(fn)]() -> std::optional<Item> {
        auto it = (*upstream)();
        if(!it) return std::nullopt;
        return fn(std::move(*it));
    };
}

std::vector<std::string> generic_type_params(std::string_view generics){
    std::vector<std::string> out;
    if(generics.size()<2 || generics.front()!='<') return out;
    auto inner = generics.substr(1, generics.size()-2);
    int depth = 0; size_t start = 0;
    auto take = [&](std::string_view part){
        while(!part.empty() && std::isspace((unsigned char)part.front())) part.remove_prefix(1);
        if(part.empty() || part.front()=='\'') return;
        if(part.substr(0,5)=="const" && part.size()>5 && std::isspace((unsigned char)part[5])) return;
        size_t n = 0;
        while(n<part.size() && (std::isalnum((unsigned char)part[n]) || part[n]=='_')) ++n;
        if(n) out.emplace_back(part.substr(0,n));
    };
    for(size_t i=0;i<inner.size();++i){
        char c = inner[i];
        if(c=='<' || c=='(' || c=='[') ++depth;
        else if((c=='>' && (i==0 || inner[i-1]!='-')) || c==')' || c==']') --depth;
        else if(c==',' && depth==0){ take(inner.substr(start, i-start)); start = i+1; }
    }
    take(inner.substr(start));
    return out;
}

static std::vector<Field> map_fields(const std::vector<Field>& fields, const TypeMapFn& fn, const std::string& owner){
    std::vector<Field> out;
    out.reserve(fields.size());
    for(size_t i=0;i<fields.size();++i){
        Field f = fields[i];
        std::string ctx = f.name ? "field '" + *f.name + "'" : "field " + std::to_string(i);
        f.type = fn(f.type, ctx + " of " + owner);
        out.push_back(std::move(f));
    }
    return out;
}

Declaration map_declaration_types(const Declaration& d, const TypeMapFn& fn){
    Declaration out = d;
    if(auto* s = std::get_if<StructBody>(&out.body)){
        s->fields.fields = map_fields(s->fields.fields, fn, "struct '" + d.name + "'");
    } else if(auto* e = std::get_if<EnumBody>(&out.body)){
        for(auto& v: e->variants)
            v.fields.fields = map_fields(v.fields.fields, fn, "variant '" + v.name + "' of enum '" + d.name + "'");
    } else if(auto* u = std::get_if<UnionBody>(&out.body)){
        u->fields = map_fields(u->fields, fn, "union '" + d.name + "'");
    } else if(auto* a = std::get_if<AliasBody>(&out.body)){
        a->target = fn(a->target, "target of type alias '" + d.name + "'");
    } else if(auto* c = std::get_if<ConstBody>(&out.body)){
        c->type = fn(c->type, std::string("type of ") + (c->is_static ? "static '" : "const '") + d.name + "'");
    } else if(auto* f = std::get_if<FunctionBody>(&out.body)){
        for(size_t i=0;i<f->sig.params.size();++i){
            auto& p = f->sig.params[i];
            if(p.type) p.type = fn(p.type, "parameter " + std::to_string(i+1) + " of function '" + d.name + "'");
        }
        if(f->sig.ret) f->sig.ret = fn(f->sig.ret, "return type of function '" + d.name + "'");
    }
    return out;
}

} // namespace ffistub
