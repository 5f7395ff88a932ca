#include "ffistub/map.hpp"
#include "ffistub/diagnostics.hpp"
#include "ffistub/type_rewriter.hpp"
#include <cctype>

namespace ffistub {

namespace {

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b<e && std::isspace((unsigned char)s[b])) ++b;
    while(e>b && std::isspace((unsigned char)s[e-1])) --e;
    return s.substr(b, e-b);
}

std::vector<std::string> split_top_level(const std::string& s){
    std::vector<std::string> out;
    int depth = 0; size_t start = 0;
    for(size_t i=0;i<s.size();++i){
        char c = s[i];
        if(c=='(' || c=='[' || c=='<') ++depth;
        else if(c==')' || c==']' || c=='>') --depth;
        else if(c==',' && depth==0){ out.push_back(trim(s.substr(start, i-start))); start = i+1; }
    }
    auto last = trim(s.substr(start));
    if(!last.empty()) out.push_back(last);
    return out;
}

std::string last_segment(const std::string& path){
    auto pos = path.rfind("::");
    return pos==std::string::npos ? path : path.substr(pos+2);
}

// Apply `fn` to the attribute lists of the item, its fields and variants.
template<typename Fn>
Declaration map_attrs(const Declaration& d, Fn fn){
    Declaration out = d;
    out.attrs = fn(d.attrs);
    auto fields = [&](std::vector<Field>& fs){ for(auto& f: fs) f.attrs = fn(f.attrs); };
    if(auto* s = std::get_if<StructBody>(&out.body)) fields(s->fields.fields);
    else if(auto* u = std::get_if<UnionBody>(&out.body)) fields(u->fields);
    else if(auto* e = std::get_if<EnumBody>(&out.body)){
        for(auto& v: e->variants){ v.attrs = fn(v.attrs); fields(v.fields.fields); }
    }
    return out;
}

} // namespace

std::vector<Attribute> StripDerives::strip_attrs(const std::vector<Attribute>& attrs) const {
    std::vector<Attribute> out;
    for(auto& a: attrs){
        if(a.style!=Attribute::Style::List || a.name!="derive"){ out.push_back(a); continue; }
        std::string kept;
        for(auto& t: split_top_level(a.tokens)){
            if(names_.count(t) || names_.count(last_segment(t))) continue;
            if(!kept.empty()) kept += ", ";
            kept += t;
        }
        if(!kept.empty()) out.push_back(Attribute::list("derive", kept));
    }
    return out;
}

Declaration StripDerives::apply(const Declaration& d) const {
    if(!d.is<StructBody>() && !d.is<EnumBody>() && !d.is<UnionBody>()) return d;
    Declaration out = d;
    out.attrs = strip_attrs(d.attrs);
    return out;
}

std::vector<Attribute> StripMacros::strip_attrs(const std::vector<Attribute>& attrs) const {
    std::vector<Attribute> out;
    for(auto& a: attrs){
        bool hit = false;
        size_t start = 0;
        while(!hit){
            auto pos = a.name.find("::", start);
            auto seg = trim(a.name.substr(start, pos==std::string::npos ? std::string::npos : pos-start));
            hit = names_.count(seg) > 0;
            if(pos==std::string::npos) break;
            start = pos+2;
        }
        if(!hit) out.push_back(a);
    }
    return out;
}

Declaration StripMacros::apply(const Declaration& d) const {
    return map_attrs(d, [this](const std::vector<Attribute>& attrs){ return strip_attrs(attrs); });
}

ReplaceTypes& ReplaceTypes::replace(const std::string& from, const std::string& to){
    auto f = parse_path(from), t = parse_path(to);
    if(!f) throw conversion_error(ErrorKind::Configuration, "FS0102", "invalid type path '" + from + "'");
    if(!t) throw conversion_error(ErrorKind::Configuration, "FS0102", "invalid type path '" + to + "'");
    rules_.emplace_back(std::move(*f), std::move(*t));
    return *this;
}

type_ptr ReplaceTypes::apply(const type_ptr& t) const {
    if(rules_.empty() || !t) return t;
    return transform_type(t, [this](const type_ptr& n) -> type_ptr {
        auto* p = std::get_if<PathType>(&n->data);
        if(!p) return n;
        for(auto& [from, to]: rules_){
            if(!starts_with_idents(p->path, from) || p->path.leading_colon!=from.leading_colon) continue;
            Path out = to;
            if(from.segments.size()==p->path.segments.size()){
                out.segments.back().args = p->path.segments.back().args;
            } else {
                out.segments.insert(out.segments.end(), p->path.segments.begin() + from.segments.size(), p->path.segments.end());
            }
            return make_type(PathType{std::move(out)});
        }
        return n;
    });
}

Declaration ReplaceTypes::apply(const Declaration& d) const {
    if(rules_.empty()) return d;
    return map_declaration_types(d, [this](const type_ptr& t, const std::string&){ return apply(t); });
}

} // namespace ffistub
