#include "ffistub/print.hpp"
#include <sstream>

namespace ffistub {

namespace {

std::string vis_prefix(const std::string& vis){ return vis.empty() ? std::string() : vis + " "; }

std::string render_generic_arg(const GenericArg& a){
    switch(a.kind){
        case GenericArg::Kind::Type: return to_string(a.type);
        case GenericArg::Kind::Lifetime: return a.text;
        case GenericArg::Kind::Const: return a.text;
        case GenericArg::Kind::Binding: return a.text + " = " + to_string(a.type);
    }
    return a.text;
}

void render_attrs(std::ostringstream& os, const std::vector<Attribute>& attrs, const std::string& indent){
    for(auto& a: attrs) os << indent << to_string(a) << "\n";
}

std::string inline_attrs(const std::vector<Attribute>& attrs){
    std::string out;
    for(auto& a: attrs){ out += to_string(a); out += ' '; }
    return out;
}

void render_named_fields(std::ostringstream& os, const std::vector<Field>& fields, const std::string& indent){
    os << " {\n";
    for(auto& f: fields){
        render_attrs(os, f.attrs, indent + "    ");
        os << indent << "    " << vis_prefix(f.vis) << (f.name ? *f.name : std::string("_")) << ": " << to_string(f.type) << ",\n";
    }
    os << indent << "}";
}

void render_tuple_fields(std::ostringstream& os, const std::vector<Field>& fields){
    os << "(";
    for(size_t i=0;i<fields.size();++i){
        if(i) os << ", ";
        os << inline_attrs(fields[i].attrs) << vis_prefix(fields[i].vis) << to_string(fields[i].type);
    }
    os << ")";
}

std::string render_param(const FnParam& p){
    switch(p.pattern){
        case FnParam::Pattern::Ident: return inline_attrs(p.attrs) + (p.by_mut ? "mut " : "") + p.name + ": " + to_string(p.type);
        case FnParam::Pattern::Wildcard: return inline_attrs(p.attrs) + "_: " + to_string(p.type);
        case FnParam::Pattern::Receiver: return inline_attrs(p.attrs) + p.name;
        case FnParam::Pattern::Other: return inline_attrs(p.attrs) + p.name + ": " + to_string(p.type);
    }
    return p.name;
}

std::string render_stub_arg(const StubArg& a){
    std::string base = a.name;
    if(a.reborrow==Reborrow::Shared) base = "&*" + a.name;
    else if(a.reborrow==Reborrow::Mut) base = "&mut *" + a.name;
    if(a.transmute) return "unsafe { std::mem::transmute(" + base + ") }";
    return base;
}

void render_function(std::ostringstream& os, const Declaration& d, const FunctionBody& f){
    const auto& s = f.sig;
    os << vis_prefix(d.vis);
    if(s.is_const) os << "const ";
    if(s.is_async) os << "async ";
    if(s.is_unsafe) os << "unsafe ";
    if(s.abi) os << "extern \"" << *s.abi << "\" ";
    os << "fn " << d.name << d.generics << "(";
    for(size_t i=0;i<s.params.size();++i){
        if(i) os << ", ";
        os << render_param(s.params[i]);
    }
    if(s.variadic) os << (s.params.empty() ? "..." : ", ...");
    os << ")";
    if(s.ret) os << " -> " << to_string(s.ret);
    if(!s.where_clause.empty()) os << " " << s.where_clause;
    if(f.stub){
        os << " {\n";
        if(f.stub->transmute_result){
            os << "    let result = " << call_expression(*f.stub) << ";\n";
            os << "    unsafe { std::mem::transmute(result) }\n";
        } else {
            os << "    " << call_expression(*f.stub) << "\n";
        }
        os << "}";
    } else if(f.block){
        os << " " << *f.block;
    } else {
        os << ";";
    }
}

} // namespace

std::string to_string(const Path& p){
    std::string out = p.leading_colon ? "::" : "";
    for(size_t i=0;i<p.segments.size();++i){
        if(i) out += "::";
        out += p.segments[i].ident;
        const auto& args = p.segments[i].args;
        if(!args.empty()){
            out += '<';
            for(size_t j=0;j<args.size();++j){
                if(j) out += ", ";
                out += render_generic_arg(args[j]);
            }
            out += '>';
        }
    }
    return out;
}

std::string to_string(const type_ptr& t){ return t ? to_string(*t) : std::string("()"); }

std::string to_string(const Type& t){
    struct V {
        std::string operator()(const PathType& p) const { return to_string(p.path); }
        std::string operator()(const ReferenceType& r) const {
            std::string out = "&";
            if(r.lifetime) out += *r.lifetime + " ";
            if(r.is_mut) out += "mut ";
            return out + to_string(r.elem);
        }
        std::string operator()(const PointerType& p) const { return (p.is_mut ? "*mut " : "*const ") + to_string(p.elem); }
        std::string operator()(const ArrayType& a) const { return "[" + to_string(a.elem) + "; " + a.len + "]"; }
        std::string operator()(const SliceType& s) const { return "[" + to_string(s.elem) + "]"; }
        std::string operator()(const TupleType& t) const {
            if(t.elems.size()==1) return "(" + to_string(t.elems[0]) + ",)";
            std::string out = "(";
            for(size_t i=0;i<t.elems.size();++i){ if(i) out += ", "; out += to_string(t.elems[i]); }
            return out + ")";
        }
        std::string operator()(const BareFnType& f) const {
            std::string out;
            if(f.is_unsafe) out += "unsafe ";
            if(f.abi) out += "extern \"" + *f.abi + "\" ";
            out += "fn(";
            for(size_t i=0;i<f.params.size();++i){
                if(i) out += ", ";
                if(f.params[i].name) out += *f.params[i].name + ": ";
                out += to_string(f.params[i].type);
            }
            if(f.variadic) out += f.params.empty() ? "..." : ", ...";
            out += ")";
            if(f.ret) out += " -> " + to_string(f.ret);
            return out;
        }
        std::string operator()(const OpaqueType& o) const { return o.text; }
    };
    return std::visit(V{}, t.data);
}

std::string to_string(const Attribute& a){
    switch(a.style){
        case Attribute::Style::Word: return "#[" + a.name + "]";
        case Attribute::Style::List: return "#[" + a.name + "(" + a.tokens + ")]";
        case Attribute::Style::NameValue: return "#[" + a.name + " = " + a.tokens + "]";
    }
    return "#[" + a.name + "]";
}

std::string call_expression(const StubCall& call){
    std::string out = to_string(call.callee) + "(";
    for(size_t i=0;i<call.args.size();++i){
        if(i) out += ", ";
        out += render_stub_arg(call.args[i]);
    }
    return out + ")";
}

std::string to_string(const Declaration& d){
    std::ostringstream os;
    render_attrs(os, d.attrs, "");
    if(auto* s = std::get_if<StructBody>(&d.body)){
        os << vis_prefix(d.vis) << "struct " << d.name << d.generics;
        switch(s->fields.style){
            case Fields::Style::Named: render_named_fields(os, s->fields.fields, ""); break;
            case Fields::Style::Tuple: render_tuple_fields(os, s->fields.fields); os << ";"; break;
            case Fields::Style::Unit: os << ";"; break;
        }
    } else if(auto* e = std::get_if<EnumBody>(&d.body)){
        os << vis_prefix(d.vis) << "enum " << d.name << d.generics << " {\n";
        for(auto& v: e->variants){
            render_attrs(os, v.attrs, "    ");
            os << "    " << v.name;
            if(v.fields.style==Fields::Style::Named) render_named_fields(os, v.fields.fields, "    ");
            else if(v.fields.style==Fields::Style::Tuple) render_tuple_fields(os, v.fields.fields);
            if(v.discriminant) os << " = " << *v.discriminant;
            os << ",\n";
        }
        os << "}";
    } else if(auto* u = std::get_if<UnionBody>(&d.body)){
        os << vis_prefix(d.vis) << "union " << d.name << d.generics;
        render_named_fields(os, u->fields, "");
    } else if(auto* a = std::get_if<AliasBody>(&d.body)){
        os << vis_prefix(d.vis) << "type " << d.name << d.generics << " = " << to_string(a->target) << ";";
    } else if(auto* c = std::get_if<ConstBody>(&d.body)){
        os << vis_prefix(d.vis) << (c->is_static ? "static " : "const ") << (c->is_mut ? "mut " : "") << d.name << ": " << to_string(c->type);
        if(!c->value.empty()) os << " = " << c->value;
        os << ";";
    } else if(auto* f = std::get_if<FunctionBody>(&d.body)){
        render_function(os, d, *f);
    } else if(auto* as = std::get_if<AssertionBody>(&d.body)){
        const char* fn = as->metric==AssertionBody::Metric::Size ? "size_of" : "align_of";
        os << "const _: () = assert!(std::mem::" << fn << "::<" << to_string(as->local) << ">() == std::mem::"
           << fn << "::<" << to_string(as->origin) << ">(), \"" << as->message << "\");";
    }
    return os.str();
}

void write_items(std::ostream& os, const std::vector<Item>& items, bool with_locations){
    for(auto& it: items){
        if(with_locations && it.location.known()) os << "// " << it.location.to_string() << "\n";
        os << to_string(it.decl) << "\n";
    }
}

} // namespace ffistub
