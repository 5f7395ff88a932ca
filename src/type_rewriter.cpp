#include "ffistub/type_rewriter.hpp"
#include "ffistub/diagnostics.hpp"
#include "ffistub/env.hpp"
#include "ffistub/print.hpp"

namespace ffistub {

std::string ExportedTypeIndex::key_for(const Declaration& d){
    std::string cfgs;
    for(auto& a: d.attrs){
        if(!a.is_cfg()) continue;
        if(!cfgs.empty()) cfgs += '|';
        cfgs += to_string(a);
    }
    return cfgs.empty() ? d.name : d.name + "#" + cfgs;
}

void ExportedTypeIndex::insert(const std::string& key){
    keys_.insert(key);
    names_.insert(key.substr(0, key.find('#')));
}

PrimitiveTable default_primitives(){
    PrimitiveTable t;
    for(const char* p: {"bool","char","i8","i16","i32","i64","i128","isize","u8","u16","u32","u64","u128","usize","f32","f64","str"})
        t[p] = p;
    return t;
}

std::vector<Path> default_allowed_prefixes(){
    static const char* const prefixes[] = {
        "std", "core", "alloc",
        "Option", "Result", "Some", "None", "Ok", "Err", "Vec", "String", "Box", "Rc", "Arc",
        "Cell", "RefCell", "Mutex", "RwLock", "HashMap", "HashSet", "BTreeMap", "BTreeSet",
        "std::collections", "std::vec", "std::string", "std::boxed", "std::rc", "std::sync", "std::cell",
        "core::option", "core::result", "core::mem", "core::ptr", "core::slice", "core::str",
        "core::fmt", "core::convert", "core::ops", "core::cmp", "core::clone", "core::marker",
        "libc", "c_char", "c_int", "c_uint", "c_long", "c_ulong", "c_void",
        "bool", "char", "i8", "i16", "i32", "i64", "i128", "isize",
        "u8", "u16", "u32", "u64", "u128", "usize", "f32", "f64", "str",
    };
    std::vector<Path> out;
    for(const char* p: prefixes) out.push_back(*parse_path(p));
    return out;
}

bool TransmutePairs::insert(type_ptr local, type_ptr origin, const SourceLocation& loc){
    auto key = std::make_pair(to_string(local), to_string(origin));
    return pairs_.emplace(std::move(key), TransmutePair{std::move(local), std::move(origin), loc}).second;
}

bool TransmutePairs::contains(const std::string& local, const std::string& origin) const {
    return pairs_.count(std::make_pair(local, origin)) > 0;
}

std::vector<TransmutePair> TransmutePairs::values() const {
    std::vector<TransmutePair> out;
    out.reserve(pairs_.size());
    for(auto& kv: pairs_) out.push_back(kv.second);
    return out;
}

type_ptr transform_type(const type_ptr& t, const std::function<type_ptr(const type_ptr&)>& fn){
    if(!t) return t;
    struct V {
        const std::function<type_ptr(const type_ptr&)>& fn;
        type_data operator()(const PathType& p) const {
            PathType out = p;
            for(auto& seg: out.path.segments)
                for(auto& a: seg.args) if(a.type) a.type = transform_type(a.type, fn);
            return out;
        }
        type_data operator()(const ReferenceType& r) const { ReferenceType out = r; out.elem = transform_type(r.elem, fn); return out; }
        type_data operator()(const PointerType& p) const { PointerType out = p; out.elem = transform_type(p.elem, fn); return out; }
        type_data operator()(const ArrayType& a) const { ArrayType out = a; out.elem = transform_type(a.elem, fn); return out; }
        type_data operator()(const SliceType& s) const { SliceType out = s; out.elem = transform_type(s.elem, fn); return out; }
        type_data operator()(const TupleType& t) const {
            TupleType out = t;
            for(auto& e: out.elems) e = transform_type(e, fn);
            return out;
        }
        type_data operator()(const BareFnType& f) const {
            BareFnType out = f;
            for(auto& p: out.params) p.type = transform_type(p.type, fn);
            if(out.ret) out.ret = transform_type(out.ret, fn);
            return out;
        }
        type_data operator()(const OpaqueType& o) const { return o; }
    };
    return fn(make_type(std::visit(V{fn}, t->data)));
}

type_ptr with_static_lifetimes(const type_ptr& t){
    return transform_type(t, [](const type_ptr& n) -> type_ptr {
        if(auto* r = std::get_if<ReferenceType>(&n->data)){
            ReferenceType out = *r;
            out.lifetime = "'static";
            return make_type(out);
        }
        if(auto* p = std::get_if<PathType>(&n->data)){
            PathType out = *p;
            for(auto& seg: out.path.segments)
                for(auto& a: seg.args) if(a.kind==GenericArg::Kind::Lifetime) a.text = "'static";
            return make_type(out);
        }
        return n;
    });
}

namespace {

const type_ptr* layer_elem(const Type& t){
    if(auto* r = std::get_if<ReferenceType>(&t.data)) return &r->elem;
    if(auto* p = std::get_if<PointerType>(&t.data)) return &p->elem;
    if(auto* a = std::get_if<ArrayType>(&t.data)) return &a->elem;
    if(auto* s = std::get_if<SliceType>(&t.data)) return &s->elem;
    return nullptr;
}

const type_ptr* first_type_arg(const PathSegment& seg){
    for(auto& a: seg.args) if(a.kind==GenericArg::Kind::Type) return &a.type;
    return nullptr;
}

const char* shape_name(const Type& t){
    struct V {
        const char* operator()(const PathType&) const { return "named type"; }
        const char* operator()(const ReferenceType&) const { return "reference"; }
        const char* operator()(const PointerType&) const { return "raw pointer"; }
        const char* operator()(const ArrayType&) const { return "array"; }
        const char* operator()(const SliceType&) const { return "slice"; }
        const char* operator()(const TupleType&) const { return "tuple"; }
        const char* operator()(const BareFnType&) const { return "function pointer"; }
        const char* operator()(const OpaqueType&) const { return "trait object or inferred type"; }
    };
    return std::visit(V{}, t.data);
}

} // namespace

TypeRewriter& TypeRewriter::with_generic_params(const std::vector<std::string>& names){
    generic_params_.insert(names.begin(), names.end());
    return *this;
}

TypeRewriter& TypeRewriter::erase_lifetimes(bool value){
    erase_lifetimes_ = value;
    return *this;
}

type_ptr TypeRewriter::strip_wrappers(const type_ptr& t, bool& stripped) const {
    return strip_impl(t, stripped, true);
}

type_ptr TypeRewriter::strip_impl(const type_ptr& t, bool& stripped, bool wrappers) const {
    if(auto* p = std::get_if<PathType>(&t->data)){
        if(wrappers){
            for(auto& w: cfg_->transparent_wrappers){
                if(!same_idents(p->path, w)) continue;
                if(auto* inner = first_type_arg(p->path.segments.back())){
                    stripped = true;
                    return strip_impl(*inner, stripped, true);
                }
            }
        }
        for(auto& pe: cfg_->prefixed_exported_types){
            if(!same_idents(p->path, pe)) continue;
            stripped = true;
            PathSegment last = p->path.segments.back();
            for(auto& a: last.args) if(a.type) a.type = strip_impl(a.type, stripped, false);
            return make_type(PathType{Path{false, {std::move(last)}}});
        }
        // Wrappers inside generic arguments stay: they may change the layout of the outer type.
        PathType out = *p;
        bool any = false;
        for(auto& seg: out.path.segments)
            for(auto& a: seg.args){
                if(!a.type) continue;
                auto n = strip_impl(a.type, stripped, false);
                if(n!=a.type){ a.type = n; any = true; }
            }
        return any ? make_type(out) : t;
    }
    if(auto* r = std::get_if<ReferenceType>(&t->data)){
        auto e = strip_impl(r->elem, stripped, wrappers);
        if(e==r->elem) return t;
        ReferenceType out = *r; out.elem = e; return make_type(out);
    }
    if(auto* ptr = std::get_if<PointerType>(&t->data)){
        auto e = strip_impl(ptr->elem, stripped, wrappers);
        if(e==ptr->elem) return t;
        PointerType out = *ptr; out.elem = e; return make_type(out);
    }
    if(auto* a = std::get_if<ArrayType>(&t->data)){
        auto e = strip_impl(a->elem, stripped, wrappers);
        if(e==a->elem) return t;
        ArrayType out = *a; out.elem = e; return make_type(out);
    }
    if(auto* s = std::get_if<SliceType>(&t->data)){
        auto e = strip_impl(s->elem, stripped, wrappers);
        if(e==s->elem) return t;
        return make_type(SliceType{e});
    }
    return t;
}

bool TypeRewriter::path_is_ffi_safe(const Path& p) const {
    if(p.leading_colon) return true;
    for(auto& pre: cfg_->allowed_prefixes) if(starts_with_idents(p, pre)) return true;
    if(p.segments.size()==1){
        const auto& name = p.segments[0].ident;
        if(cfg_->exported && cfg_->exported->contains(name)) return true;
        if(generic_params_.count(name)) return true;
        for(auto& pe: cfg_->prefixed_exported_types) if(pe.last_ident()==name) return true;
    }
    for(auto& pe: cfg_->prefixed_exported_types) if(same_idents(p, pe)) return true;
    return false;
}

void TypeRewriter::validate(const type_ptr& t, const std::string& context, const SourceLocation& loc) const {
    if(auto* p = std::get_if<PathType>(&t->data)){
        if(!path_is_ffi_safe(p->path))
            throw conversion_error(ErrorKind::Shape, "FS0201",
                "type '" + to_string(*t) + "' in " + context + " is not valid for FFI: must be either absolute (starting with '::'), "
                "start with an allowed prefix, or be defined in exported types", loc,
                "add the type to the exported declarations or configure an allowed prefix");
        for(auto& seg: p->path.segments)
            for(auto& a: seg.args) if(a.type) validate(a.type, context, loc);
        return;
    }
    if(auto* f = std::get_if<BareFnType>(&t->data)){
        if(!f->abi || *f->abi!="C")
            throw conversion_error(ErrorKind::Shape, "FS0202",
                "function pointer type '" + to_string(*t) + "' in " + context + " must use the extern \"C\" calling convention", loc);
        for(auto& bp: f->params) validate(bp.type, context, loc);
        if(f->ret) validate(f->ret, context, loc);
        return;
    }
    if(auto* tup = std::get_if<TupleType>(&t->data)){
        if(tup->elems.empty()) return;
    } else if(auto* elem = layer_elem(*t)){
        if(!t->is<SliceType>()){ validate(*elem, context, loc); return; }
    }
    throw conversion_error(ErrorKind::Shape, "FS0201",
        "unsupported type shape '" + to_string(*t) + "' (" + shape_name(*t) + ") in " + context, loc,
        "only named types, references, raw pointers, arrays and extern \"C\" function pointers can cross the FFI boundary");
}

type_ptr TypeRewriter::localize_bare_fn(const BareFnType& f, const std::string& context, const SourceLocation& loc) const {
    if(!f.abi || *f.abi!="C")
        throw conversion_error(ErrorKind::Shape, "FS0202",
            "function pointer type '" + to_string(Type{f}) + "' in " + context + " must use the extern \"C\" calling convention", loc);
    BareFnType out = f;
    for(auto& p: out.params){
        bool stripped = false;
        p.type = localize(strip_wrappers(p.type, stripped), context, loc);
    }
    if(out.ret){
        bool stripped = false;
        out.ret = localize(strip_wrappers(out.ret, stripped), context, loc);
    }
    return make_type(out);
}

type_ptr TypeRewriter::localize(const type_ptr& t, const std::string& context, const SourceLocation& loc) const {
    if(auto* f = std::get_if<BareFnType>(&t->data)) return localize_bare_fn(*f, context, loc);
    std::vector<const Type*> layers;
    type_ptr core = t;
    while(core->is<ReferenceType>() || core->is<PointerType>() || core->is<ArrayType>()){
        layers.push_back(core.get());
        core = *layer_elem(*core);
    }
    if(auto* f = std::get_if<BareFnType>(&core->data)) core = localize_bare_fn(*f, context, loc);
    else validate(core, context, loc);
    if(erase_lifetimes_) core = with_static_lifetimes(core);
    if(layers.empty()) return core;
    for(auto it = layers.rbegin(); it!=layers.rend(); ++it){
        const Type& layer = **it;
        if(auto* r = std::get_if<ReferenceType>(&layer.data)) core = make_type(PointerType{r->is_mut, core});
        else if(auto* p = std::get_if<PointerType>(&layer.data)) core = make_type(PointerType{p->is_mut, core});
        else core = make_type(ArrayType{core, layer.as<ArrayType>().len});
    }
    return core;
}

type_ptr TypeRewriter::origin_form(const type_ptr& t) const {
    return transform_type(with_static_lifetimes(t), [this](const type_ptr& n) -> type_ptr {
        auto* p = std::get_if<PathType>(&n->data);
        if(!p || p->path.leading_colon) return n;
        bool exported = p->path.segments.size()==1 && cfg_->exported && cfg_->exported->contains(p->path.segments[0].ident);
        if(!exported)
            for(auto& pe: cfg_->prefixed_exported_types) if(same_idents(p->path, pe)) { exported = true; break; }
        if(!exported) return n;
        PathType out = *p;
        out.path.segments.insert(out.path.segments.begin(), PathSegment{cfg_->crate_name, {}});
        return make_type(out);
    });
}

std::optional<std::string> TypeRewriter::primitive_of(const Type& t) const {
    auto* p = std::get_if<PathType>(&t.data);
    if(!p || !cfg_->primitives) return std::nullopt;
    for(auto& seg: p->path.segments) if(!seg.args.empty()) return std::nullopt;
    auto it = cfg_->primitives->find(to_string(p->path));
    if(it==cfg_->primitives->end()) return std::nullopt;
    return it->second;
}

bool TypeRewriter::equivalent(const Type& a, const Type& b) const {
    if(to_string(a)==to_string(b)) return true;
    auto pa = primitive_of(a), pb = primitive_of(b);
    if(pa && pb) return *pa==*pb;
    if(a.data.index()!=b.data.index()) return false;
    if(auto* ra = std::get_if<ReferenceType>(&a.data)){
        auto& rb = b.as<ReferenceType>();
        return ra->is_mut==rb.is_mut && equivalent(*ra->elem, *rb.elem);
    }
    if(auto* qa = std::get_if<PointerType>(&a.data)){
        auto& qb = b.as<PointerType>();
        return qa->is_mut==qb.is_mut && equivalent(*qa->elem, *qb.elem);
    }
    if(auto* aa = std::get_if<ArrayType>(&a.data)){
        auto& ab = b.as<ArrayType>();
        return aa->len==ab.len && equivalent(*aa->elem, *ab.elem);
    }
    if(auto* sa = std::get_if<SliceType>(&a.data)) return equivalent(*sa->elem, *b.as<SliceType>().elem);
    return false;
}

LocalType TypeRewriter::convert(const type_ptr& original, TransmutePairs& pairs, const SourceLocation& loc, const std::string& context) const {
    auto origin = origin_form(original);
    bool stripped = false;
    auto local = localize(strip_wrappers(original, stripped), context, loc);

    // Compare the innermost differing shapes only.
    type_ptr l = local, o = origin;
    while(true){
        auto* le = layer_elem(*l);
        auto* oe = layer_elem(*o);
        if(!le || !oe) break;
        l = *le; o = *oe;
    }
    bool changed = !equivalent(*l, *o);
    if(changed && pairs.insert(l, o, loc))
        trace("convert", "pair " + to_string(l) + " <-> " + to_string(o) + (stripped ? " (wrapper stripped)" : "") + " in " + context);
    return LocalType{local, changed};
}

Declaration rewrite_declaration_types(const Declaration& d, const TypeRewriter& rewriter, TransmutePairs& pairs, const SourceLocation& loc){
    TypeRewriter scoped = rewriter;
    scoped.with_generic_params(generic_type_params(d.generics));
    return map_declaration_types(d, [&](const type_ptr& t, const std::string& context){
        return scoped.convert(t, pairs, loc, context).type;
    });
}

} // namespace ffistub
