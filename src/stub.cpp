#include "ffistub/stub.hpp"
#include "ffistub/diagnostics.hpp"

namespace ffistub {

std::optional<Edition> parse_edition(std::string_view text){
    if(text=="2015" || text=="2018" || text=="2021") return Edition::Rust2021;
    if(text=="2024") return Edition::Rust2024;
    return std::nullopt;
}

Attribute no_mangle_attribute(Edition edition){
    if(edition==Edition::Rust2024) return Attribute::list("unsafe", "no_mangle");
    return Attribute::word("no_mangle");
}

Declaration convert_to_stub(const Declaration& function, const TypeRewriter& rewriter, Edition edition,
                            TransmutePairs& pairs, const SourceLocation& loc){
    const auto& src = function.as<FunctionBody>().sig;
    TypeRewriter scoped = rewriter;
    scoped.erase_lifetimes(true);

    Signature sig;
    sig.abi = "C";
    StubCall call;
    call.callee = Path{false, {PathSegment{rewriter.config().crate_name, {}}, PathSegment{function.name, {}}}};
    bool needs_unsafe = false;

    for(size_t i=0;i<src.params.size();++i){
        const auto& p = src.params[i];
        if(p.pattern==FnParam::Pattern::Receiver)
            throw conversion_error(ErrorKind::Shape, "FS0203",
                "function '" + function.name + "' cannot have receiver arguments (like 'self')", loc,
                "exported functions must be free functions");
        if(p.pattern!=FnParam::Pattern::Ident)
            throw conversion_error(ErrorKind::Shape, "FS0204",
                "parameter " + std::to_string(i+1) + " of function '" + function.name + "' uses an unsupported pattern '" +
                (p.pattern==FnParam::Pattern::Wildcard ? std::string("_") : p.name) + "'", loc,
                "give every parameter a plain identifier name");

        auto local = scoped.convert(p.type, pairs, loc, "parameter " + std::to_string(i+1) + " of function '" + function.name + "'");
        FnParam np;
        np.name = p.name;
        np.type = local.type;
        for(auto& a: p.attrs) if(a.is_cfg()) np.attrs.push_back(a);
        sig.params.push_back(std::move(np));

        StubArg arg{p.name, Reborrow::None, local.changed};
        if(auto* r = std::get_if<ReferenceType>(&p.type->data)) arg.reborrow = r->is_mut ? Reborrow::Mut : Reborrow::Shared;
        needs_unsafe = needs_unsafe || arg.transmute || arg.reborrow!=Reborrow::None;
        call.args.push_back(std::move(arg));
    }

    if(src.ret){
        auto local = scoped.convert(src.ret, pairs, loc, "return type of function '" + function.name + "'");
        sig.ret = local.type;
        call.transmute_result = local.changed;
        needs_unsafe = needs_unsafe || local.changed;
    }
    // an unsafe callee keeps the stub unsafe
    sig.is_unsafe = needs_unsafe || src.is_unsafe;

    Declaration out;
    for(auto& a: function.attrs) if(a.is_cfg()) out.attrs.push_back(a);
    out.attrs.push_back(no_mangle_attribute(edition));
    out.vis = "pub";
    out.name = function.name;
    out.body = FunctionBody{std::move(sig), std::nullopt, std::move(call)};
    return out;
}

} // namespace ffistub
