#include "ffistub/cfg_filter.hpp"
#include "ffistub/diagnostics.hpp"
#include "ffistub/env.hpp"
#include "ffistub/target_triple.hpp"
#include <sstream>

namespace ffistub {

std::optional<std::vector<Attribute>> apply_cfg_attrs(const std::vector<Attribute>& attrs, const CfgRules& rules, const SourceLocation& loc){
    std::vector<Attribute> out;
    out.reserve(attrs.size());
    for(auto& a: attrs){
        if(!a.is_cfg()){ out.push_back(a); continue; }
        auto r = apply_rules(parse_cfg(a.tokens), rules, loc);
        if(!r) continue;
        if(r->is_false()) return std::nullopt;
        out.push_back(Attribute::list("cfg", to_string(*r)));
    }
    return out;
}

static std::vector<Field> filter_fields(const std::vector<Field>& fields, const CfgRules& rules, const SourceLocation& loc){
    std::vector<Field> out;
    for(auto& f: fields){
        auto attrs = apply_cfg_attrs(f.attrs, rules, loc);
        if(!attrs) continue;
        Field copy = f;
        copy.attrs = std::move(*attrs);
        out.push_back(std::move(copy));
    }
    return out;
}

std::optional<Declaration> apply_cfg(const Declaration& d, const CfgRules& rules, const SourceLocation& loc){
    auto attrs = apply_cfg_attrs(d.attrs, rules, loc);
    if(!attrs) return std::nullopt;
    Declaration out = d;
    out.attrs = std::move(*attrs);
    if(auto* s = std::get_if<StructBody>(&out.body)){
        s->fields.fields = filter_fields(s->fields.fields, rules, loc);
    } else if(auto* e = std::get_if<EnumBody>(&out.body)){
        std::vector<Variant> kept;
        for(auto& v: e->variants){
            auto vattrs = apply_cfg_attrs(v.attrs, rules, loc);
            if(!vattrs) continue;
            Variant copy = v;
            copy.attrs = std::move(*vattrs);
            copy.fields.fields = filter_fields(v.fields.fields, rules, loc);
            kept.push_back(std::move(copy));
        }
        e->variants = std::move(kept);
    } else if(auto* u = std::get_if<UnionBody>(&out.body)){
        u->fields = filter_fields(u->fields, rules, loc);
    } else if(auto* f = std::get_if<FunctionBody>(&out.body)){
        std::vector<FnParam> kept;
        for(auto& p: f->sig.params){
            auto pattrs = apply_cfg_attrs(p.attrs, rules, loc);
            if(!pattrs) continue;
            FnParam copy = p;
            copy.attrs = std::move(*pattrs);
            kept.push_back(std::move(copy));
        }
        f->sig.params = std::move(kept);
    }
    return out;
}

CfgFilter::Builder& CfgFilter::Builder::enable_feature(std::string feature){
    rules_.disabled_features.erase(feature);
    rules_.enabled_features.insert(std::move(feature));
    return *this;
}
CfgFilter::Builder& CfgFilter::Builder::disable_feature(std::string feature){
    rules_.enabled_features.erase(feature);
    rules_.disabled_features.insert(std::move(feature));
    return *this;
}
CfgFilter::Builder& CfgFilter::Builder::match_feature(std::string from, std::string to){
    rules_.feature_mappings[std::move(from)] = std::move(to);
    return *this;
}
CfgFilter::Builder& CfgFilter::Builder::enable_target_arch(std::string arch){ rules_.target_arch = std::move(arch); return *this; }
CfgFilter::Builder& CfgFilter::Builder::enable_target_vendor(std::string vendor){ rules_.target_vendor = std::move(vendor); return *this; }
CfgFilter::Builder& CfgFilter::Builder::enable_target_os(std::string os){ rules_.target_os = std::move(os); return *this; }
CfgFilter::Builder& CfgFilter::Builder::enable_target_env(std::string env){ rules_.target_env = std::move(env); return *this; }

CfgFilter::Builder& CfgFilter::Builder::target_triple(const std::string& triple){
    TargetTriple::parse(triple).apply_to(rules_);
    return *this;
}

CfgFilter::Builder& CfgFilter::Builder::disable_unknown_features(bool value){
    rules_.disable_unknown_features = value;
    return *this;
}

CfgFilter::Builder& CfgFilter::Builder::predefined_features(std::string features_constant, std::string features_list){
    if(!parse_path(features_constant))
        throw conversion_error(ErrorKind::Configuration, "FS0102", "invalid features constant path '" + features_constant + "'");
    rules_.enabled_features.clear();
    rules_.disabled_features.clear();
    rules_.feature_mappings.clear();
    std::istringstream in(features_list);
    std::string f;
    while(in >> f){
        auto slash = f.rfind('/');
        rules_.enabled_features.insert(slash==std::string::npos ? f : f.substr(slash+1));
    }
    rules_.disable_unknown_features = true;
    features_assert_ = std::make_pair(std::move(features_constant), std::move(features_list));
    return *this;
}

CfgFilter CfgFilter::Builder::build() const {
    std::optional<Item> prelude;
    if(features_assert_){
        Declaration d;
        d.name = "_";
        ConstBody c;
        c.type = make_unit_type();
        c.value = "{ konst::assertc_eq!(" + features_assert_->first + ", \"" + features_assert_->second + "\", "
                  "\"ffistub: features mismatch between source crate and generated file\"); }";
        d.body = std::move(c);
        prelude = Item{std::move(d), SourceLocation{}};
    }
    return CfgFilter(rules_, std::move(prelude));
}

CfgFilter::CfgFilter(CfgRules rules, std::optional<Item> prelude)
    : rules_(std::move(rules)), prelude_(std::move(prelude)) {
    active_ = prelude_.has_value() || rules_.is_active();
}

std::optional<Item> CfgFilter::filter(const Item& item) const {
    if(!active_) return item;
    auto d = apply_cfg(item.decl, rules_, item.location);
    if(!d) return std::nullopt;
    return Item{std::move(*d), item.location};
}

std::optional<Item> CfgFilter::call(ItemSource& upstream){
    if(prelude_){
        auto p = std::move(prelude_);
        prelude_.reset();
        return p;
    }
    while(auto it = upstream()){
        ++seen_;
        auto kept = filter(*it);
        if(kept) return kept;
        ++dropped_;
        trace("cfg", "dropped " + std::string(kind_name(it->decl.kind())) + " '" + it->decl.name + "' at " + it->location.to_string());
    }
    if(seen_) trace("cfg", std::to_string(dropped_) + " of " + std::to_string(seen_) + " items dropped");
    seen_ = 0;
    return std::nullopt;
}

} // namespace ffistub
