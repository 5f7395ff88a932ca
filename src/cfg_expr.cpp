#include "ffistub/cfg_expr.hpp"
#include "ffistub/diagnostics.hpp"
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>
#include <cctype>

namespace ffistub {

namespace cfg_grammar {
using namespace tao::pegtl;

struct ws : star< space > {};
struct str_body : star< sor< seq< one<'\\'>, any >, not_one<'"','\\'> > > {};
struct str_lit : seq< one<'"'>, str_body, one<'"'> > {};
struct key : identifier {};
struct key_value : seq< key, ws, one<'='>, ws, str_lit > {};

struct expr;
struct expr_list : seq< one<'('>, ws,
                        opt< expr, star< ws, one<','>, ws, expr >, opt< ws, one<','> > >,
                        ws, one<')'> > {};
struct not_expr : seq< keyword<'n','o','t'>, ws, expr_list > {};
struct all_expr : seq< keyword<'a','l','l'>, ws, expr_list > {};
struct any_expr : seq< keyword<'a','n','y'>, ws, expr_list > {};

// Anything else up to the next separator at this nesting level.
struct paren_group : seq< one<'('>, star< sor< paren_group, str_lit, not_one<'(',')','"'> > >, one<')'> > {};
struct other_atom : plus< sor< paren_group, str_lit, not_one<',','(',')','"'> > > {};

struct expr : sor< not_expr, all_expr, any_expr, key_value, other_atom > {};
struct cfg_root : seq< ws, expr, ws, eof > {};

template<typename Rule>
using selector = tao::pegtl::parse_tree::selector< Rule,
    tao::pegtl::parse_tree::store_content::on< key_value, key, str_body, not_expr, all_expr, any_expr, other_atom > >;
} // namespace cfg_grammar

namespace {

std::string trim(std::string_view s){
    while(!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
    while(!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::string unescape(std::string_view s){
    std::string out;
    for(size_t i=0;i<s.size();++i){
        if(s[i]=='\\' && i+1<s.size()){ out += s[++i]; continue; }
        out += s[i];
    }
    return out;
}

using tree_node = tao::pegtl::parse_tree::node;

CfgExpr lower(const tree_node& n){
    using namespace cfg_grammar;
    if(n.is_type<key_value>()){
        auto k = n.children.at(0)->string();
        auto v = unescape(n.children.at(1)->string_view());
        if(k=="feature") return CfgExpr::feature(v);
        if(k=="target_arch") return CfgExpr::target_arch(v);
        if(k=="target_vendor") return CfgExpr::target_vendor(v);
        if(k=="target_os") return CfgExpr::target_os(v);
        if(k=="target_env") return CfgExpr::target_env(v);
        return CfgExpr::other(trim(n.string_view()));
    }
    if(n.is_type<not_expr>()){
        if(n.children.size()!=1) return CfgExpr::other(trim(n.string_view()));
        return CfgExpr::negate(lower(*n.children[0]));
    }
    if(n.is_type<all_expr>() || n.is_type<any_expr>()){
        std::vector<CfgExpr> kids;
        for(auto& c: n.children) kids.push_back(lower(*c));
        return n.is_type<all_expr>() ? CfgExpr::all(std::move(kids)) : CfgExpr::any(std::move(kids));
    }
    return CfgExpr::other(trim(n.string_view()));
}

std::optional<CfgExpr> reduce(CfgExpr::Kind kind, std::vector<CfgExpr> kids, bool empty_is_true){
    if(kids.empty()) return empty_is_true ? std::nullopt : std::optional<CfgExpr>(CfgExpr::always_false());
    if(kids.size()==1) return std::move(kids[0]);
    return CfgExpr{kind, {}, std::move(kids)};
}

std::optional<CfgExpr> apply_target(const CfgExpr& e, const std::optional<std::string>& selected){
    if(!selected) return e;
    if(*selected==e.value) return std::nullopt;
    return CfgExpr::always_false();
}

Tristate target_state(const CfgExpr& e, const std::optional<std::string>& selected){
    if(!selected) return Tristate::Unknown;
    return *selected==e.value ? Tristate::True : Tristate::False;
}

} // namespace

bool CfgRules::is_active() const {
    return !enabled_features.empty() || !disabled_features.empty() || !feature_mappings.empty() || disable_unknown_features
        || target_arch || target_vendor || target_os || target_env;
}

CfgExpr parse_cfg(std::string_view text){
    tao::pegtl::memory_input<> in(text, std::string("cfg"));
    try {
        auto root = tao::pegtl::parse_tree::parse< cfg_grammar::cfg_root, cfg_grammar::selector >(in);
        if(root && root->children.size()==1) return lower(*root->children[0]);
    } catch(const tao::pegtl::parse_error&){
        // fall through to the opaque form
    }
    return CfgExpr::other(trim(text));
}

std::string to_string(const CfgExpr& e){
    auto join = [](const char* head, const std::vector<CfgExpr>& kids){
        std::string out = std::string(head) + "(";
        for(size_t i=0;i<kids.size();++i){ if(i) out += ", "; out += to_string(kids[i]); }
        return out + ")";
    };
    switch(e.kind){
        case CfgExpr::Kind::Feature: return "feature = \"" + e.value + "\"";
        case CfgExpr::Kind::TargetArch: return "target_arch = \"" + e.value + "\"";
        case CfgExpr::Kind::TargetVendor: return "target_vendor = \"" + e.value + "\"";
        case CfgExpr::Kind::TargetOs: return "target_os = \"" + e.value + "\"";
        case CfgExpr::Kind::TargetEnv: return "target_env = \"" + e.value + "\"";
        case CfgExpr::Kind::Not: return join("not", e.children);
        case CfgExpr::Kind::All: return join("all", e.children);
        case CfgExpr::Kind::Any: return join("any", e.children);
        case CfgExpr::Kind::Other: return e.value;
        case CfgExpr::Kind::False: return "any()";
    }
    return e.value;
}

std::optional<CfgExpr> apply_rules(const CfgExpr& e, const CfgRules& rules, const SourceLocation& loc){
    switch(e.kind){
        case CfgExpr::Kind::Feature: {
            if(rules.enabled_features.count(e.value)) return std::nullopt;
            if(rules.disabled_features.count(e.value)) return CfgExpr::always_false();
            auto it = rules.feature_mappings.find(e.value);
            if(it!=rules.feature_mappings.end()) return CfgExpr::feature(it->second);
            if(rules.disable_unknown_features) return CfgExpr::always_false();
            throw conversion_error(ErrorKind::Configuration, "FS0101", "unmapped feature: " + e.value, loc,
                                   "enable, disable or map the feature, or disable unknown features");
        }
        case CfgExpr::Kind::TargetArch: return apply_target(e, rules.target_arch);
        case CfgExpr::Kind::TargetVendor: return apply_target(e, rules.target_vendor);
        case CfgExpr::Kind::TargetOs: return apply_target(e, rules.target_os);
        case CfgExpr::Kind::TargetEnv: return apply_target(e, rules.target_env);
        case CfgExpr::Kind::All: {
            std::vector<CfgExpr> kept;
            for(auto& c: e.children){
                auto r = apply_rules(c, rules, loc);
                if(!r) continue;
                if(r->is_false()) return CfgExpr::always_false();
                kept.push_back(std::move(*r));
            }
            return reduce(CfgExpr::Kind::All, std::move(kept), true);
        }
        case CfgExpr::Kind::Any: {
            std::vector<CfgExpr> kept;
            for(auto& c: e.children){
                auto r = apply_rules(c, rules, loc);
                if(!r) return std::nullopt;
                if(r->is_false()) continue;
                kept.push_back(std::move(*r));
            }
            return reduce(CfgExpr::Kind::Any, std::move(kept), false);
        }
        case CfgExpr::Kind::Not: {
            auto r = apply_rules(e.children.at(0), rules, loc);
            if(!r) return CfgExpr::always_false();
            if(r->is_false()) return std::nullopt;
            return CfgExpr::negate(std::move(*r));
        }
        case CfgExpr::Kind::Other: return e;
        case CfgExpr::Kind::False: return e;
    }
    return e;
}

Tristate evaluate(const CfgExpr& e, const CfgRules& rules, OpaquePolicy policy){
    switch(e.kind){
        case CfgExpr::Kind::Feature:
            if(rules.enabled_features.count(e.value)) return Tristate::True;
            if(rules.disabled_features.count(e.value)) return Tristate::False;
            if(rules.feature_mappings.count(e.value)) return Tristate::Unknown;
            return rules.disable_unknown_features ? Tristate::False : Tristate::True;
        case CfgExpr::Kind::TargetArch: return target_state(e, rules.target_arch);
        case CfgExpr::Kind::TargetVendor: return target_state(e, rules.target_vendor);
        case CfgExpr::Kind::TargetOs: return target_state(e, rules.target_os);
        case CfgExpr::Kind::TargetEnv: return target_state(e, rules.target_env);
        case CfgExpr::Kind::All: {
            Tristate acc = Tristate::True;
            for(auto& c: e.children){
                auto r = evaluate(c, rules, policy);
                if(r==Tristate::False) return Tristate::False;
                if(r==Tristate::Unknown) acc = Tristate::Unknown;
            }
            return acc;
        }
        case CfgExpr::Kind::Any: {
            Tristate acc = Tristate::False;
            for(auto& c: e.children){
                auto r = evaluate(c, rules, policy);
                if(r==Tristate::True) return Tristate::True;
                if(r==Tristate::Unknown) acc = Tristate::Unknown;
            }
            return acc;
        }
        case CfgExpr::Kind::Not: {
            auto r = evaluate(e.children.at(0), rules, policy);
            if(r==Tristate::True) return Tristate::False;
            if(r==Tristate::False) return Tristate::True;
            return Tristate::Unknown;
        }
        case CfgExpr::Kind::Other: return policy==OpaquePolicy::AssumeEnabled ? Tristate::True : Tristate::Unknown;
        case CfgExpr::Kind::False: return Tristate::False;
    }
    return Tristate::Unknown;
}

} // namespace ffistub
