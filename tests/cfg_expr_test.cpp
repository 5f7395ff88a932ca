#include <cassert>
#include <iostream>
#include "ffistub/cfg_expr.hpp"
#include "ffistub/diagnostics.hpp"

using namespace ffistub;

static CfgRules rules_with(std::initializer_list<const char*> on, std::initializer_list<const char*> off){
    CfgRules r;
    for(auto f: on) r.enabled_features.insert(f);
    for(auto f: off) r.disabled_features.insert(f);
    return r;
}

static bool throws_code(const CfgExpr& e, const CfgRules& r, const std::string& code){
    try { (void)apply_rules(e, r); }
    catch(const conversion_error& ex){ return ex.code()==code; }
    return false;
}

static void parse_tests(){
    auto e = parse_cfg("feature = \"serde\"");
    assert(e.kind==CfgExpr::Kind::Feature && e.value=="serde");
    auto n = parse_cfg("not(feature = \"x\")");
    assert(n.kind==CfgExpr::Kind::Not && n.children.size()==1 && n.children[0]==CfgExpr::feature("x"));
    auto a = parse_cfg("all(target_os = \"linux\", any(feature = \"a\", feature = \"b\"),)");
    assert(a.kind==CfgExpr::Kind::All && a.children.size()==2);
    assert(a.children[0]==CfgExpr::target_os("linux"));
    assert(a.children[1].kind==CfgExpr::Kind::Any);
    // unrecognized forms never fail
    auto o = parse_cfg("  unix ");
    assert(o.kind==CfgExpr::Kind::Other && o.value=="unix");
    auto kv = parse_cfg("panic = \"abort\"");
    assert(kv.kind==CfgExpr::Kind::Other && kv.value=="panic = \"abort\"");
    auto broken = parse_cfg("all(feature = ");
    assert(broken.kind==CfgExpr::Kind::Other);
    assert(to_string(a)=="all(target_os = \"linux\", any(feature = \"a\", feature = \"b\"))");
    assert(to_string(CfgExpr::always_false())=="any()");
}

static void apply_tests(){
    auto r = rules_with({"a"}, {"x"});
    assert(!apply_rules(CfgExpr::feature("a"), r));
    assert(apply_rules(CfgExpr::feature("x"), r)->is_false());
    // not(disabled) is true
    assert(!apply_rules(parse_cfg("not(feature = \"x\")"), r));
    assert(apply_rules(parse_cfg("not(feature = \"a\")"), r)->is_false());
    // any stops at the first true child: "b" is never looked at
    assert(!apply_rules(parse_cfg("any(feature = \"a\", feature = \"b\")"), r));
    // all stops at the first false child
    assert(apply_rules(parse_cfg("all(feature = \"x\", feature = \"b\")"), r)->is_false());
    // an unmapped feature that is reached is fatal
    assert(throws_code(parse_cfg("all(feature = \"a\", feature = \"b\")"), r, "FS0101"));
    r.disable_unknown_features = true;
    assert(apply_rules(parse_cfg("feature = \"b\""), r)->is_false());
    assert(!apply_rules(parse_cfg("not(feature = \"b\")"), r));

    // mapped features are renamed and kept
    CfgRules m;
    m.feature_mappings["std"] = "use_std";
    auto res = apply_rules(parse_cfg("any(feature = \"std\", unix)"), m);
    assert(res && to_string(*res)=="any(feature = \"use_std\", unix)");

    // targets
    CfgRules t;
    t.target_os = "linux";
    assert(!apply_rules(CfgExpr::target_os("linux"), t));
    assert(apply_rules(CfgExpr::target_os("windows"), t)->is_false());
    auto keep = apply_rules(CfgExpr::target_arch("x86_64"), t);
    assert(keep && *keep==CfgExpr::target_arch("x86_64"));

    // empty combinators
    assert(!apply_rules(CfgExpr::all({}), t));
    assert(apply_rules(CfgExpr::any({}), t)->is_false());
    // a single residual child collapses
    auto single = apply_rules(parse_cfg("all(target_os = \"linux\", feature = \"std\")"), rules_with({"std"}, {}));
    assert(single && *single==CfgExpr::target_os("linux"));
}

static void fixed_point_tests(){
    CfgRules r = rules_with({"a"}, {"x"});
    r.target_os = "linux";
    const char* inputs[] = {
        "all(feature = \"a\", unix)",
        "any(feature = \"x\", target_arch = \"arm\", windows)",
        "not(all(target_os = \"linux\", unix))",
    };
    for(auto in: inputs){
        auto once = apply_rules(parse_cfg(in), r);
        if(!once || once->is_false()) continue;
        auto twice = apply_rules(parse_cfg(to_string(*once)), r);
        assert(twice && *twice==*once);
    }
}

static void evaluate_tests(){
    CfgRules r = rules_with({"a"}, {"x"});
    r.feature_mappings["m"] = "mm";
    assert(evaluate(CfgExpr::feature("a"), r)==Tristate::True);
    assert(evaluate(CfgExpr::feature("x"), r)==Tristate::False);
    assert(evaluate(CfgExpr::feature("m"), r)==Tristate::Unknown);
    // unknown features count as enabled unless disabled
    assert(evaluate(CfgExpr::feature("zzz"), r)==Tristate::True);
    r.disable_unknown_features = true;
    assert(evaluate(CfgExpr::feature("zzz"), r)==Tristate::False);
    assert(evaluate(parse_cfg("not(feature = \"m\")"), r)==Tristate::Unknown);
    assert(evaluate(parse_cfg("all(feature = \"m\", feature = \"x\")"), r)==Tristate::False);
    assert(evaluate(parse_cfg("any(feature = \"m\", feature = \"a\")"), r)==Tristate::True);
    assert(evaluate(CfgExpr::other("unix"), r)==Tristate::True);
    assert(evaluate(CfgExpr::other("unix"), r, OpaquePolicy::Residual)==Tristate::Unknown);
    assert(evaluate(CfgExpr::target_os("linux"), r)==Tristate::Unknown);
    r.target_os = "macos";
    assert(evaluate(CfgExpr::target_os("linux"), r)==Tristate::False);
}

void run_cfg_expr_tests(){
    std::cout << "[cfg] predicate tests...\n";
    parse_tests();
    apply_tests();
    fixed_point_tests();
    evaluate_tests();
    std::cout << "[cfg] predicate tests passed\n";
}
