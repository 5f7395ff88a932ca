#include <cassert>
#include <iostream>
#include "ffistub/cfg_filter.hpp"
#include "ffistub/diagnostics.hpp"
#include "ffistub/print.hpp"
#include "parser/parser.hpp"

using namespace ffistub;

static std::vector<Item> items_of(const char* src){ return rustdecl::Parser().parse_items(src, "lib.rs"); }

static std::vector<Item> run(CfgFilter& f, const char* src){
    auto stream = chain(from_items(items_of(src)), f);
    return drain(stream);
}

static void scenario_tests(){
    // disabled feature under not(): item kept, guard removed
    {
        auto f = CfgFilter::builder().disable_feature("x").build();
        auto out = run(f, "#[cfg(not(feature = \"x\"))] pub struct A;");
        assert(out.size()==1 && out[0].decl.attrs.empty());
    }
    // any() short-circuits before an unmapped feature, with and without disable_unknown
    for(bool disable_unknown: {false, true}){
        auto f = CfgFilter::builder().enable_feature("a").disable_unknown_features(disable_unknown).build();
        auto out = run(f, "#[cfg(any(feature = \"a\", feature = \"b\"))] pub struct B;");
        assert(out.size()==1 && out[0].decl.attrs.empty());
    }
    // disabled items are dropped
    {
        auto f = CfgFilter::builder().disable_feature("x").build();
        auto out = run(f, "#[cfg(feature = \"x\")] pub struct Gone; pub struct Kept;");
        assert(out.size()==1 && out[0].decl.name=="Kept");
    }
    // unmapped feature reached is fatal
    {
        auto f = CfgFilter::builder().enable_feature("a").build();
        bool thrown = false;
        try { run(f, "#[cfg(all(feature = \"a\", feature = \"q\"))] pub struct C;"); }
        catch(const conversion_error& e){ thrown = e.code()=="FS0101" && e.message().find("q")!=std::string::npos; }
        assert(thrown);
    }
    // an unmapped feature is fatal even where the guard would drop the item
    for(const char* src: {"#[cfg(not(feature = \"unmapped\"))] pub struct N;",
                          "#[cfg(all(feature = \"unmapped\", feature = \"x\"))] pub struct M;"}){
        auto f = CfgFilter::builder().disable_feature("x").build();
        bool thrown = false;
        try { run(f, src); }
        catch(const conversion_error& e){ thrown = e.code()=="FS0101" && e.message().find("unmapped")!=std::string::npos; }
        assert(thrown);
    }
}

static void member_tests(){
    auto f = CfgFilter::builder().enable_feature("std").disable_feature("nightly").build();
    auto out = run(f, R"(
        pub struct S {
            pub a: u32,
            #[cfg(feature = "nightly")] pub b: u64,
            #[cfg(feature = "std")] pub c: u8,
        }
        pub enum E {
            One,
            #[cfg(feature = "nightly")] Two,
            Three(#[cfg(feature = "nightly")] u8, u16),
        }
        pub fn f(a: u32, #[cfg(feature = "nightly")] b: u32) {}
    )");
    assert(out.size()==3);
    auto& s = out[0].decl.as<StructBody>();
    assert(s.fields.fields.size()==2);
    assert(*s.fields.fields[1].name=="c" && s.fields.fields[1].attrs.empty());
    auto& e = out[1].decl.as<EnumBody>();
    assert(e.variants.size()==2 && e.variants[1].name=="Three" && e.variants[1].fields.fields.size()==1);
    auto& fn = out[2].decl.as<FunctionBody>();
    assert(fn.sig.params.size()==1 && fn.sig.params[0].name=="a");
}

static void residual_tests(){
    // opaque guards are not a reason to drop, and stay verbatim
    auto f = CfgFilter::builder().target_triple("x86_64-unknown-linux-gnu").build();
    auto out = run(f, R"(
        #[cfg(all(unix, target_os = "linux"))] pub struct U;
        #[cfg(target_os = "windows")] pub struct W;
        #[cfg(not(target_env = "msvc"))] pub struct G;
    )");
    assert(out.size()==2);
    assert(out[0].decl.name=="U" && out[0].decl.attrs.size()==1 && out[0].decl.attrs[0].tokens=="unix");
    assert(out[1].decl.name=="G" && out[1].decl.attrs.empty());

    // an explicit axis set after the triple replaces only that axis
    auto g = CfgFilter::builder().target_triple("x86_64-unknown-linux-gnu").enable_target_env("musl").build();
    assert(*g.rules().target_env=="musl" && *g.rules().target_os=="linux");
    auto envs = run(g, R"(
        #[cfg(target_env = "gnu")] pub struct Gnu;
        #[cfg(target_env = "musl")] pub struct Musl;
    )");
    assert(envs.size()==1 && envs[0].decl.name=="Musl" && envs[0].decl.attrs.empty());
}

static void prelude_tests(){
    auto f = CfgFilter::builder().predefined_features("my_crate::FEATURES", "my_crate/std my_crate/alloc").build();
    assert(f.rules().enabled_features.count("std") && f.rules().enabled_features.count("alloc"));
    assert(f.rules().disable_unknown_features);
    auto out = run(f, "#[cfg(feature = \"serde\")] pub struct S; pub struct T;");
    assert(out.size()==2);
    auto text = to_string(out[0].decl);
    assert(text.find("konst::assertc_eq!(my_crate::FEATURES, \"my_crate/std my_crate/alloc\"")!=std::string::npos);
    assert(out[1].decl.name=="T");
    bool thrown = false;
    try { CfgFilter::builder().predefined_features("not a path", ""); }
    catch(const conversion_error& e){ thrown = e.code()=="FS0102"; }
    assert(thrown);
}

static void inactive_tests(){
    auto f = CfgFilter::builder().build();
    assert(!f.active());
    // nothing configured: even unmapped features pass through untouched
    auto out = run(f, "#[cfg(feature = \"whatever\")] pub struct P;");
    assert(out.size()==1 && out[0].decl.attrs.size()==1);
}

void run_cfg_filter_tests(){
    std::cout << "[cfg] filter tests...\n";
    scenario_tests();
    member_tests();
    residual_tests();
    prelude_tests();
    inactive_tests();
    std::cout << "[cfg] filter tests passed\n";
}
