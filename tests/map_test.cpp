#include <cassert>
#include <iostream>
#include "ffistub/diagnostics.hpp"
#include "ffistub/map.hpp"
#include "ffistub/print.hpp"
#include "parser/parser.hpp"

using namespace ffistub;

static Declaration decl_of(const char* src){ return rustdecl::Parser().parse_items(src, "lib.rs").front().decl; }

static void strip_derives_tests(){
    StripDerives sd;
    sd.strip("Serialize").strip("Deserialize");
    auto d = sd.apply(decl_of("#[derive(Debug, serde::Serialize, Deserialize)] #[repr(C)] pub struct A { pub x: u8 }"));
    assert(d.attrs.size()==2 && d.attrs[0].name=="derive" && d.attrs[0].tokens=="Debug");
    assert(d.attrs[1].name=="repr");

    // an emptied derive is removed entirely
    auto e = sd.apply(decl_of("#[derive(Serialize, Deserialize)] pub enum E { A }"));
    assert(e.attrs.empty());

    // only type declarations carry derives
    auto f = sd.apply(decl_of("#[derive(Serialize)] pub fn f() {}"));
    assert(f.attrs.size()==1);
}

static void strip_macros_tests(){
    StripMacros sm;
    sm.strip("serde");
    auto d = sm.apply(decl_of(R"(
        #[serde(rename_all = "camelCase")]
        #[repr(C)]
        pub struct A {
            #[serde(skip)] pub x: u8,
            #[doc = "kept"] pub y: u8,
        }
    )"));
    assert(d.attrs.size()==1 && d.attrs[0].name=="repr");
    auto& fields = d.as<StructBody>().fields.fields;
    assert(fields[0].attrs.empty() && fields[1].attrs.size()==1);

    StripMacros path_segments;
    path_segments.strip("wasm_bindgen");
    auto e = path_segments.apply(decl_of("#[wasm_bindgen::prelude::wasm_bindgen] pub enum E { #[wasm_bindgen(skip)] A, B }"));
    assert(e.attrs.empty() && e.as<EnumBody>().variants[0].attrs.empty());
}

static void replace_types_tests(){
    ReplaceTypes rt;
    rt.replace("Option", "std::option::Option").replace("crate::ffi", "::libc");
    auto d = rt.apply(decl_of("pub fn f(a: Option<&u8>, b: crate::ffi::c_int, c: *const Option<u8>) -> crate::ffi::c_char {}"));
    auto& sig = d.as<FunctionBody>().sig;
    assert(to_string(sig.params[0].type)=="std::option::Option<&u8>");
    assert(to_string(sig.params[1].type)=="::libc::c_int");
    assert(to_string(sig.params[2].type)=="*const std::option::Option<u8>");
    assert(to_string(sig.ret)=="::libc::c_char");

    // nested generic arguments are rewritten too; unrelated paths are untouched
    auto s = rt.apply(decl_of("pub struct S { pub v: Vec<Option<u32>>, pub w: my::Option }"));
    auto& fs = s.as<StructBody>().fields.fields;
    assert(to_string(fs[0].type)=="Vec<std::option::Option<u32>>");
    assert(to_string(fs[1].type)=="my::Option");

    bool thrown = false;
    try { ReplaceTypes().replace("a b", "c"); }
    catch(const conversion_error& e){ thrown = e.code()=="FS0102"; }
    assert(thrown);
}

void run_map_tests(){
    std::cout << "[map] item stage tests...\n";
    strip_derives_tests();
    strip_macros_tests();
    replace_types_tests();
    std::cout << "[map] item stage tests passed\n";
}
