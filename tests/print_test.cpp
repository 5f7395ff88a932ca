#include <cassert>
#include <iostream>
#include <sstream>
#include "ffistub/print.hpp"
#include "parser/parser.hpp"

using namespace ffistub;

static std::string roundtrip(const char* src){
    auto items = rustdecl::Parser().parse_items(src, "lib.rs");
    assert(items.size()==1);
    return to_string(items[0].decl);
}

static void declaration_tests(){
    assert(roundtrip("#[repr(C)] pub struct P { pub x: u8, y: *const P }")
           == "#[repr(C)]\npub struct P {\n    pub x: u8,\n    y: *const P,\n}");
    assert(roundtrip("pub struct T(pub u8, [i32; 2]);") == "pub struct T(pub u8, [i32; 2]);");
    assert(roundtrip("struct U;") == "struct U;");
    assert(roundtrip("pub enum E { A = 1, B(u8), C { v: u16 } }")
           == "pub enum E {\n    A = 1,\n    B(u8),\n    C {\n        v: u16,\n    },\n}");
    assert(roundtrip("pub union B { a: u32, b: f32 }") == "pub union B {\n    a: u32,\n    b: f32,\n}");
    assert(roundtrip("pub type H<T> = Option<T>;") == "pub type H<T> = Option<T>;");
    assert(roundtrip("pub static mut N: u32 = 3;") == "pub static mut N: u32 = 3;");
    assert(roundtrip("const K: usize;") == "const K: usize;");
    assert(roundtrip("pub extern \"C\" fn f(mut a: u8, _: u16, ...) -> u8 { a }")
           == "pub extern \"C\" fn f(mut a: u8, _: u16, ...) -> u8 { a }");
    assert(roundtrip("#[doc = \"hi\"] #[inline] fn g();") == "#[doc = \"hi\"]\n#[inline]\nfn g();");
}

static void stub_call_tests(){
    StubCall call;
    call.callee = *parse_path("my_crate::f");
    call.args.push_back({"a", Reborrow::Shared, false});
    call.args.push_back({"b", Reborrow::Mut, true});
    call.args.push_back({"c", Reborrow::None, false});
    assert(call_expression(call) == "my_crate::f(&*a, unsafe { std::mem::transmute(&mut *b) }, c)");

    Declaration d;
    d.vis = "pub";
    d.name = "f";
    FunctionBody fb;
    fb.sig.abi = "C";
    fb.stub = StubCall{*parse_path("crate::f"), {}, false};
    d.body = fb;
    assert(to_string(d) == "pub extern \"C\" fn f() {\n    crate::f()\n}");
    d.as<FunctionBody>().stub->transmute_result = true;
    d.as<FunctionBody>().sig.ret = make_path_type("Foo");
    assert(to_string(d) == "pub extern \"C\" fn f() -> Foo {\n    let result = crate::f();\n    unsafe { std::mem::transmute(result) }\n}");
}

static void assertion_tests(){
    Declaration d;
    d.name = "_";
    d.body = AssertionBody{AssertionBody::Metric::Align, make_path_type("Foo"), make_path_type("my_crate::Foo"), "m"};
    assert(to_string(d) == "const _: () = assert!(std::mem::align_of::<Foo>() == std::mem::align_of::<my_crate::Foo>(), \"m\");");
}

static void write_tests(){
    std::vector<Item> items = rustdecl::Parser().parse_items("pub struct A;\npub struct B;", "lib.rs");
    std::ostringstream plain, located;
    write_items(plain, items);
    write_items(located, items, true);
    assert(plain.str() == "pub struct A;\npub struct B;\n");
    assert(located.str() == "// lib.rs:1:1\npub struct A;\n// lib.rs:2:1\npub struct B;\n");
}

void run_print_tests(){
    std::cout << "[print] rendering tests...\n";
    declaration_tests();
    stub_call_tests();
    assertion_tests();
    write_tests();
    std::cout << "[print] rendering tests passed\n";
}
