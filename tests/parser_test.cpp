#include <cassert>
#include <iostream>
#include "ffistub/diagnostics.hpp"
#include "ffistub/print.hpp"
#include "parser/parser.hpp"

using namespace ffistub;

static std::string type_text(const char* src){ return to_string(rustdecl::Parser().parse_type(src)); }

static void type_tests(){
    rustdecl::Parser p;
    assert(type_text("u32")=="u32");
    assert(type_text("::std::os::raw::c_char")=="::std::os::raw::c_char");
    assert(type_text("Vec< Option<u8> >")=="Vec<Option<u8>>");
    assert(type_text("&'a mut [u8]")=="&'a mut [u8]");
    assert(type_text("*const *mut Foo")=="*const *mut Foo");
    assert(type_text("[u8; 4 * N]")=="[u8; 4 * N]");
    assert(type_text("()")=="()");
    assert(type_text("(u8,)")=="(u8,)");
    assert(type_text("(u8)")=="u8");
    assert(type_text("(u8, i32)")=="(u8, i32)");
    assert(type_text("Iter<'a, Item = u8>")=="Iter<'a, Item = u8>");
    assert(type_text("Array<u8, 3>")=="Array<u8, 3>");
    assert(type_text("Box<dyn  Fn(u8) -> u8 + Send>")=="Box<dyn Fn(u8) -> u8 + Send>");
    assert(type_text("!")=="!");

    auto f = p.parse_type("unsafe extern \"C\" fn(x: *const u8, ...) -> i32");
    auto& bf = f->as<BareFnType>();
    assert(bf.is_unsafe && bf.abi && *bf.abi=="C" && bf.variadic);
    assert(bf.params.size()==1 && *bf.params[0].name=="x");
    assert(to_string(bf.ret)=="i32");
    auto g = p.parse_type("extern fn(u8)");
    assert(*g->as<BareFnType>().abi=="C");
    auto h = p.parse_type("for<'a> fn(&'a u8)");
    assert(!h->as<BareFnType>().abi);

    bool thrown = false;
    try { p.parse_type("Vec<"); }
    catch(const conversion_error& e){ thrown = e.code()=="FS0301"; }
    assert(thrown);
}

static void item_tests(){
    rustdecl::Parser p;
    auto items = p.parse_items(R"(
        //! crate docs
        #![allow(dead_code)]
        use std::fmt;

        /// A point.
        #[repr(C)]
        #[derive(Debug, Clone)]
        pub struct Point<T: Copy = u8> where T: Default {
            pub x: T,
            pub(crate) y: T,
        }

        pub struct Wrapper(pub u32, i64);
        pub struct Marker;

        #[repr(u8)]
        pub enum Color { Red = 1, Green, Custom { r: u8, g: u8 }, Raw(u32), }

        #[repr(C)]
        pub union Bits { i: i32, f: f32 }

        pub type Callback = extern "C" fn(i32) -> i32;
        pub const LIMIT: usize = { 4 * 1024 };
        pub static mut COUNTER: u64 = 0;

        impl Point<u8> { fn new() -> Self { Point { x: 0, y: 0 } } }

        macro_rules! noop { () => {}; }

        #[no_mangle]
        pub const unsafe extern "C" fn compute<'a>(mut a: &'a mut u32, _: u8, (x, y): (u8, u8), values: ...) -> Option<&'a u32> where 'a: 'a {
            let s = "}"; let c = '}';
            None
        }
        pub fn method(&self, other: &Self) {}
    )", "lib.rs");
    assert(items.size()==10);

    auto& pt = items[0].decl;
    assert(pt.kind()==DeclKind::Struct && pt.name=="Point" && pt.vis=="pub");
    assert(pt.generics=="<T: Copy = u8>");
    assert(pt.attrs.size()==2 && pt.attrs[0].name=="repr" && pt.attrs[0].tokens=="C");
    assert(pt.attrs[1].tokens=="Debug, Clone");
    auto& pf = pt.as<StructBody>().fields;
    assert(pf.style==Fields::Style::Named && pf.fields.size()==2 && pf.fields[1].vis=="pub(crate)");
    assert(items[0].location.file=="lib.rs" && items[0].location.line==7);

    auto& w = items[1].decl.as<StructBody>().fields;
    assert(w.style==Fields::Style::Tuple && w.fields.size()==2 && w.fields[0].vis=="pub" && !w.fields[0].name);
    assert(items[2].decl.as<StructBody>().fields.style==Fields::Style::Unit);

    auto& color = items[3].decl.as<EnumBody>();
    assert(color.variants.size()==4);
    assert(*color.variants[0].discriminant=="1" && !color.variants[1].discriminant);
    assert(color.variants[2].fields.style==Fields::Style::Named && color.variants[3].fields.style==Fields::Style::Tuple);

    assert(items[4].decl.kind()==DeclKind::Union && items[4].decl.as<UnionBody>().fields.size()==2);
    assert(to_string(items[5].decl.as<AliasBody>().target)=="extern \"C\" fn(i32) -> i32");
    auto& limit = items[6].decl.as<ConstBody>();
    assert(!limit.is_static && limit.value=="{ 4 * 1024 }");
    auto& counter = items[7].decl.as<ConstBody>();
    assert(counter.is_static && counter.is_mut && items[7].decl.kind()==DeclKind::Static);

    auto& fn = items[8].decl.as<FunctionBody>();
    assert(fn.sig.is_const && fn.sig.is_unsafe && fn.sig.abi && *fn.sig.abi=="C" && fn.sig.variadic);
    assert(fn.sig.params.size()==3);
    assert(fn.sig.params[0].pattern==FnParam::Pattern::Ident && fn.sig.params[0].by_mut);
    assert(fn.sig.params[1].pattern==FnParam::Pattern::Wildcard);
    assert(fn.sig.params[2].pattern==FnParam::Pattern::Other && fn.sig.params[2].name=="(x, y)");
    assert(to_string(fn.sig.ret)=="Option<&'a u32>");
    assert(fn.sig.where_clause=="where 'a: 'a");
    assert(fn.block && fn.block->find("None")!=std::string::npos);

    auto& m = items[9].decl.as<FunctionBody>();
    assert(m.sig.params[0].pattern==FnParam::Pattern::Receiver && m.sig.params[0].name=="&self");
}

static void error_tests(){
    rustdecl::Parser p;
    auto r = p.parse_string("pub struct A;\npub struct {", "bad.rs");
    assert(!r.success && r.line==2 && r.column==1);
    bool thrown = false;
    try { p.parse_items("pub struct A;\npub struct {", "bad.rs", 10); }
    catch(const conversion_error& e){ thrown = e.code()=="FS0301" && e.location().line==12 && e.location().file=="bad.rs"; }
    assert(thrown);
}

void run_parser_tests(){
    std::cout << "[parser] declaration parser tests...\n";
    type_tests();
    item_tests();
    error_tests();
    std::cout << "[parser] declaration parser tests passed\n";
}
