#include <gtest/gtest.h>
#include <string>
#include "ffistub/diagnostics.hpp"
#include "ffistub/print.hpp"
#include "ffistub/type_rewriter.hpp"
#include "parser/parser.hpp"

using namespace ffistub;

namespace {

// Rewriter over a crate `my_crate` exporting `Foo` and the alias `Int = u32`.
class TypeRewriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        exported.insert("Foo");
        exported.insert("Int");
        primitives = default_primitives();
        primitives["Int"] = "u32";
        primitives["my_crate::Int"] = "u32";
        cfg.crate_name = "my_crate";
        cfg.exported = &exported;
        cfg.primitives = &primitives;
        cfg.allowed_prefixes = default_allowed_prefixes();
    }

    static type_ptr ty(const char* text){ return rustdecl::Parser().parse_type(text); }

    LocalType convert(const char* text){
        TypeRewriter rw(cfg);
        return rw.convert(ty(text), pairs, SourceLocation{"lib.rs", 1, 1}, "test");
    }

    std::string error_code(const char* text){
        try { convert(text); }
        catch(const conversion_error& e){ return e.code(); }
        return "";
    }

    ExportedTypeIndex exported;
    PrimitiveTable primitives;
    RewriteConfig cfg;
    TransmutePairs pairs;
};

} // namespace

TEST_F(TypeRewriterTest, ReferenceBecomesRawPointerAndRecordsPair){
    auto r = convert("&'a Foo");
    EXPECT_EQ(to_string(r.type), "*const Foo");
    EXPECT_TRUE(r.changed);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_TRUE(pairs.contains("Foo", "my_crate::Foo"));

    auto m = convert("&mut [Foo; 4]");
    EXPECT_EQ(to_string(m.type), "*mut [Foo; 4]");
    // the innermost pair is already known
    EXPECT_EQ(pairs.size(), 1u);
}

TEST_F(TypeRewriterTest, PrimitivesAndAliasesAreUnchanged){
    EXPECT_FALSE(convert("u32").changed);
    EXPECT_FALSE(convert("Int").changed);
    EXPECT_FALSE(convert("*const ::libc::c_char").changed);
    EXPECT_FALSE(convert("()").changed);
    EXPECT_TRUE(pairs.empty());
}

TEST_F(TypeRewriterTest, ExportedTypesInsideGenericsChangeTheOuterType){
    auto r = convert("Option<Foo>");
    EXPECT_EQ(to_string(r.type), "Option<Foo>");
    EXPECT_TRUE(r.changed);
    EXPECT_TRUE(pairs.contains("Option<Foo>", "Option<my_crate::Foo>"));
}

TEST_F(TypeRewriterTest, RejectsTypesThatCannotCrossTheBoundary){
    EXPECT_EQ(error_code("Unknown"), "FS0201");
    EXPECT_EQ(error_code("Vec<Unknown>"), "FS0201");
    EXPECT_EQ(error_code("&[u8]"), "FS0201");
    EXPECT_EQ(error_code("(u8, u16)"), "FS0201");
    EXPECT_EQ(error_code("dyn Fn()"), "FS0201");
    EXPECT_EQ(error_code("fn(u8)"), "FS0202");
    EXPECT_EQ(error_code("extern \"system\" fn(u8)"), "FS0202");
    EXPECT_EQ(error_code("extern \"C\" fn(u8) -> u8"), "");
}

TEST_F(TypeRewriterTest, FunctionPointerPairsCarryTheWholeSignature){
    auto r = convert("extern \"C\" fn(&Foo) -> u8");
    EXPECT_EQ(to_string(r.type), "extern \"C\" fn(*const Foo) -> u8");
    EXPECT_TRUE(r.changed);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_TRUE(pairs.values()[0].origin->is<BareFnType>());
}

TEST_F(TypeRewriterTest, TransparentWrapperIsStripped){
    cfg.transparent_wrappers.push_back(*parse_path("std::mem::MaybeUninit"));
    auto r = convert("std::mem::MaybeUninit<Foo>");
    EXPECT_EQ(to_string(r.type), "Foo");
    EXPECT_TRUE(pairs.contains("Foo", "std::mem::MaybeUninit<my_crate::Foo>"));

    // a different path with the same last segment is not a wrapper
    auto other = convert("core::mem::MaybeUninit<u8>");
    EXPECT_EQ(to_string(other.type), "core::mem::MaybeUninit<u8>");
}

TEST_F(TypeRewriterTest, PrefixedExportedTypeIsWrittenByItsLastSegment){
    cfg.prefixed_exported_types.push_back(*parse_path("inner::Bar"));
    auto r = convert("*mut inner::Bar");
    EXPECT_EQ(to_string(r.type), "*mut Bar");
    EXPECT_TRUE(r.changed);
}

TEST_F(TypeRewriterTest, GenericParametersAreAccepted){
    TypeRewriter rw(cfg);
    rw.with_generic_params({"T"});
    auto r = rw.convert(ty("*const T"), pairs, {}, "test");
    EXPECT_EQ(to_string(r.type), "*const T");
    EXPECT_FALSE(r.changed);
}

TEST_F(TypeRewriterTest, ErasedLifetimesBecomeStatic){
    TypeRewriter rw(cfg);
    rw.erase_lifetimes(true);
    auto r = rw.convert(ty("Option<&'a u8>"), pairs, {}, "test");
    EXPECT_EQ(to_string(r.type), "Option<&'static u8>");
    EXPECT_EQ(to_string(with_static_lifetimes(ty("&'a Iter<'b, u8>"))), "&'static Iter<'static, u8>");
}

TEST(ExportedTypeIndexTest, CfgVariantsAreTrackedSeparately){
    auto items = rustdecl::Parser().parse_items(
        "#[cfg(unix)] pub struct A { pub fd: i32 }\n#[cfg(windows)] pub struct A { pub h: usize }", "lib.rs");
    ExportedTypeIndex idx;
    for(auto& it: items) idx.insert(ExportedTypeIndex::key_for(it.decl));
    EXPECT_EQ(idx.size(), 2u);
    EXPECT_TRUE(idx.contains("A"));
    EXPECT_EQ(*idx.keys().begin(), "A##[cfg(unix)]");
}

TEST(TransmutePairsTest, FirstLocationWins){
    TransmutePairs pairs;
    auto a = make_path_type("A"), b = make_path_type("x::A");
    EXPECT_TRUE(pairs.insert(a, b, SourceLocation{"lib.rs", 3, 1}));
    EXPECT_FALSE(pairs.insert(a, b, SourceLocation{"lib.rs", 9, 1}));
    ASSERT_EQ(pairs.values().size(), 1u);
    EXPECT_EQ(pairs.values()[0].location.line, 3);
}
