#pragma once
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace rustdecl::grammar {
using namespace tao::pegtl;

// Comments and whitespace (doc comments are plain comments here)
struct line_comment : seq< two<'/'>, until< eolf > > {};
struct block_comment : seq< string<'/','*'>, until< string<'*','/'>, sor< block_comment, any > > > {};
struct sep : sor< space, line_comment, block_comment > {};
struct ws : star< sep > {};
struct comma : seq< ws, one<','>, ws > {};
struct arrow : string<'-','>'> {};
struct path_sep : two<':'> {};

// Literals and balanced token trees for the regions kept verbatim
struct str_lit : seq< one<'"'>, until< one<'"'>, sor< seq< one<'\\'>, any >, any > > > {};
struct raw_str : seq< one<'r'>, sor< seq< one<'"'>, until< one<'"'> > >,
                                     seq< string<'#','"'>, until< string<'"','#'> > > > > {};
struct char_lit : seq< one<'\''>, sor< seq< one<'\\'>, until< one<'\''> > >,
                                       seq< not_at< one<'\''> >, utf8::any, one<'\''> > > > {};
struct tt;
template<char O, char C>
struct group : seq< one<O>, until< one<C>, tt > > {};
struct tt : sor< line_comment, block_comment, raw_str, str_lit, char_lit,
                 group<'(',')'>, group<'[',']'>, group<'{','}'>, not_one<')',']','}'> > {};

struct angle_group;
struct angle_tt : sor< arrow, angle_group, line_comment, block_comment, str_lit, char_lit,
                       group<'(',')'>, group<'[',']'>, group<'{','}'>, not_one<'<','>',')',']','}'> > {};
struct angle_group : seq< one<'<'>, until< one<'>'>, angle_tt > > {};

struct ident : sor< seq< string<'r','#'>, identifier >, identifier > {};
struct lifetime : seq< one<'\''>, identifier > {};

// Attributes
struct attr_path : seq< opt< path_sep >, ident, star< ws, path_sep, ws, ident > > {};
struct attr_args : group<'(',')'> {};
struct attr_value : plus< tt > {};
struct outer_attr : seq< one<'#'>, ws, one<'['>, ws, attr_path, ws,
                         opt< sor< attr_args, seq< one<'='>, ws, attr_value > > >, ws, one<']'> > {};
struct inner_attr : seq< one<'#'>, one<'!'>, ws, group<'[',']'> > {};

// Visibility: pub, pub(crate), pub(self), pub(super), pub(in path)
struct vis_scope : sor< keyword<'c','r','a','t','e'>, keyword<'s','e','l','f'>, keyword<'s','u','p','e','r'>,
                        seq< keyword<'i','n'>, ws, seq< opt< path_sep >, ident, star< ws, path_sep, ws, ident > > > > {};
struct vis : seq< keyword<'p','u','b'>, opt< ws, one<'('>, ws, vis_scope, ws, one<')'> > > {};

// Types
struct type_;
struct path_root : path_sep {};
struct seg_ident : ident {};
struct binding_name : ident {};
struct binding_arg : seq< binding_name, ws, one<'='>, ws, type_ > {};
struct const_arg : sor< group<'{','}'>, str_lit, char_lit, seq< opt< one<'-'> >, plus< sor< alnum, one<'_'> > > > > {};
struct generic_args : seq< one<'<'>, ws, opt< list< sor< lifetime, binding_arg, type_, const_arg >, comma >, opt< comma > >,
                           ws, one<'>'> > {};
struct path_seg : seq< seg_ident, opt< ws, opt< path_sep, ws >, generic_args > > {};
struct path_type : seq< opt< path_root, ws >, path_seg, star< ws, path_sep, ws, path_seg > > {};

struct ref_mut : keyword<'m','u','t'> {};
struct ref_type : seq< one<'&'>, ws, opt< lifetime, ws >, opt< ref_mut, ws >, type_ > {};
struct ptr_mut : keyword<'m','u','t'> {};
struct ptr_type : seq< one<'*'>, ws, sor< keyword<'c','o','n','s','t'>, ptr_mut >, ws, type_ > {};
struct array_len : plus< tt > {};
struct bracket_type : seq< one<'['>, ws, type_, ws, opt< one<';'>, ws, array_len >, one<']'> > {};
struct trailing_comma : one<','> {};
struct tuple_type : seq< one<'('>, ws, opt< list< type_, comma >, ws, opt< trailing_comma, ws > >, one<')'> > {};
struct never_type : one<'!'> {};
struct infer_type : seq< one<'_'>, not_at< identifier_other > > {};

struct for_lifetimes : seq< keyword<'f','o','r'>, ws, angle_group > {};
struct fn_unsafe : keyword<'u','n','s','a','f','e'> {};
struct abi : str_lit {};
struct fn_extern : seq< keyword<'e','x','t','e','r','n'>, opt< ws, abi > > {};
struct bare_param_name : ident {};
struct bare_param : seq< opt< bare_param_name, ws, one<':'>, not_at< one<':'> >, ws >, type_ > {};
struct bare_variadic : seq< opt< bare_param_name, ws, one<':'>, ws >, string<'.','.','.'> > {};
struct bare_ret : seq< type_ > {};
struct bare_fn_type : seq< opt< for_lifetimes, ws >, opt< fn_unsafe, ws >, opt< fn_extern, ws >,
                           keyword<'f','n'>, ws, one<'('>, ws,
                           opt< list< sor< bare_variadic, bare_param >, comma >, opt< comma > >, ws, one<')'>,
                           opt< ws, arrow, ws, bare_ret > > {};

// Trait bounds only need to be recognized; dyn/impl types are kept as text.
struct bound;
struct fn_sugar : seq< group<'(',')'>, opt< ws, arrow, ws, type_ > > {};
struct bound_seg : seq< ident, opt< ws, opt< path_sep, ws >, sor< generic_args, fn_sugar > > > {};
struct bound_path : seq< opt< path_sep, ws >, bound_seg, star< ws, path_sep, ws, bound_seg > > {};
struct bound : sor< lifetime, seq< one<'('>, ws, bound, ws, one<')'> >,
                    seq< opt< one<'?'>, ws >, opt< for_lifetimes, ws >, bound_path > > {};
struct bounds : list< bound, seq< ws, one<'+'>, ws > > {};
struct dyn_type : seq< keyword<'d','y','n'>, ws, bounds > {};
struct impl_type : seq< keyword<'i','m','p','l'>, ws, bounds > {};
struct qualified_type : seq< one<'<'>, ws, type_, ws, opt< keyword<'a','s'>, ws, bound_path, ws >, one<'>'>,
                             plus< ws, path_sep, ws, path_seg > > {};

struct type_ : sor< never_type, infer_type, ref_type, ptr_type, bracket_type, tuple_type, qualified_type,
                    bare_fn_type, dyn_type, impl_type, path_type > {};

// Items
struct item_name : ident {};
struct generics : angle_group {};
struct where_clause : seq< keyword<'w','h','e','r','e'>, star< not_at< one<'{'> >, not_at< one<';'> >, tt > > {};

struct field_name : ident {};
struct named_field : seq< star< outer_attr, ws >, opt< vis, ws >, field_name, ws, one<':'>, ws, type_ > {};
struct named_fields : seq< one<'{'>, ws, opt< list< named_field, comma >, opt< comma > >, ws, one<'}'> > {};
struct tuple_field : seq< star< outer_attr, ws >, opt< vis, ws >, type_ > {};
struct tuple_fields : seq< one<'('>, ws, opt< list< tuple_field, comma >, opt< comma > >, ws, one<')'> > {};

struct struct_item : seq< keyword<'s','t','r','u','c','t'>, ws, item_name, ws, opt< generics, ws >,
                          sor< seq< opt< where_clause >, named_fields >,
                               seq< tuple_fields, ws, opt< where_clause >, one<';'> >,
                               seq< opt< where_clause >, one<';'> > > > {};

struct variant_name : ident {};
struct discriminant : plus< not_at< one<','> >, tt > {};
struct variant : seq< star< outer_attr, ws >, opt< vis, ws >, variant_name, ws,
                      opt< sor< named_fields, tuple_fields >, ws >, opt< one<'='>, ws, discriminant > > {};
struct enum_item : seq< keyword<'e','n','u','m'>, ws, item_name, ws, opt< generics, ws >, opt< where_clause >,
                        one<'{'>, ws, opt< list< variant, comma >, opt< comma > >, ws, one<'}'> > {};

struct union_item : seq< keyword<'u','n','i','o','n'>, ws, item_name, ws, opt< generics, ws >, opt< where_clause >,
                         named_fields > {};

struct type_item : seq< keyword<'t','y','p','e'>, ws, item_name, ws, opt< generics, ws >, one<'='>, ws, type_, ws,
                        opt< where_clause >, one<';'> > {};

struct const_value : plus< not_at< one<';'> >, tt > {};
struct const_item : seq< keyword<'c','o','n','s','t'>, ws, item_name, ws, one<':'>, ws, type_, ws,
                         opt< one<'='>, ws, const_value >, one<';'> > {};
struct static_mut : keyword<'m','u','t'> {};
struct static_item : seq< keyword<'s','t','a','t','i','c'>, ws, opt< static_mut, ws >, item_name, ws, one<':'>, ws, type_, ws,
                          opt< one<'='>, ws, const_value >, one<';'> > {};

struct q_const : keyword<'c','o','n','s','t'> {};
struct q_async : keyword<'a','s','y','n','c'> {};
struct q_unsafe : keyword<'u','n','s','a','f','e'> {};
struct q_extern : seq< keyword<'e','x','t','e','r','n'>, opt< ws, abi > > {};
struct receiver : seq< opt< one<'&'>, ws, opt< lifetime, ws > >, opt< keyword<'m','u','t'>, ws >, keyword<'s','e','l','f'>,
                       opt< ws, one<':'>, ws, type_ > > {};
struct pat_mut : keyword<'m','u','t'> {};
struct pat_name : ident {};
struct wildcard_pat : seq< one<'_'>, not_at< identifier_other > > {};
struct ident_pat : seq< opt< pat_mut, ws >, pat_name, at< ws, one<':'>, not_at< one<':'> > > > {};
struct other_pat : plus< sor< path_sep, seq< not_at< one<':'> >, not_at< one<','> >, tt > > > {};
struct param_pattern : sor< wildcard_pat, ident_pat, other_pat > {};
struct variadic_param : seq< opt< param_pattern, ws, one<':'>, ws >, string<'.','.','.'> > {};
struct typed_param : seq< param_pattern, ws, one<':'>, ws, type_ > {};
struct fn_param : seq< star< outer_attr, ws >, sor< receiver, variadic_param, typed_param > > {};
struct ret_type : seq< type_ > {};
struct fn_block : group<'{','}'> {};
struct fn_item : seq< opt< q_const, ws >, opt< q_async, ws >, opt< q_unsafe, ws >, opt< q_extern, ws >,
                      keyword<'f','n'>, ws, item_name, ws, opt< generics, ws >,
                      one<'('>, ws, opt< list< fn_param, comma >, opt< comma > >, ws, one<')'>, ws,
                      opt< arrow, ws, ret_type, ws >, opt< where_clause >, sor< fn_block, one<';'> > > {};

// Items without a declaration counterpart (use, mod, impl, trait, extern blocks, macros) are skipped.
struct macro_head : seq< ident, star< ws, path_sep, ws, ident >, ws, one<'!'> > {};
struct skip_head : sor< keyword<'u','s','e'>, keyword<'m','o','d'>, keyword<'i','m','p','l'>, keyword<'t','r','a','i','t'>,
                        seq< keyword<'u','n','s','a','f','e'>, ws, sor< keyword<'i','m','p','l'>, keyword<'t','r','a','i','t'> > >,
                        seq< keyword<'a','u','t','o'>, ws, keyword<'t','r','a','i','t'> >,
                        seq< keyword<'e','x','t','e','r','n'>, ws, keyword<'c','r','a','t','e'> >,
                        seq< keyword<'e','x','t','e','r','n'>, ws, opt< str_lit, ws >, at< one<'{'> > >,
                        macro_head > {};
struct skip_item : seq< skip_head, star< not_at< one<';'> >, not_at< one<'{'> >, tt >,
                        sor< seq< group<'{','}'>, opt< ws, one<';'> > >, one<';'> > > {};

struct item : seq< star< outer_attr, ws >, opt< vis, ws >,
                   sor< fn_item, struct_item, enum_item, union_item, type_item, const_item, static_item, skip_item > > {};

struct file_rule : seq< ws, star< inner_attr, ws >, star< item, ws >, must< eof > > {};
struct type_root : seq< ws, type_, ws, must< eof > > {};

template<typename Rule>
using selector = tao::pegtl::parse_tree::selector< Rule,
    tao::pegtl::parse_tree::store_content::on<
        item, outer_attr, attr_path, attr_args, attr_value, vis,
        struct_item, enum_item, union_item, type_item, const_item, static_item, fn_item,
        item_name, generics, where_clause, named_fields, tuple_fields, named_field, tuple_field, field_name,
        variant, variant_name, discriminant, const_value, static_mut,
        q_const, q_async, q_unsafe, q_extern, abi, fn_param, receiver, variadic_param, typed_param,
        wildcard_pat, ident_pat, pat_mut, pat_name, other_pat, ret_type, fn_block,
        path_type, path_root, path_seg, seg_ident, lifetime, binding_arg, binding_name, const_arg,
        ref_type, ref_mut, ptr_type, ptr_mut, bracket_type, array_len, tuple_type, trailing_comma,
        never_type, infer_type, dyn_type, impl_type, qualified_type,
        bare_fn_type, fn_unsafe, fn_extern, bare_param, bare_param_name, bare_variadic, bare_ret > >;

} // namespace rustdecl::grammar
