// Conditional-compilation predicates: parsing, simplification against a
// feature/target configuration, and tri-state evaluation.
#pragma once
#include "ffistub/ast.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ffistub {

struct CfgExpr {
    enum class Kind {
        Feature,
        TargetArch,
        TargetVendor,
        TargetOs,
        TargetEnv,
        Not,
        All,
        Any,
        Other, // not understood, kept verbatim
        False  // explicit false, rendered as `any()`
    } kind{Kind::False};
    std::string value;            // atom value or verbatim text for Other
    std::vector<CfgExpr> children; // Not (one), All, Any

    static CfgExpr feature(std::string name){ return CfgExpr{Kind::Feature, std::move(name), {}}; }
    static CfgExpr target_arch(std::string v){ return CfgExpr{Kind::TargetArch, std::move(v), {}}; }
    static CfgExpr target_vendor(std::string v){ return CfgExpr{Kind::TargetVendor, std::move(v), {}}; }
    static CfgExpr target_os(std::string v){ return CfgExpr{Kind::TargetOs, std::move(v), {}}; }
    static CfgExpr target_env(std::string v){ return CfgExpr{Kind::TargetEnv, std::move(v), {}}; }
    static CfgExpr negate(CfgExpr e){ CfgExpr n{Kind::Not, {}, {}}; n.children.push_back(std::move(e)); return n; }
    static CfgExpr all(std::vector<CfgExpr> c){ return CfgExpr{Kind::All, {}, std::move(c)}; }
    static CfgExpr any(std::vector<CfgExpr> c){ return CfgExpr{Kind::Any, {}, std::move(c)}; }
    static CfgExpr other(std::string text){ return CfgExpr{Kind::Other, std::move(text), {}}; }
    static CfgExpr always_false(){ return CfgExpr{Kind::False, {}, {}}; }

    bool is_false() const { return kind==Kind::False; }
    bool operator==(const CfgExpr& o) const { return kind==o.kind && value==o.value && children==o.children; }
    bool operator!=(const CfgExpr& o) const { return !(*this==o); }
};

// Resolved feature/target configuration, read-only during a run.
struct CfgRules {
    std::set<std::string> enabled_features;
    std::set<std::string> disabled_features;
    std::map<std::string, std::string> feature_mappings;
    bool disable_unknown_features = false;
    std::optional<std::string> target_arch;
    std::optional<std::string> target_vendor;
    std::optional<std::string> target_os;
    std::optional<std::string> target_env;

    // True when any rule could change a predicate.
    bool is_active() const;
};

// Never fails: unrecognized text becomes Kind::Other.
CfgExpr parse_cfg(std::string_view text);

std::string to_string(const CfgExpr& e);

// Simplify against `rules`.
//   nullopt       predicate is unconditionally true
//   Kind::False   predicate is false
//   anything else the residual predicate
// `all` stops at the first false child and `any` at the first true child; the
// remaining children are never looked at. Throws conversion_error (FS0101) for a
// feature that is neither enabled, disabled nor mapped unless unknown features
// are disabled.
std::optional<CfgExpr> apply_rules(const CfgExpr& e, const CfgRules& rules, const SourceLocation& loc = {});

enum class Tristate { True, False, Unknown };
enum class OpaquePolicy { AssumeEnabled, Residual };

// Read-only three-valued query; never raises. Unknown features count as
// enabled unless unknown features are disabled.
Tristate evaluate(const CfgExpr& e, const CfgRules& rules, OpaquePolicy policy = OpaquePolicy::AssumeEnabled);

} // namespace ffistub
