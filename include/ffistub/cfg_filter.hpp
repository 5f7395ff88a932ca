// Applying cfg predicates to whole declarations and to item streams.
#pragma once
#include "ffistub/ast.hpp"
#include "ffistub/cfg_expr.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ffistub {

// Rewrite the `#[cfg(...)]` attributes of one attribute list. Resolved-true
// guards are removed, residual guards are re-rendered. Returns nullopt when any
// guard is false.
std::optional<std::vector<Attribute>> apply_cfg_attrs(const std::vector<Attribute>& attrs, const CfgRules& rules, const SourceLocation& loc);

// Pure rewrite of a declaration: its own guards, then fields, enum variants
// (and their fields) and function parameters. Returns nullopt when the
// declaration itself is disabled.
std::optional<Declaration> apply_cfg(const Declaration& d, const CfgRules& rules, const SourceLocation& loc);

class CfgFilter {
public:
    class Builder {
    public:
        Builder& enable_feature(std::string feature);
        Builder& disable_feature(std::string feature);
        // Keep `#[cfg(feature = "from")]` guards, renamed to `to`.
        Builder& match_feature(std::string from, std::string to);
        Builder& enable_target_arch(std::string arch);
        Builder& enable_target_vendor(std::string vendor);
        Builder& enable_target_os(std::string os);
        Builder& enable_target_env(std::string env);
        // Select arch/vendor/os/env of an LLVM target triple.
        Builder& target_triple(const std::string& triple);
        Builder& disable_unknown_features(bool value = true);
        // Enable exactly `features_list` ("crate/f1 crate/f2"), disable the rest and
        // emit a prelude assertion comparing `features_constant` with the list.
        Builder& predefined_features(std::string features_constant, std::string features_list);

        CfgFilter build() const;

    private:
        CfgRules rules_;
        std::optional<std::pair<std::string, std::string>> features_assert_;
    };

    static Builder builder() { return Builder{}; }

    explicit CfgFilter(CfgRules rules, std::optional<Item> prelude = std::nullopt);

    const CfgRules& rules() const { return rules_; }
    bool active() const { return active_; }

    // Filter one item; nullopt when dropped.
    std::optional<Item> filter(const Item& item) const;

    // Pull stage: prelude first (once), then the surviving upstream items.
    std::optional<Item> call(ItemSource& upstream);

private:
    CfgRules rules_;
    std::optional<Item> prelude_;
    bool active_;
    size_t seen_ = 0;
    size_t dropped_ = 0;
};

} // namespace ffistub
