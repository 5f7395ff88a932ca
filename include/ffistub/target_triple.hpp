#pragma once
#include "ffistub/cfg_expr.hpp"
#include <optional>
#include <string>

namespace ffistub {

// Rust cfg facts of a target triple, resolved through llvm::Triple.
//   aarch64-apple-darwin           -> arch "aarch64", vendor "apple", os "macos"
//   x86_64-unknown-linux-gnu       -> arch "x86_64", vendor "unknown", os "linux", env "gnu"
//   armv7-unknown-linux-gnueabihf  -> arch "arm", vendor "unknown", os "linux", env "gnu"
struct TargetTriple {
    std::string arch;
    std::string vendor;
    std::string os;
    std::optional<std::string> env;

    // Throws conversion_error (FS0103) when the architecture is unknown.
    static TargetTriple parse(const std::string& triple);

    // all(target_arch = "..", target_vendor = "..", target_os = "..", target_env = ".."),
    // a lone atom when only one fact is known.
    CfgExpr to_cfg() const;

    // Select these facts in `rules`.
    void apply_to(CfgRules& rules) const;
};

} // namespace ffistub
