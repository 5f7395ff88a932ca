#include "ffistub/target_triple.hpp"
#include "ffistub/diagnostics.hpp"
#include <llvm/Config/llvm-config.h>
#if LLVM_VERSION_MAJOR >= 17
#include <llvm/TargetParser/Triple.h>
#else
#include <llvm/ADT/Triple.h>
#endif

namespace ffistub {

namespace {

std::string rust_arch(const llvm::Triple& t){
    switch(t.getArch()){
        case llvm::Triple::x86: return "x86";
        case llvm::Triple::x86_64: return "x86_64";
        case llvm::Triple::aarch64:
        case llvm::Triple::aarch64_be:
        case llvm::Triple::aarch64_32: return "aarch64";
        case llvm::Triple::arm:
        case llvm::Triple::armeb:
        case llvm::Triple::thumb:
        case llvm::Triple::thumbeb: return "arm";
        case llvm::Triple::mips:
        case llvm::Triple::mipsel: return "mips";
        case llvm::Triple::mips64:
        case llvm::Triple::mips64el: return "mips64";
        case llvm::Triple::ppc:
        case llvm::Triple::ppcle: return "powerpc";
        case llvm::Triple::ppc64:
        case llvm::Triple::ppc64le: return "powerpc64";
        case llvm::Triple::systemz: return "s390x";
        case llvm::Triple::sparcv9: return "sparc64";
        case llvm::Triple::bpfel:
        case llvm::Triple::bpfeb: return "bpf";
        default: return llvm::Triple::getArchTypeName(t.getArch()).str();
    }
}

std::string rust_vendor(const llvm::Triple& t){
    switch(t.getVendor()){
        case llvm::Triple::Apple: return "apple";
        case llvm::Triple::PC: return "pc";
        case llvm::Triple::UnknownVendor: return "unknown";
        default: return llvm::Triple::getVendorTypeName(t.getVendor()).str();
    }
}

std::string rust_os(const llvm::Triple& t){
    switch(t.getOS()){
        case llvm::Triple::Darwin:
        case llvm::Triple::MacOSX: return "macos";
        case llvm::Triple::IOS: return "ios";
        case llvm::Triple::TvOS: return "tvos";
        case llvm::Triple::WatchOS: return "watchos";
        case llvm::Triple::Linux: return t.isAndroid() ? "android" : "linux";
        case llvm::Triple::Win32: return "windows";
        case llvm::Triple::DragonFly: return "dragonfly";
        case llvm::Triple::WASI: return "wasi";
        case llvm::Triple::Emscripten: return "emscripten";
        case llvm::Triple::UnknownOS: {
            // "none" (bare metal) and "unknown" both normalize to UnknownOS
            auto raw = t.getOSName();
            return raw.empty() ? std::string("unknown") : raw.str();
        }
        default: return llvm::Triple::getOSTypeName(t.getOS()).str();
    }
}

std::optional<std::string> rust_env(const llvm::Triple& t){
    switch(t.getEnvironment()){
        case llvm::Triple::GNU:
        case llvm::Triple::GNUABIN32:
        case llvm::Triple::GNUABI64:
        case llvm::Triple::GNUEABI:
        case llvm::Triple::GNUEABIHF:
        case llvm::Triple::GNUX32: return std::string("gnu");
        case llvm::Triple::Musl:
        case llvm::Triple::MuslEABI:
        case llvm::Triple::MuslEABIHF: return std::string("musl");
        case llvm::Triple::MSVC: return std::string("msvc");
        case llvm::Triple::Android:
        case llvm::Triple::UnknownEnvironment: return std::nullopt;
        default: return llvm::Triple::getEnvironmentTypeName(t.getEnvironment()).str();
    }
}

} // namespace

TargetTriple TargetTriple::parse(const std::string& triple){
    llvm::Triple t(llvm::Triple::normalize(triple));
    if(t.getArch()==llvm::Triple::UnknownArch)
        throw conversion_error(ErrorKind::Configuration, "FS0103", "unknown target triple '" + triple + "'", {},
                               "expected <arch>-<vendor>-<os>[-<env>], e.g. x86_64-unknown-linux-gnu");
    TargetTriple out;
    out.arch = rust_arch(t);
    out.vendor = rust_vendor(t);
    out.os = rust_os(t);
    out.env = rust_env(t);
    return out;
}

CfgExpr TargetTriple::to_cfg() const {
    std::vector<CfgExpr> parts;
    if(!arch.empty()) parts.push_back(CfgExpr::target_arch(arch));
    if(!vendor.empty()) parts.push_back(CfgExpr::target_vendor(vendor));
    if(!os.empty()) parts.push_back(CfgExpr::target_os(os));
    if(env) parts.push_back(CfgExpr::target_env(*env));
    if(parts.size()==1) return parts[0];
    return CfgExpr::all(std::move(parts));
}

void TargetTriple::apply_to(CfgRules& rules) const {
    rules.target_arch = arch;
    rules.target_vendor = vendor;
    rules.target_os = os;
    rules.target_env = env;
}

} // namespace ffistub
