#include <cassert>
#include <iostream>
#include "ffistub/diagnostics.hpp"
#include "ffistub/target_triple.hpp"

using namespace ffistub;

void run_target_triple_tests(){
    std::cout << "[target] triple tests...\n";
    auto gnu_linux = TargetTriple::parse("x86_64-unknown-linux-gnu");
    assert(gnu_linux.arch=="x86_64" && gnu_linux.vendor=="unknown" && gnu_linux.os=="linux");
    assert(gnu_linux.env && *gnu_linux.env=="gnu");

    auto mac = TargetTriple::parse("aarch64-apple-darwin");
    assert(mac.arch=="aarch64" && mac.vendor=="apple" && mac.os=="macos" && !mac.env);

    auto arm = TargetTriple::parse("armv7-unknown-linux-gnueabihf");
    assert(arm.arch=="arm" && arm.os=="linux" && *arm.env=="gnu");

    auto win = TargetTriple::parse("x86_64-pc-windows-msvc");
    assert(win.vendor=="pc" && win.os=="windows" && *win.env=="msvc");

    assert(to_string(mac.to_cfg())=="all(target_arch = \"aarch64\", target_vendor = \"apple\", target_os = \"macos\")");

    CfgRules rules;
    gnu_linux.apply_to(rules);
    assert(rules.is_active());
    assert(*rules.target_os=="linux" && *rules.target_env=="gnu");
    assert(evaluate(CfgExpr::target_os("linux"), rules)==Tristate::True);
    assert(evaluate(CfgExpr::target_env("musl"), rules)==Tristate::False);

    bool thrown = false;
    try { TargetTriple::parse("nonsense"); }
    catch(const conversion_error& e){ thrown = e.code()=="FS0103" && e.kind()==ErrorKind::Configuration; }
    assert(thrown);
    std::cout << "[target] triple tests passed\n";
}
