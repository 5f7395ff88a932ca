#include <cassert>
#include <iostream>
#include <string>
#include "ffistub/diagnostics.hpp"

using namespace ffistub;

void run_diagnostics_tests(){
    std::cout << "[diag] diagnostics tests...\n";
    conversion_error located(ErrorKind::Shape, "FS0201", "type `&str` of field 'name' is not valid for FFI",
                             SourceLocation{"src/lib.rs", 12, 5}, "use *const c_char");
    assert(std::string(located.what())=="type `&str` of field 'name' is not valid for FFI (at src/lib.rs:12:5)");
    assert(format_diagnostic(located)==std::string("error[FS0201]: ") + located.what() + "\n  hint: use *const c_char");
    auto json = diagnostic_to_json(located);
    assert(json=="{\"code\":\"FS0201\",\"kind\":\"shape\",\"message\":\"type `&str` of field 'name' is not valid for FFI\","
                 "\"hint\":\"use *const c_char\",\"file\":\"src/lib.rs\",\"line\":12,\"column\":5}");

    // no location, no hint
    conversion_error bare(ErrorKind::Configuration, "FS0101", "unmapped feature: q");
    assert(std::string(bare.what())=="unmapped feature: q");
    assert(format_diagnostic(bare)=="error[FS0101]: unmapped feature: q");
    assert(diagnostic_to_json(bare).find("\"line\":0,\"column\":0")!=std::string::npos);

    assert(json_escape("a\"b\\c\n\x01")=="\"a\\\"b\\\\c\\n\\u0001\"");
    assert(std::string(error_kind_name(ErrorKind::Io))=="io");
    std::cout << "[diag] diagnostics tests passed\n";
}
