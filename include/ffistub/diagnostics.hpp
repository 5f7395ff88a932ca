// Fatal conversion errors and their JSON rendering.
#pragma once
#include "ffistub/ast.hpp"
#include <stdexcept>
#include <string>

namespace ffistub {

enum class ErrorKind { Configuration, Shape, Parse, Io };
const char* error_kind_name(ErrorKind k);

// Error codes (stable, used by tests and JSON consumers):
//   FS0101 unmapped feature          FS0201 type not valid for FFI
//   FS0102 invalid configured path   FS0202 bare function without extern "C"
//   FS0103 unresolvable triple       FS0203 receiver parameter
//   FS0301 declaration parse error   FS0204 unsupported parameter pattern
//   FS0302 malformed record file     FS0401 file io
class conversion_error : public std::runtime_error {
public:
    conversion_error(ErrorKind kind, std::string code, std::string message, SourceLocation loc = {}, std::string hint = {});

    ErrorKind kind() const { return kind_; }
    const std::string& code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& hint() const { return hint_; }
    const SourceLocation& location() const { return loc_; }

private:
    ErrorKind kind_;
    std::string code_;
    std::string message_;
    std::string hint_;
    SourceLocation loc_;
};

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"code":..,"kind":..,"message":..,"hint":..,"file":..,"line":..,"column":..}
std::string diagnostic_to_json(const conversion_error& e);

// Human readable form: `error[FS0201]: message (at file:line:col)` plus an optional hint line.
std::string format_diagnostic(const conversion_error& e);

// Print the text form to stderr; with FFISTUB_DIAG_JSON=1 also the JSON form.
void report(const conversion_error& e);

} // namespace ffistub
