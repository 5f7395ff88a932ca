#include "ffistub/diagnostics.hpp"
#include "ffistub/env.hpp"
#include <cstdio>
#include <iostream>
#include <sstream>

namespace ffistub {

static std::string with_location(const std::string& message, const SourceLocation& loc){
    if(!loc.known()) return message;
    return message + " (at " + loc.to_string() + ")";
}

conversion_error::conversion_error(ErrorKind kind, std::string code, std::string message, SourceLocation loc, std::string hint)
    : std::runtime_error(with_location(message, loc)), kind_(kind), code_(std::move(code)),
      message_(std::move(message)), hint_(std::move(hint)), loc_(std::move(loc)) {}

const char* error_kind_name(ErrorKind k){
    switch(k){
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Shape: return "shape";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostic_to_json(const conversion_error& e){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(e.code())
      <<",\"kind\":"<<json_escape(error_kind_name(e.kind()))
      <<",\"message\":"<<json_escape(e.message())
      <<",\"hint\":"<<json_escape(e.hint())
      <<",\"file\":"<<json_escape(e.location().file)
      <<",\"line\":"<<e.location().line
      <<",\"column\":"<<e.location().column
      <<"}";
    return os.str();
}

std::string format_diagnostic(const conversion_error& e){
    std::string out = "error[" + e.code() + "]: " + e.what();
    if(!e.hint().empty()) out += "\n  hint: " + e.hint();
    return out;
}

void report(const conversion_error& e){
    std::cerr << format_diagnostic(e) << "\n";
    if(flag_enabled("FFISTUB_DIAG_JSON")) std::cerr << diagnostic_to_json(e) << "\n";
}

} // namespace ffistub
