#include "ffistub/env.hpp"
#include <cstdlib>
#include <iostream>

namespace ffistub {

bool flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}

RunEnv detect_env(){
    RunEnv env;
    env.trace = flag_enabled("FFISTUB_TRACE");
    env.diag_json = flag_enabled("FFISTUB_DIAG_JSON");
    if(const char* t = std::getenv("FFISTUB_TARGET_TRIPLE")) env.target_triple = t;
    if(const char* e = std::getenv("FFISTUB_EDITION")) env.edition = e;
    return env;
}

bool trace_enabled(){ return flag_enabled("FFISTUB_TRACE"); }

void trace(std::string_view stage, const std::string& message){
    if(!trace_enabled()) return;
    std::cerr << "[ffistub][" << stage << "] " << message << "\n";
}

} // namespace ffistub
