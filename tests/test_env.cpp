#include "test_env.hpp"
#include <cstdlib>
#include <string>

#if !defined(_WIN32)
extern "C" int _putenv(const char* assignment)
{
    if (!assignment) return -1;
    std::string text(assignment);
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) return -1;
    std::string name = text.substr(0, eq);
    std::string value = text.substr(eq + 1);
    if (value.empty()) return ::unsetenv(name.c_str());
    return ::setenv(name.c_str(), value.c_str(), 1);
}
#endif
