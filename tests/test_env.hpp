#pragma once

// Tests toggle FFISTUB_* variables with the Windows spelling _putenv("NAME=VALUE");
// "NAME=" removes the variable. POSIX builds get a definition in test_env.cpp.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif
