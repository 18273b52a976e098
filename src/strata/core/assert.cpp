#include <strata/core/assert.h>

#include <cstdlib>
#include <iostream>
#ifndef __clang__
    #include <stacktrace>
#endif

extern char const *__progname;

void strata_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line, char const *const msg)
{
#if __cpp_lib_stacktrace >= 202011L
    std::cerr << std::stacktrace::current() << std::endl;
#endif
    std::cerr << __progname << ": " << file << ':' << line << ": " << function;
    if (expr != nullptr) {
        std::cerr << ": Assertion '" << expr << "' failed.";
    }
    if (msg != nullptr) {
        std::cerr << " " << msg;
    }
    std::cerr << std::endl << std::flush;
    std::abort();
}
