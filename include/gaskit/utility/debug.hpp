#pragma once

#ifndef NDEBUG

#include <iostream>
#include <cstdlib>
#include <string>


#define GK_ASSERT(Expr, Msg) gaskit::utility::debug::gk_assert(#Expr, (Expr), __FILE__, __LINE__, (Msg))

namespace gaskit::utility::debug {

    inline void gk_assert(const char* expr_str, bool expr, const char* file, int line, const char* msg) {
        if (!expr) {
            std::cerr << "Assert failed:\t" << msg << "\n"
                << "Expected:\t" << expr_str << "\n"
                << "Source:\t\t" << file << ", line " << line << "\n";
            std::abort();
        }
    }

    inline void gk_assert(const char* expr_str, bool expr, const char* file, int line, const std::string& msg) {
        gk_assert(expr_str, expr, file, line, msg.c_str());
    }

} // namespace gaskit::utility::debug

#else

#define GK_ASSERT(Expr, Msg)

#endif
