/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "piecestream/config.hpp"
#include "piecestream/assert.hpp"

#if PIECESTREAM_USE_ASSERTS

#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdarg>
#include <cstdio>
#include <csignal>

#if defined __GNUC__ && defined __linux__
#include <cxxabi.h>
#include <execinfo.h>
#define PIECESTREAM_USE_EXECINFO 1
#else
#define PIECESTREAM_USE_EXECINFO 0
#endif

namespace {

#if PIECESTREAM_USE_EXECINFO
	// backtrace_symbols() gives us "binary(mangled+0x12) [0x...]"
	std::string demangle(char const* name)
	{
		char const* start = std::strchr(name, '(');
		if (start != nullptr) ++start;
		else start = name;

		char const* end = std::strchr(start, '+');

		std::string in;
		if (end == nullptr) in.assign(start);
		else in.assign(start, end);

		int status = 0;
		char* unmangled = ::abi::__cxa_demangle(in.c_str(), nullptr, nullptr, &status);
		if (unmangled == nullptr) return in.empty() ? std::string(name) : in;
		std::string ret(unmangled);
		std::free(unmangled);
		return ret;
	}

	void print_backtrace(char* out, int len, int max_depth)
	{
		void* stack[50];
		int const size = backtrace(stack, 50);
		char** symbols = backtrace_symbols(stack, size);
		if (symbols == nullptr) return;

		for (int i = 1; i < size && len > 0; ++i)
		{
			int const ret = std::snprintf(out, std::size_t(len), "%d: %s\n"
				, i, demangle(symbols[i]).c_str());
			if (ret < 0 || ret >= len) break;
			out += ret;
			len -= ret;
			if (i - 1 == max_depth && max_depth > 0) break;
		}

		std::free(symbols);
	}
#else
	void print_backtrace(char* out, int len, int)
	{
		if (len > 0) out[0] = '\0';
	}
#endif

}

namespace piecestream {

	PIECESTREAM_EXPORT void assert_print(char const* fmt, ...)
	{
		va_list va;
		va_start(va, fmt);
		std::vfprintf(stderr, fmt, va);
		va_end(va);
	}

	PIECESTREAM_EXPORT void assert_fail(char const* expr, int line
		, char const* file, char const* function, char const* value, int kind)
	{
		char stack[8192];
		stack[0] = '\0';
		print_backtrace(stack, sizeof(stack), 0);

		char const* what = kind == 1
			? "precondition violated by the caller of a piecestream function"
			: "piecestream internal assertion failed";

		assert_print("%s\n  %s:%d in %s\n  expression: %s\n"
			, what, file, line, function, expr);
		if (value != nullptr) assert_print("  %s\n", value);
		assert_print("backtrace:\n%s\n", stack);

		std::raise(SIGABRT);
		std::abort();
	}
}

#else

namespace piecestream {

	// so code built with PIECESTREAM_DEBUG still links against a release
	// build of the library
	PIECESTREAM_EXPORT void assert_print(char const*, ...) {}
	PIECESTREAM_EXPORT void assert_fail(char const*, int, char const*
		, char const*, char const*, int) {}
}

#endif
