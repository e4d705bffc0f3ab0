/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/


#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>

#include <unistd.h> // for dup, dup2, ftruncate

#include <boost/system/system_error.hpp>

#include "test.hpp"

using namespace unit_test;

namespace {

struct runner_options
{
	bool capture_stdout = true;
	// sanitizers report on stderr, often right before the process dies, so
	// it's left alone unless asked for
	bool capture_stderr = false;
	std::set<std::string> filters;
};

// saved descriptors of the real stdout/stderr while a test's output is
// captured. -1 when not captured
int saved_stdout = -1;
int saved_stderr = -1;

unit_test_t* running = nullptr;

void restore_terminal()
{
	std::fflush(stdout);
	std::fflush(stderr);
	if (saved_stdout != -1) dup2(saved_stdout, fileno(stdout));
	if (saved_stderr != -1) dup2(saved_stderr, fileno(stderr));
}

// replays the captured output of the running test
void dump_captured_output()
{
	if (running == nullptr || running->output == nullptr) return;

	restore_terminal();
	std::rewind(running->output);
	std::printf("\x1b[1m[%s]\x1b[0m\n\n", running->name);
	char buf[4096];
	for (;;)
	{
		std::size_t const n = std::fread(buf, 1, sizeof(buf), running->output);
		if (n == 0) break;
		std::fwrite(buf, 1, n, stdout);
	}
}

char const* signal_name(int const sig)
{
	switch (sig)
	{
		case SIGSEGV: return "SIGSEGV";
		case SIGBUS: return "SIGBUS";
		case SIGILL: return "SIGILL";
		case SIGABRT: return "SIGABRT";
		case SIGFPE: return "SIGFPE";
		case SIGINT: return "SIGINT";
		default: return "<unknown signal>";
	}
}

void on_signal(int const sig)
{
	std::fprintf(stderr, "caught signal %d (%s)\n", sig, signal_name(sig));
	dump_captured_output();
	std::exit(128 + sig);
}

[[noreturn]] void on_terminate()
{
	dump_captured_output();
	std::abort();
}

void install_handlers()
{
	std::set_terminate(on_terminate);
	for (int const sig : {SIGSEGV, SIGBUS, SIGILL, SIGINT, SIGABRT, SIGFPE})
		std::signal(sig, &on_signal);
	// tests close client sockets while the server is still writing
	std::signal(SIGPIPE, SIG_IGN);
}

void print_usage(char const* exe)
{
	std::printf("usage: %s [options] [filter...]\n\n"
		"  -h, --help         print this message\n"
		"  -l, --list         list the registered tests\n"
		"  -n, --no-redirect  print test output as it happens instead of\n"
		"                     only for failing tests\n"
		"  --stderr-redirect  capture stderr as well\n\n"
		"a test runs if its name contains any of the filters. Without\n"
		"filters every test runs\n", exe);
}

// points stdout (and optionally stderr) at a temporary file owned by ``t``
void capture_output(unit_test_t& t, runner_options const& opts)
{
	std::fflush(stdout);
	std::fflush(stderr);

	FILE* f = std::tmpfile();
	if (f == nullptr)
	{
		std::printf("cannot capture test output, tmpfile: %s\n", std::strerror(errno));
		return;
	}

	bool ok = true;
	if (opts.capture_stdout && dup2(fileno(f), fileno(stdout)) < 0) ok = false;
	if (opts.capture_stderr && dup2(fileno(f), fileno(stderr)) < 0) ok = false;
	if (!ok)
	{
		std::printf("cannot capture test output, dup2: %s\n", std::strerror(errno));
		std::fclose(f);
		return;
	}
	t.output = f;
}

void run_test(unit_test_t& t)
{
	g_test_failures = 0;
	try
	{
		t.fun();
	}
	catch (boost::system::system_error const& e)
	{
		std::string const msg = "TEST_ERROR: uncaught system_error: ["
			+ std::string(e.code().category().name()) + ":"
			+ std::to_string(e.code().value()) + "] " + e.code().message();
		report_failure(msg.c_str(), __FILE__, __LINE__);
	}
	catch (std::exception const& e)
	{
		std::string const msg = std::string("TEST_ERROR: uncaught exception: ") + e.what();
		report_failure(msg.c_str(), __FILE__, __LINE__);
	}
	catch (...)
	{
		report_failure("TEST_ERROR: uncaught exception of unknown type", __FILE__, __LINE__);
	}
	t.num_failures = g_test_failures;
	t.run = true;
}

bool selected(unit_test_t const& t, runner_options const& opts
	, std::set<std::string>& unmatched)
{
	if (opts.filters.empty()) return true;
	bool match = false;
	for (auto const& f : opts.filters)
	{
		if (std::strstr(t.name, f.c_str()) == nullptr) continue;
		match = true;
		unmatched.erase(f);
	}
	return match;
}

} // anonymous namespace

void unit_test::reset_output()
{
	if (running == nullptr || running->output == nullptr) return;
	std::fflush(stdout);
	std::fflush(stderr);
	std::rewind(running->output);
	if (ftruncate(fileno(running->output), 0) != 0)
		std::fprintf(stderr, "cannot truncate test output: %s\n", std::strerror(errno));
}

int main(int argc, char const* argv[])
{
	using namespace std::literals::string_view_literals;

	char const* const exe = argv[0];
	runner_options opts;

	for (int i = 1; i < argc; ++i)
	{
		std::string_view const arg = argv[i];
		if (arg == "-h"sv || arg == "--help"sv)
		{
			print_usage(exe);
			return 0;
		}
		else if (arg == "-l"sv || arg == "--list"sv)
		{
			for (int k = 0; k < g_num_unit_tests; ++k)
				std::printf("%s\n", g_unit_tests[k].name);
			return 0;
		}
		else if (arg == "-n"sv || arg == "--no-redirect"sv)
		{
			opts.capture_stdout = false;
			opts.capture_stderr = false;
		}
		else if (arg == "--stderr-redirect"sv)
		{
			opts.capture_stderr = true;
		}
		else
		{
			opts.filters.insert(argv[i]);
		}
	}

	if (g_num_unit_tests == 0)
	{
		std::printf("\x1b[31mTEST_ERROR: no tests registered\x1b[0m\n");
		return 1;
	}

	install_handlers();
	std::printf("running %s\n", exe);

	if (opts.capture_stdout) saved_stdout = dup(fileno(stdout));
	if (opts.capture_stderr) saved_stderr = dup(fileno(stderr));

	std::set<std::string> unmatched = opts.filters;
	int num_run = 0;
	for (int i = 0; i < g_num_unit_tests; ++i)
	{
		unit_test_t& t = g_unit_tests[i];
		if (!selected(t, opts, unmatched)) continue;

		if (opts.capture_stdout || opts.capture_stderr) capture_output(t, opts);
		std::setbuf(stdout, nullptr);
		std::setbuf(stderr, nullptr);

		g_test_idx = i;
		running = &t;
		run_test(t);
		if (t.num_failures > 0) dump_captured_output();
		++num_run;

		if (t.output != nullptr)
		{
			std::fclose(t.output);
			t.output = nullptr;
		}
		running = nullptr;
	}

	restore_terminal();

	for (auto const& name : unmatched)
		std::printf("\x1b[1mno test matches:\x1b[0m %s\n", name.c_str());

	if (num_run == 0)
	{
		std::printf("\x1b[31mTEST_ERROR: no tests run\x1b[0m\n");
		return 1;
	}

	return print_failures() ? 333 : 0;
}
