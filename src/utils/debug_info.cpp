/**
 * @file debug_info.cpp
 * @brief Stack trace printing for logtest::debug::print_stack_trace()
 *
 * Macro assumptions:
 * - LOGTEST_IS_POSIX : defined as 1 for POSIX-like platforms (glibc/BSD backtrace available)
 */

#include "logtest_base.hpp"

#if defined(LOGTEST_IS_POSIX) && (LOGTEST_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <new>
#include <string>

namespace logtest::debug
{

namespace // anonymous namespace
{
// Format into a fixed stack buffer; the tail is dropped when it does not fit.
// Returns true on success, false on formatting error.
template <typename... Args>
inline bool safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        constexpr std::size_t STACK_BUF_SZ = 2048;
        char stack_buf[STACK_BUF_SZ];

        // format_to_n writes up to STACK_BUF_SZ bytes and does not allocate.
        auto result =
            fmt::format_to_n(stack_buf, STACK_BUF_SZ, fmt_str, std::forward<Args>(args)...);

        const std::size_t needed = static_cast<std::size_t>(result.size);
        const std::size_t have = needed < STACK_BUF_SZ ? needed : STACK_BUF_SZ;

        if (have > 0)
        {
            std::fwrite(stack_buf, 1, have, stderr);
        }
        return true;
    }
    catch (const fmt::format_error &)
    {
        return false;
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
}

#if defined(LOGTEST_IS_POSIX) && (LOGTEST_IS_POSIX)
// Demangled symbol name for a frame, or empty if dladdr() knows nothing about it.
std::string demangled_name(const Dl_info &dlinfo)
{
    if (!dlinfo.dli_sname)
        return {};
    int status = 0;
    char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
    if (status == 0 && dem)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return dlinfo.dli_sname;
}
#endif

} // namespace

/**
 * @warning Not async-signal-safe: it allocates and calls `dladdr`/`__cxa_demangle`.
 *          Call it from ordinary code paths (panic), never from a signal handler.
 */
void print_stack_trace() noexcept
{
    try
    {
#if defined(LOGTEST_IS_POSIX) && (LOGTEST_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        const int nframes = backtrace(callstack, kMaxFrames);
        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        char **symbols = backtrace_symbols(callstack, nframes);
        for (int i = 0; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo{};
            const bool resolved = dladdr(callstack[i], &dlinfo) != 0;
            const std::string name = resolved ? demangled_name(dlinfo) : std::string{};
            if (!name.empty())
            {
                const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                if (saddr)
                    safe_format_to_stderr("{} + {:#x}", name,
                                          static_cast<unsigned long long>(addr - saddr));
                else
                    safe_format_to_stderr("{}", name);
            }
            else if (symbols && symbols[i])
            {
                safe_format_to_stderr("{}", symbols[i]);
            }
            else if (resolved && dlinfo.dli_fname)
            {
                const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
                safe_format_to_stderr("({}) + {:#x}", dlinfo.dli_fname,
                                      static_cast<unsigned long long>(addr - base));
            }
            else
            {
                safe_format_to_stderr("[unknown]");
            }
            safe_format_to_stderr("\n");
        }
        std::free(symbols);
#else
        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        safe_format_to_stderr("  [Stack trace not available on this platform]\n");
#endif
        std::fflush(stderr);
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("Error: Stack trace generation failed with std::bad_alloc.\n", stderr);
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("Error: Stack trace generation failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace logtest::debug
