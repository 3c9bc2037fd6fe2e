#include "scopefix/stack_trace.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#if defined(__unix__) || defined(__APPLE__)
#  include <cxxabi.h>
#  include <dlfcn.h>
#  include <execinfo.h>
#  define SCOPEFIX_HAVE_EXECINFO 1
#else
#  define SCOPEFIX_HAVE_EXECINFO 0
#endif

namespace scopefix {
namespace {

#if SCOPEFIX_HAVE_EXECINFO
std::string symbol_for(void *address, const char *fallback) {
    Dl_info info{};
    if (dladdr(address, &info) != 0 && info.dli_sname) {
        int                                         status = 0;
        std::unique_ptr<char, decltype(&std::free)> demangled(abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, &status), &std::free);
        if (status == 0 && demangled) {
            return demangled.get();
        }
        return info.dli_sname;
    }
    if (fallback) {
        return fallback;
    }
    return fmt::format("{}", address);
}
#endif

} // namespace

stack_trace stack_trace::capture(std::size_t skip, std::size_t max_frames) {
#if SCOPEFIX_HAVE_EXECINFO
    // +1 for this function
    std::vector<void *> addresses(max_frames + skip + 1);
    const int           count = backtrace(addresses.data(), static_cast<int>(addresses.size()));
    if (count <= 0) {
        return {};
    }

    std::unique_ptr<char *, decltype(&std::free)> symbols(backtrace_symbols(addresses.data(), count), &std::free);
    std::vector<StackFrame>                       frames;
    for (std::size_t i = skip + 1; i < static_cast<std::size_t>(count); ++i) {
        frames.push_back(StackFrame{
            .address = addresses[i],
            .symbol  = symbol_for(addresses[i], symbols ? symbols.get()[i] : nullptr),
        });
    }
    return stack_trace(std::move(frames));
#else
    (void)skip;
    (void)max_frames;
    return {};
#endif
}

std::string stack_trace::to_string() const {
    std::string out;
    for (const auto &frame : frames_) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        out.append("   at ");
        out.append(frame.symbol);
    }
    return out;
}

} // namespace scopefix
