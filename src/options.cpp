#include "scopefix/options.h"

#include <cstdlib>

namespace scopefix {
namespace {

bool env_has_value(const char *name) {
#if defined(_WIN32) && defined(_MSC_VER)
    char  *value = nullptr;
    size_t len   = 0;
    if (_dupenv_s(&value, &len, name) != 0 || value == nullptr)
        return false;
    const bool has_value = value[0] != '\0';
    std::free(value);
    return has_value;
#else
    const char *value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
#endif
}

} // namespace

void apply_env_overrides(session_options &opts) {
    if (env_has_value("SCOPEFIX_QUIET"))
        opts.coordinator.log_failures = false;
    if (env_has_value("SCOPEFIX_STRICT_TEARDOWN"))
        opts.teardown_contract = TeardownContract::Strict;
    if (env_has_value("SCOPEFIX_NO_STACK_TRACE"))
        opts.coordinator.include_stack_trace = false;
}

} // namespace scopefix
