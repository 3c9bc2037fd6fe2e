#include "scopefix/routine.h"

namespace scopefix {

std::string_view fixture_routine::short_type_name() const {
    std::string_view type = declaring_type;
    const auto       pos  = type.rfind("::");
    if (pos == std::string_view::npos)
        return type;
    return type.substr(pos + 2);
}

} // namespace scopefix
