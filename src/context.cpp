#include "scopefix/context.h"

#include <mutex>
#include <string>
#include <utility>

namespace scopefix {

void execution_context::set_property(std::string key, std::string value) {
    std::lock_guard<std::mutex> lk(mtx_);
    properties_.insert_or_assign(std::move(key), std::move(value));
}

std::optional<std::string> execution_context::property(std::string_view key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto                        it = properties_.find(key);
    if (it == properties_.end())
        return std::nullopt;
    return it->second;
}

void execution_context::write_line(std::string_view line) {
    std::lock_guard<std::mutex> lk(mtx_);
    lines_.emplace_back(line);
}

std::vector<std::string> execution_context::lines() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lines_;
}

} // namespace scopefix
