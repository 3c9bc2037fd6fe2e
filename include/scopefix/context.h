#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scopefix {

// Value handed to a scope's setup routine. The coordinator only forwards it;
// routines use it to read run properties and to leave log lines behind for
// the reporter.
class execution_context {
  public:
    execution_context() = default;
    explicit execution_context(std::string scope_name) : scope_name_(std::move(scope_name)) {}

    execution_context(const execution_context &)            = delete;
    execution_context &operator=(const execution_context &) = delete;

    const std::string &scope_name() const { return scope_name_; }

    void                       set_property(std::string key, std::string value);
    std::optional<std::string> property(std::string_view key) const;

    // Thread-safe; routines may log from helper threads.
    void                     write_line(std::string_view line);
    std::vector<std::string> lines() const;

  private:
    std::string                                     scope_name_;
    mutable std::mutex                              mtx_;
    std::map<std::string, std::string, std::less<>> properties_;
    std::vector<std::string>                        lines_;
};

} // namespace scopefix
