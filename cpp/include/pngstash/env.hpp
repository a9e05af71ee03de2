#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pngstash::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
// Empty when the variable is unset, not a decimal number, or zero.
std::optional<std::uint64_t> GetPositive(std::string_view name);

}  // namespace pngstash::env
