#pragma once
#include <string_view>
namespace chachamir {
inline constexpr std::string_view VERSION = "1.0.0";
}
