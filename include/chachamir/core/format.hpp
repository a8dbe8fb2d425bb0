#pragma once

#include <fmt/core.h>

namespace chachamir::compat {
    using fmt::format;
}
