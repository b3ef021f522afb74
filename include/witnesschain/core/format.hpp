#pragma once
#include <fmt/core.h>
namespace witnesschain::compat {
using fmt::format;
}
