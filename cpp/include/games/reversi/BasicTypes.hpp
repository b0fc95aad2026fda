#pragma once

#include <cstdint>

namespace reversi {
using row_t = int8_t;
using column_t = int8_t;
using score_t = int32_t;
}  // namespace reversi
