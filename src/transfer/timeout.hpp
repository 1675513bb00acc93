#pragma once

#include <cstdint>

// Wall-clock budget in seconds for copying a file of the given size:
// 300 s floor, 3 h ceiling, ~0.5 MB/s assumed in between.
int estimate_timeout(int64_t filesize_bytes);
