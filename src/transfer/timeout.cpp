#include "timeout.hpp"
#include <core/constants.hpp>
#include <algorithm>

int estimate_timeout(int64_t filesize_bytes) {
    int64_t size = std::max<int64_t>(filesize_bytes, 0);
    int64_t timeout = TRANSFER_TIMEOUT_MIN_SECS + size / TRANSFER_BYTES_PER_SEC;
    timeout = std::min<int64_t>(timeout, TRANSFER_TIMEOUT_MAX_SECS);
    return static_cast<int>(std::max<int64_t>(timeout, TRANSFER_TIMEOUT_MIN_SECS));
}
