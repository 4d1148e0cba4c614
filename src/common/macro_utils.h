#pragma once

namespace retrier {

#define RETRIER_DISALLOW_COPY(ClassName) \
    ClassName(const ClassName&) = delete; \
    ClassName& operator=(const ClassName&) = delete

#define RETRIER_DISALLOW_MOVE(ClassName) \
    ClassName(ClassName&&) = delete; \
    ClassName& operator=(ClassName&&) = delete

#define RETRIER_DISALLOW_COPY_AND_MOVE(ClassName) \
    RETRIER_DISALLOW_COPY(ClassName); \
    RETRIER_DISALLOW_MOVE(ClassName)

} // namespace retrier
