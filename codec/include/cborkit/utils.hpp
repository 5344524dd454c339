#ifndef CBORKIT_CODEC_UTILS_HPP_
#define CBORKIT_CODEC_UTILS_HPP_

#define CBORKIT_UNLIKELY(x) __builtin_expect(!!(x), 0)

#include <cborkit/codec/export.h>

#include <spdlog/spdlog.h>

#include <memory>

namespace cborkit
{

CBORKIT_CODEC_EXPORT std::shared_ptr<spdlog::logger> logger();

}  // namespace cborkit

#endif  // CBORKIT_CODEC_UTILS_HPP_
