#ifndef TETHER_CORE_CONFIG_H
#define TETHER_CORE_CONFIG_H

#include <chrono>
#include <cstddef>

namespace tether::core::config {

inline constexpr std::size_t kDefaultQueueCapacity = 4096;
inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{30000};
inline constexpr std::size_t kMaxRetainedDiagnostics = 1024;

// Query keys reserved by the bridge protocol.
inline constexpr const char kReturnIdKey[] = "return-id";
inline constexpr const char kReplyKey[] = "reply";
inline constexpr const char kSyncReplyValue[] = "sync";
inline constexpr const char kPageIdKey[] = "page-id";

}  // namespace tether::core::config

#endif  // TETHER_CORE_CONFIG_H
