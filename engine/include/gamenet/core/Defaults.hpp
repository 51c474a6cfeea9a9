#pragma once
#include <cstddef>
#include <cstdint>

namespace gamenet::core::defaults
{

// ===== Wire protocol =====
inline constexpr std::uint16_t kProtocolId = 0x0a55;
inline constexpr std::uint16_t kProtocolVersion = 0x0001;

// ===== Chunk storage =====
inline constexpr std::size_t kChunkSize = 8192;
inline constexpr std::size_t kMaxFrameSize = 4096; // header + ciphertext + tag, <= kChunkSize

// ===== Per-channel back-pressure =====
inline constexpr std::size_t kMaxIngressBytes = 64 * 1024;
inline constexpr std::size_t kMaxEgressBytes = 512 * 1024;

// ===== Lifecycle timers =====
inline constexpr std::uint32_t kHandshakeTimeoutMs = 5'000;
inline constexpr std::uint32_t kIdleTimeoutMs = 30'000;
inline constexpr std::uint32_t kKeepaliveIntervalMs = 3'000;
inline constexpr std::uint32_t kHousekeepingIntervalMs = 3'000;

// ===== Poller / listener =====
inline constexpr int kMaxPollEvents = 256;
inline constexpr int kListenBacklog = 128;

// ===== Server loop =====
inline constexpr std::uint32_t kTickRateHz = 30;

} // namespace gamenet::core::defaults
