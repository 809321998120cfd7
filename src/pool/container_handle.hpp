/**
 * @file container_handle.hpp
 * @brief Vocabulary types shared by the container pool and its callers.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace sandbox_orchestrator {

/**
 * @brief One sandbox container as tracked by the pool.
 *
 * A handle is a value; the pool's registry is the source of truth for
 * who currently owns the container it names.
 */
struct ContainerHandle {
    ContainerId id;
    std::string name;
    ContainerState state = ContainerState::Creating;
    Timestamp last_borrowed{};
    bool ephemeral = false;
};

/// Checked out of the pool's idle queue.
struct Pooled {
    ContainerHandle handle;
};

/// Created outside capacity accounting because the pool was exhausted.
struct Ephemeral {
    ContainerHandle handle;
};

using Acquired = std::variant<Pooled, Ephemeral>;

[[nodiscard]] inline const ContainerHandle& handle_of(const Acquired& acquired) noexcept {
    return std::visit([](const auto& a) -> const ContainerHandle& { return a.handle; }, acquired);
}

[[nodiscard]] inline bool is_ephemeral(const Acquired& acquired) noexcept {
    return std::holds_alternative<Ephemeral>(acquired);
}

enum class ReleaseMode : uint8_t {
    Normal,
    Tainted        ///< After timeout, cancellation or a failed install
};

/**
 * @brief Point-in-time pool counters.
 */
struct PoolStats {
    size_t available = 0;
    size_t in_use = 0;
    size_t capacity = 0;
    size_t ephemeral_in_use = 0;
    uint64_t total_acquired = 0;
    uint64_t total_released = 0;
    uint64_t total_destroyed = 0;
    uint64_t total_ephemeral = 0;
};

}  // namespace sandbox_orchestrator
