/*!
 * \file enum_cache.hpp
 * \brief Process-wide, lazily built descriptor per enumeration type
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_CACHE_HPP
#define ENUMKIT_META_ENUM_CACHE_HPP

#include <atomic>
#include <memory>

#include <spdlog/spdlog.h>

#include "enumkit/meta/enum_descriptor.hpp"
#include "enumkit/meta/enum_traits.hpp"

namespace enumkit::meta {

/**
 * @brief Holds the descriptor of E.
 *
 * The descriptor is built from EnumTraits<E>::declare() on first use and
 * lives until the process exits. Threads racing on the first use may each
 * build one; exactly one is published and all of them get that one.
 */
template <DeclaredEnum E>
class EnumCache {
public:
    EnumCache() = delete;

    /**
     * @brief Returns the descriptor of E, building it if needed.
     *
     * @throws error::InvalidArgument If the declaration of E is malformed;
     * nothing is published then and the next call tries again.
     */
    [[nodiscard]] static auto get() -> const EnumDescriptor<E>& {
        if (const auto* descriptor = instance_.load(std::memory_order_acquire)) {
            return *descriptor;
        }

        auto built =
            std::make_unique<const EnumDescriptor<E>>(EnumTraits<E>::declare());
        const EnumDescriptor<E>* expected = nullptr;
        if (instance_.compare_exchange_strong(expected, built.get(),
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            // Published descriptors are never destroyed
            return *built.release();
        }
        spdlog::debug("Discarded concurrently built descriptor for {}",
                      built->typeName());
        return *expected;
    }

    [[nodiscard]] static auto isBuilt() noexcept -> bool {
        return instance_.load(std::memory_order_acquire) != nullptr;
    }

private:
    static inline std::atomic<const EnumDescriptor<E>*> instance_{nullptr};
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_CACHE_HPP
