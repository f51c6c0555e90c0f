#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "etfcast/cast/shape.hpp"
#include "etfcast/core/errors.hpp"
#include "etfcast/core/types.hpp"

namespace etfcast::cast {

    // One layer of owning indirection per specialisation. The primary template
    // is the leaf itself.
    template <typename T>
    struct Indirection {
        using leaf_type = T;
        static constexpr u32 depth = 0;

        static leaf_type& materialize(T& slot) noexcept { return slot; }
        static const leaf_type* peek(const T& slot) noexcept { return &slot; }
    };

    template <typename U>
    struct Indirection<std::unique_ptr<U>> {
        using leaf_type = typename Indirection<U>::leaf_type;
        static constexpr u32 depth = Indirection<U>::depth + 1;

        static leaf_type& materialize(std::unique_ptr<U>& slot) {
            slot = std::make_unique<U>();
            return Indirection<U>::materialize(*slot);
        }
        static const leaf_type* peek(const std::unique_ptr<U>& slot) noexcept {
            return slot ? Indirection<U>::peek(*slot) : nullptr;
        }
        static void reset(std::unique_ptr<U>& slot) noexcept { slot.reset(); }
    };

    template <typename U>
    struct Indirection<std::shared_ptr<U>> {
        using leaf_type = typename Indirection<U>::leaf_type;
        static constexpr u32 depth = Indirection<U>::depth + 1;

        static leaf_type& materialize(std::shared_ptr<U>& slot) {
            slot = std::make_shared<U>();
            return Indirection<U>::materialize(*slot);
        }
        static const leaf_type* peek(const std::shared_ptr<U>& slot) noexcept {
            return slot ? Indirection<U>::peek(*slot) : nullptr;
        }
        static void reset(std::shared_ptr<U>& slot) noexcept { slot.reset(); }
    };

    template <typename U>
    struct Indirection<std::optional<U>> {
        using leaf_type = typename Indirection<U>::leaf_type;
        static constexpr u32 depth = Indirection<U>::depth + 1;

        static leaf_type& materialize(std::optional<U>& slot) {
            slot.emplace();
            return Indirection<U>::materialize(*slot);
        }
        static const leaf_type* peek(const std::optional<U>& slot) noexcept {
            return slot ? Indirection<U>::peek(*slot) : nullptr;
        }
        static void reset(std::optional<U>& slot) noexcept { slot.reset(); }
    };

    // A place to write a decoded value: `slot` followed by `depth` layers of
    // indirection down to leaf_type. Lives only for one cast.
    template <typename T>
    class PointerTarget {
    public:
        using leaf_type = typename Indirection<T>::leaf_type;
        static constexpr u32 kDepth = Indirection<T>::depth;

        explicit PointerTarget(T* slot) noexcept : slot_(slot) {}

        [[nodiscard]] static constexpr TargetShape leaf_shape() noexcept { return shape_of<leaf_type>(); }
        [[nodiscard]] static constexpr u32 depth() noexcept { return kDepth; }

        // Allocates a fresh node at every layer, then writes the leaf.
        template <typename V>
        void assign(V&& value) {
            Indirection<T>::materialize(*slot_) = std::forward<V>(value);
        }

        // Resets the outermost layer. A bare value has no absent state.
        [[nodiscard]] core::Status clear_to_absent() noexcept {
            if constexpr (kDepth == 0) {
                return core::make_status(core::StatusDomain::Cast, core::StatusCode::NotWritable);
            } else {
                Indirection<T>::reset(*slot_);
                return core::ok_status();
            }
        }

        // The current leaf if every layer is set, without allocating.
        [[nodiscard]] const leaf_type* existing_leaf() const noexcept { return Indirection<T>::peek(*slot_); }

    private:
        T* slot_;
    };

} // namespace etfcast::cast
