#ifndef VKSYNC_PRIMITIVE_POOL_INCLUDED
#define VKSYNC_PRIMITIVE_POOL_INCLUDED

#include <cassert>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace vksync
{
    // Free list of released native handles of one kind. Doesn't create or
    // destroy native objects, the owning device destroys whatever is left in
    // the pool on teardown. Reuse order is unspecified.
    template<typename Handle>
    class [[nodiscard]] primitive_pool_t final
    {
    public:
        primitive_pool_t() = default;

        primitive_pool_t(primitive_pool_t const&) = delete;

        primitive_pool_t(primitive_pool_t&&) noexcept = delete;

    public:
        ~primitive_pool_t();

    public:
        [[nodiscard]] std::optional<Handle> take();

        void give(Handle handle);

        [[nodiscard]] size_t size() const;

        [[nodiscard]] bool empty() const;

        // Hands every pooled handle to the caller, leaving the pool empty.
        [[nodiscard]] std::vector<Handle> drain();

    public:
        primitive_pool_t& operator=(primitive_pool_t const&) = delete;

        primitive_pool_t& operator=(primitive_pool_t&&) noexcept = delete;

    private:
        mutable std::mutex mtx_;
        std::vector<Handle> pool_;
    };

    template<typename Handle>
    primitive_pool_t<Handle>::~primitive_pool_t()
    {
        // Pooled handles would leak, the device drains before destroying.
        assert(pool_.empty());
    }

    template<typename Handle>
    std::optional<Handle> primitive_pool_t<Handle>::take()
    {
        std::lock_guard const lock{mtx_};
        if (pool_.empty())
        {
            return std::nullopt;
        }

        Handle const rv{pool_.back()};
        pool_.pop_back();
        return rv;
    }

    template<typename Handle>
    void primitive_pool_t<Handle>::give(Handle const handle)
    {
        assert(handle != Handle{});

        std::lock_guard const lock{mtx_};
        pool_.push_back(handle);
    }

    template<typename Handle>
    size_t primitive_pool_t<Handle>::size() const
    {
        std::lock_guard const lock{mtx_};
        return pool_.size();
    }

    template<typename Handle>
    bool primitive_pool_t<Handle>::empty() const
    {
        std::lock_guard const lock{mtx_};
        return pool_.empty();
    }

    template<typename Handle>
    std::vector<Handle> primitive_pool_t<Handle>::drain()
    {
        std::vector<Handle> rv;

        std::lock_guard const lock{mtx_};
        std::swap(rv, pool_);
        return rv;
    }
} // namespace vksync

#endif
