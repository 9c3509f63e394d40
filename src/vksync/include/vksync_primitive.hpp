#ifndef VKSYNC_PRIMITIVE_INCLUDED
#define VKSYNC_PRIMITIVE_INCLUDED

#include <vksync_capabilities.hpp>
#include <vksync_capability_gate.hpp>
#include <vksync_device.hpp>
#include <vksync_error_code.hpp>
#include <vksync_external_handle_type.hpp>
#include <vksync_primitive_error.hpp>
#include <vksync_primitive_pool.hpp>

#include <boost/scope/defer.hpp>

#include <spdlog/spdlog.h>

#include <volk.h>

#include <concepts>
#include <expected>
#include <optional>
#include <source_location>
#include <system_error>
#include <utility>

// IWYU pragma: no_include <fmt/base.h>
// IWYU pragma: no_include <spdlog/common.h>

namespace vksync
{
    // Either a shared owner of the device (device_ptr_t) or a borrowed
    // pointer (device_t*) for callers that guarantee the device outlives the
    // primitive.
    template<typename T>
    concept device_reference = std::movable<T> && std::default_initializable<T> &&
        requires(T const& ref) {
            { *ref } -> std::same_as<device_t&>;
            static_cast<bool>(ref);
        };

    template<primitive_kind_t Kind>
    struct primitive_traits_t;

    template<>
    struct [[nodiscard]] primitive_traits_t<primitive_kind_t::semaphore> final
    {
        using handle_type = VkSemaphore;

        static constexpr bool exportable{true};

        [[nodiscard]] static VkResult create(device_t const& device,
            VkSemaphore& handle);

        [[nodiscard]] static VkResult create_exportable(device_t const& device,
            external_handle_types_t const& handle_types,
            VkSemaphore& handle);

        static void destroy(device_t const& device, VkSemaphore handle) noexcept;

        // Binary semaphores carry no host visible state to reset.
        [[nodiscard]] static VkResult reset(device_t const& device,
            VkSemaphore handle) noexcept;

        [[nodiscard]] static VkResult export_fd(device_t const& device,
            VkSemaphore handle,
            external_handle_type_t handle_type,
            int& fd);

        [[nodiscard]] static primitive_pool_t<VkSemaphore>& pool(
            device_t& device) noexcept;
    };

    template<>
    struct [[nodiscard]] primitive_traits_t<primitive_kind_t::fence> final
    {
        using handle_type = VkFence;

        static constexpr bool exportable{true};

        [[nodiscard]] static VkResult create(device_t const& device,
            VkFence& handle);

        [[nodiscard]] static VkResult create_exportable(device_t const& device,
            external_handle_types_t const& handle_types,
            VkFence& handle);

        static void destroy(device_t const& device, VkFence handle) noexcept;

        // Pooled fences are always unsignaled.
        [[nodiscard]] static VkResult reset(device_t const& device,
            VkFence handle) noexcept;

        [[nodiscard]] static VkResult export_fd(device_t const& device,
            VkFence handle,
            external_handle_type_t handle_type,
            int& fd);

        [[nodiscard]] static primitive_pool_t<VkFence>& pool(
            device_t& device) noexcept;
    };

    template<>
    struct [[nodiscard]] primitive_traits_t<primitive_kind_t::event> final
    {
        using handle_type = VkEvent;

        static constexpr bool exportable{false};

        [[nodiscard]] static VkResult create(device_t const& device,
            VkEvent& handle);

        static void destroy(device_t const& device, VkEvent handle) noexcept;

        [[nodiscard]] static VkResult reset(device_t const& device,
            VkEvent handle) noexcept;

        [[nodiscard]] static primitive_pool_t<VkEvent>& pool(
            device_t& device) noexcept;
    };

    template<primitive_kind_t Kind>
    using primitive_handle_t = typename primitive_traits_t<Kind>::handle_type;

    template<primitive_kind_t Kind>
    concept exportable_primitive = primitive_traits_t<Kind>::exportable;

    namespace detail
    {
        // Logs and translates a failed creation call, see to_oom_error.
        [[nodiscard]] oom_error_t creation_failed(primitive_kind_t kind,
            VkResult result,
            std::source_location source_location =
                std::source_location::current());

        void reset_failed(primitive_kind_t kind, VkResult result);
    } // namespace detail

    // Owns exactly one native handle. On release the handle either goes back
    // to the device pool (when it was obtained through from_pool) or is
    // destroyed, never both.
    template<primitive_kind_t Kind, device_reference DeviceRef = device_ptr_t>
    class [[nodiscard]] owned_primitive_t final
    {
    public:
        using traits_type = primitive_traits_t<Kind>;
        using handle_type = primitive_handle_t<Kind>;

        static constexpr primitive_kind_t kind{Kind};

    public:
        owned_primitive_t() = default;

        // Takes ownership of handle, which must have been created on device.
        owned_primitive_t(DeviceRef device,
            handle_type handle,
            bool pooled,
            external_handle_types_t exportable_to = {}) noexcept;

        owned_primitive_t(owned_primitive_t const&) = delete;

        owned_primitive_t(owned_primitive_t&& other) noexcept;

    public:
        ~owned_primitive_t();

    public:
        [[nodiscard]] handle_type handle() const noexcept;

        [[nodiscard]] device_t& device() const noexcept;

        [[nodiscard]] bool is_pooled() const noexcept;

        [[nodiscard]] external_handle_types_t const&
        exportable_to() const noexcept;

        // Releases the handle now, leaves the wrapper empty.
        void reset() noexcept;

    public:
        [[nodiscard]] explicit operator bool() const noexcept;

        [[nodiscard]] operator handle_type() const noexcept;

        owned_primitive_t& operator=(owned_primitive_t const&) = delete;

        owned_primitive_t& operator=(owned_primitive_t&& other) noexcept;

    private:
        DeviceRef device_{};
        handle_type handle_{VK_NULL_HANDLE};
        bool pooled_{};
        external_handle_types_t exportable_to_;
    };

    template<device_reference DeviceRef = device_ptr_t>
    using semaphore_t = owned_primitive_t<primitive_kind_t::semaphore, DeviceRef>;

    template<device_reference DeviceRef = device_ptr_t>
    using fence_t = owned_primitive_t<primitive_kind_t::fence, DeviceRef>;

    template<device_reference DeviceRef = device_ptr_t>
    using event_t = owned_primitive_t<primitive_kind_t::event, DeviceRef>;

    using borrowed_semaphore_t = semaphore_t<device_t*>;

    using borrowed_fence_t = fence_t<device_t*>;

    using borrowed_event_t = event_t<device_t*>;


    template<primitive_kind_t Kind, device_reference DeviceRef>
    owned_primitive_t<Kind, DeviceRef>::owned_primitive_t(DeviceRef device,
        handle_type const handle,
        bool const pooled,
        external_handle_types_t exportable_to) noexcept
        : device_{std::move(device)}
        , handle_{handle}
        , pooled_{pooled}
        , exportable_to_{std::move(exportable_to)}
    {
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    owned_primitive_t<Kind, DeviceRef>::owned_primitive_t(
        owned_primitive_t&& other) noexcept
        : device_{std::exchange(other.device_, DeviceRef{})}
        , handle_{std::exchange(other.handle_, VK_NULL_HANDLE)}
        , pooled_{std::exchange(other.pooled_, false)}
        , exportable_to_{std::exchange(other.exportable_to_, {})}
    {
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    owned_primitive_t<Kind, DeviceRef>::~owned_primitive_t()
    {
        reset();
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    auto owned_primitive_t<Kind, DeviceRef>::handle() const noexcept
        -> handle_type
    {
        return handle_;
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    device_t&
    owned_primitive_t<Kind, DeviceRef>::device() const noexcept
    {
        return *device_;
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    bool owned_primitive_t<Kind, DeviceRef>::is_pooled() const noexcept
    {
        return pooled_;
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    external_handle_types_t const&
    owned_primitive_t<Kind, DeviceRef>::exportable_to() const noexcept
    {
        return exportable_to_;
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    void owned_primitive_t<Kind, DeviceRef>::reset() noexcept
    {
        if (handle_ == VK_NULL_HANDLE)
        {
            return;
        }

        handle_type const handle{std::exchange(handle_, VK_NULL_HANDLE)};
        device_t& device{*device_};

        // A shared owner may be keeping the pool alive, release it last.
        boost::scope::defer_guard const release_device{[this]() noexcept
            {
                exportable_to_.clear();
                device_ = DeviceRef{};
            }};

        if (std::exchange(pooled_, false))
        {
            if (VkResult const result{traits_type::reset(device, handle)};
                result == VK_SUCCESS)
            {
                traits_type::pool(device).give(handle);
            }
            else
            {
                detail::reset_failed(Kind, result);
                traits_type::destroy(device, handle);
            }
        }
        else
        {
            traits_type::destroy(device, handle);
        }
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    owned_primitive_t<Kind, DeviceRef>::operator bool() const noexcept
    {
        return handle_ != VK_NULL_HANDLE;
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    owned_primitive_t<Kind, DeviceRef>::operator handle_type()
        const noexcept
    {
        return handle_;
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    auto owned_primitive_t<Kind, DeviceRef>::operator=(
        owned_primitive_t&& other) noexcept -> owned_primitive_t&
    {
        if (this != &other)
        {
            reset();

            device_ = std::exchange(other.device_, DeviceRef{});
            handle_ = std::exchange(other.handle_, VK_NULL_HANDLE);
            pooled_ = std::exchange(other.pooled_, false);
            exportable_to_ = std::exchange(other.exportable_to_, {});
        }

        return *this;
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    std::expected<owned_primitive_t<Kind, DeviceRef>, oom_error_t>
    allocate(DeviceRef device)
    {
        using traits_t = primitive_traits_t<Kind>;

        primitive_handle_t<Kind> handle{VK_NULL_HANDLE};
        if (VkResult const result{traits_t::create(*device, handle)};
            result != VK_SUCCESS)
        {
            return std::unexpected{detail::creation_failed(Kind, result)};
        }

        return owned_primitive_t<Kind, DeviceRef>{std::move(device),
            handle,
            false};
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    std::expected<owned_primitive_t<Kind, DeviceRef>, oom_error_t>
    from_pool(DeviceRef device)
    {
        using traits_t = primitive_traits_t<Kind>;

        if (std::optional<primitive_handle_t<Kind>> const pooled{
                traits_t::pool(*device).take()})
        {
            return owned_primitive_t<Kind, DeviceRef>{std::move(device),
                *pooled,
                true};
        }

        spdlog::debug("{} pool empty, allocating", Kind);

        primitive_handle_t<Kind> handle{VK_NULL_HANDLE};
        if (VkResult const result{traits_t::create(*device, handle)};
            result != VK_SUCCESS)
        {
            return std::unexpected{detail::creation_failed(Kind, result)};
        }

        return owned_primitive_t<Kind, DeviceRef>{std::move(device), handle, true};
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    requires exportable_primitive<Kind>
    std::expected<owned_primitive_t<Kind, DeviceRef>,
        external_primitive_error_t>
    allocate_exportable(DeviceRef device,
        external_handle_types_t handle_types)
    {
        using traits_t = primitive_traits_t<Kind>;

        if (std::expected<void, capability_failure_t> const gate{
                check_exportable(*device, Kind, handle_types)};
            !gate)
        {
            return std::unexpected{gate.error()};
        }

        primitive_handle_t<Kind> handle{VK_NULL_HANDLE};
        if (VkResult const result{
                traits_t::create_exportable(*device, handle_types, handle)};
            result != VK_SUCCESS)
        {
            return std::unexpected{detail::creation_failed(Kind, result)};
        }

        return owned_primitive_t<Kind, DeviceRef>{std::move(device),
            handle,
            false,
            std::move(handle_types)};
    }

    template<primitive_kind_t Kind, device_reference DeviceRef>
    requires exportable_primitive<Kind>
    std::expected<int, std::error_code> export_fd(
        owned_primitive_t<Kind, DeviceRef> const& primitive,
        external_handle_type_t const handle_type)
    {
        using traits_t = primitive_traits_t<Kind>;

        if (!is_fd_handle_type(handle_type) ||
            !primitive.exportable_to().contains(handle_type))
        {
            return std::unexpected{
                make_error_code(capability_error_t::handle_type_not_supported)};
        }

        device_t const& device{primitive.device()};
        if (!device.capabilities.find(Kind)->fd_extension)
        {
            return std::unexpected{
                make_error_code(capability_error_t::missing_device_extension)};
        }

        int fd{-1};
        if (VkResult const result{
                traits_t::export_fd(device, primitive.handle(), handle_type, fd)};
            result != VK_SUCCESS)
        {
            return std::unexpected{make_error_code(result)};
        }

        return fd;
    }
} // namespace vksync

#endif
