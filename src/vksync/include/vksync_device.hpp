#ifndef VKSYNC_DEVICE_INCLUDED
#define VKSYNC_DEVICE_INCLUDED

#include <vksync_capabilities.hpp>
#include <vksync_features.hpp>
#include <vksync_instance.hpp>
#include <vksync_primitive_pool.hpp>

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

#include <volk.h>

#include <cstdint>
#include <expected>
#include <functional>
#include <set>
#include <span>
#include <string>
#include <system_error>

namespace vksync
{
    // Device level entry points are called through dispatch, never through
    // the volk globals, so several devices can coexist.
    struct [[nodiscard]] device_t final
        : public boost::intrusive_ref_counter<device_t>
    {
        instance_ptr_t instance;

        VkPhysicalDevice physical_device{VK_NULL_HANDLE};
        VkDevice logical_device{VK_NULL_HANDLE};

        uint32_t api_version{VK_API_VERSION_1_0};

        std::set<std::string, std::less<>> extensions;

        VolkDeviceTable dispatch{};

        capability_table_t capabilities;

        primitive_pool_t<VkSemaphore> semaphore_pool;
        primitive_pool_t<VkFence> fence_pool;
        primitive_pool_t<VkEvent> event_pool;

    public:
        device_t() = default;

        device_t(device_t const&) = delete;

        device_t(device_t&&) noexcept = delete;

    public:
        ~device_t();

    public:
        [[nodiscard]] operator VkPhysicalDevice() const noexcept;

        [[nodiscard]] operator VkDevice() const noexcept;

        device_t& operator=(device_t const&) = delete;

        device_t& operator=(device_t&&) noexcept = delete;
    };

    using device_ptr_t = boost::intrusive_ptr<device_t>;

    inline device_t::operator VkDevice() const noexcept
    {
        return logical_device;
    }

    inline device_t::operator VkPhysicalDevice() const noexcept
    {
        return physical_device;
    }

    [[nodiscard]] bool is_device_extension_enabled(char const* extension_name,
        device_t const& device);

    // External semaphore and fence extensions are enabled in addition to the
    // requested ones when the physical device offers them.
    [[nodiscard]] std::expected<device_ptr_t, std::error_code> create_device(
        instance_ptr_t const& instance,
        std::span<char const* const> const& extensions,
        physical_device_features_t const& features,
        std::span<queue_family_t const> const& queue_families);
} // namespace vksync

#endif
