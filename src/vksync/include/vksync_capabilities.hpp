#ifndef VKSYNC_CAPABILITIES_INCLUDED
#define VKSYNC_CAPABILITIES_INCLUDED

#include <vksync_external_handle_type.hpp>

#include <volk.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <utility>

namespace vksync
{
    struct instance_t;
} // namespace vksync

namespace vksync
{
    struct [[nodiscard]] external_handle_properties_t final
    {
        bool exportable{};
        bool importable{};

        // Handle types that can be requested together with this one.
        external_handle_types_t compatible_handle_types;

        [[nodiscard]] bool supported() const noexcept
        {
            return exportable || importable;
        }
    };

    struct [[nodiscard]] external_primitive_capabilities_t final
    {
        // VK_KHR_external_{semaphore,fence}_capabilities or Vulkan 1.1
        bool instance_capabilities{};

        // VK_KHR_external_{semaphore,fence} or Vulkan 1.1
        bool device_extension{};

        // VK_KHR_external_{semaphore,fence}_fd
        bool fd_extension{};

        std::array<external_handle_properties_t,
            all_external_handle_types.size()>
            handle_types;

        [[nodiscard]] external_handle_properties_t& properties(
            external_handle_type_t type) noexcept;

        [[nodiscard]] external_handle_properties_t const& properties(
            external_handle_type_t type) const noexcept;
    };

    // Everything the exportable primitive checks need, queried once when a
    // device is created.
    struct [[nodiscard]] capability_table_t final
    {
        bool get_physical_device_properties2{};

        external_primitive_capabilities_t semaphore;
        external_primitive_capabilities_t fence;

        // nullptr for primitive kinds that can't be exported.
        [[nodiscard]] external_primitive_capabilities_t const* find(
            primitive_kind_t kind) const noexcept;
    };

    [[nodiscard]] capability_table_t query_capabilities(
        instance_t const& instance,
        VkPhysicalDevice physical_device,
        uint32_t device_api_version,
        std::set<std::string, std::less<>> const& device_extensions);
} // namespace vksync

inline vksync::external_handle_properties_t&
vksync::external_primitive_capabilities_t::properties(
    external_handle_type_t const type) noexcept
{
    return handle_types[static_cast<size_t>(std::to_underlying(type))];
}

inline vksync::external_handle_properties_t const&
vksync::external_primitive_capabilities_t::properties(
    external_handle_type_t const type) const noexcept
{
    return handle_types[static_cast<size_t>(std::to_underlying(type))];
}

inline vksync::external_primitive_capabilities_t const*
vksync::capability_table_t::find(primitive_kind_t const kind) const noexcept
{
    switch (kind)
    {
    case primitive_kind_t::semaphore:
        return &semaphore;
    case primitive_kind_t::fence:
        return &fence;
    case primitive_kind_t::event:
        return nullptr;
    }

    return nullptr;
}

#endif
