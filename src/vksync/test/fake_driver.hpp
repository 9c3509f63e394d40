#ifndef VKSYNC_TEST_FAKE_DRIVER_INCLUDED
#define VKSYNC_TEST_FAKE_DRIVER_INCLUDED

#include <vksync_capabilities.hpp>
#include <vksync_device.hpp>
#include <vksync_external_handle_type.hpp>

#include <volk.h>

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace test
{
    // Process wide stand-in for a Vulkan driver. Device level entry points of
    // devices created through it resolve to functions that mint unique fake
    // handles and record what was done with them. Constructing a
    // fake_driver_t clears the recorded state.
    class [[nodiscard]] fake_driver_t final
    {
    public:
        fake_driver_t();

        fake_driver_t(fake_driver_t const&) = delete;

        fake_driver_t(fake_driver_t&&) noexcept = delete;

    public:
        ~fake_driver_t() = default;

    public:
        // Device with a fake logical device handle and the given
        // capabilities, no instance or physical device.
        [[nodiscard]] vksync::device_ptr_t create_device(
            vksync::capability_table_t const& capabilities =
                full_capabilities()) const;

        // Next creation of kind returns result instead of a handle.
        void fail_next_create(vksync::primitive_kind_t kind,
            VkResult result) const;

        // Every reset of kind returns result until cleared with VK_SUCCESS.
        void set_reset_result(vksync::primitive_kind_t kind,
            VkResult result) const;

        void set_export_result(VkResult result) const;

        [[nodiscard]] size_t created(vksync::primitive_kind_t kind) const;

        [[nodiscard]] size_t destroyed(vksync::primitive_kind_t kind) const;

        [[nodiscard]] size_t resets(vksync::primitive_kind_t kind) const;

        // Handles created and not yet destroyed.
        [[nodiscard]] size_t live(vksync::primitive_kind_t kind) const;

        // Destroy calls for handles that weren't live.
        [[nodiscard]] size_t invalid_destroys() const;

        [[nodiscard]] size_t native_calls() const;

        [[nodiscard]] bool device_destroyed() const;

        // Handle type flags chained to the last exportable creation of kind.
        [[nodiscard]] uint32_t last_export_handle_types(
            vksync::primitive_kind_t kind) const;

        [[nodiscard]] static vksync::capability_table_t full_capabilities();

    public:
        fake_driver_t& operator=(fake_driver_t const&) = delete;

        fake_driver_t& operator=(fake_driver_t&&) noexcept = delete;
    };

    template<typename Handle>
    [[nodiscard]] uint64_t handle_value(Handle const handle)
    {
        if constexpr (std::is_pointer_v<Handle>)
        {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(handle));
        }
        else
        {
            return static_cast<uint64_t>(handle);
        }
    }

    template<typename Handle>
    [[nodiscard]] Handle make_handle(uint64_t const value)
    {
        if constexpr (std::is_pointer_v<Handle>)
        {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast,performance-no-int-to-ptr)
            return reinterpret_cast<Handle>(static_cast<uintptr_t>(value));
        }
        else
        {
            return static_cast<Handle>(value);
        }
    }
} // namespace test

#endif
