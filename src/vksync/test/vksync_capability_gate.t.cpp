#include <vksync_capability_gate.hpp>

#include <vksync_capabilities.hpp>
#include <vksync_device.hpp>
#include <vksync_external_handle_type.hpp>
#include <vksync_primitive_error.hpp>

#include <fake_driver.hpp>

#include <catch2/catch_test_macros.hpp>

#include <volk.h>

#include <expected>
#include <initializer_list>

namespace
{
    using vksync::external_handle_type_t;

    [[nodiscard]] vksync::capability_table_t semaphore_capabilities()
    {
        vksync::capability_table_t rv;
        rv.get_physical_device_properties2 = true;
        rv.semaphore.instance_capabilities = true;
        rv.semaphore.device_extension = true;
        return rv;
    }

    void make_exportable(vksync::capability_table_t& table,
        external_handle_type_t const type)
    {
        table.semaphore.properties(type).exportable = true;
    }

    // Only a lists b, not the other way around unless set separately.
    void make_compatible(vksync::capability_table_t& table,
        external_handle_type_t const a,
        external_handle_type_t const b)
    {
        table.semaphore.properties(a).compatible_handle_types.insert(b);
    }

    [[nodiscard]] vksync::capability_failure_t check_failure(
        vksync::capability_table_t const& table,
        vksync::external_handle_types_t const& types,
        vksync::primitive_kind_t const kind =
            vksync::primitive_kind_t::semaphore)
    {
        std::expected<void, vksync::capability_failure_t> const result{
            vksync::check_exportable(table, kind, types)};
        REQUIRE_FALSE(result);
        return result.error();
    }
} // namespace

TEST_CASE("Empty request passes", "[vksync][gate]")
{
    vksync::capability_table_t const table{semaphore_capabilities()};
    CHECK(vksync::check_exportable(table,
        vksync::primitive_kind_t::semaphore,
        {}));
}

TEST_CASE("Missing properties2 instance extension is reported first",
    "[vksync][gate]")
{
    vksync::capability_table_t table{semaphore_capabilities()};
    table.get_physical_device_properties2 = false;
    table.semaphore.device_extension = false;

    CHECK(check_failure(table, {external_handle_type_t::opaque_fd}) ==
        vksync::missing_instance_extension(
            VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME));
}

TEST_CASE("Missing external capabilities instance extension is reported",
    "[vksync][gate]")
{
    vksync::capability_table_t table{semaphore_capabilities()};
    table.semaphore.instance_capabilities = false;

    CHECK(check_failure(table, {external_handle_type_t::opaque_fd}) ==
        vksync::missing_instance_extension(
            VK_KHR_EXTERNAL_SEMAPHORE_CAPABILITIES_EXTENSION_NAME));
}

TEST_CASE("Missing external semaphore device extension is reported",
    "[vksync][gate]")
{
    vksync::capability_table_t table{semaphore_capabilities()};
    table.semaphore.device_extension = false;
    make_exportable(table, external_handle_type_t::opaque_fd);

    CHECK(check_failure(table, {external_handle_type_t::opaque_fd}) ==
        vksync::missing_device_extension(
            VK_KHR_EXTERNAL_SEMAPHORE_EXTENSION_NAME));
}

TEST_CASE("Fence requests check fence capabilities", "[vksync][gate]")
{
    vksync::capability_table_t table{semaphore_capabilities()};
    make_exportable(table, external_handle_type_t::opaque_fd);

    CHECK(check_failure(table,
              {external_handle_type_t::opaque_fd},
              vksync::primitive_kind_t::fence) ==
        vksync::missing_instance_extension(
            VK_KHR_EXTERNAL_FENCE_CAPABILITIES_EXTENSION_NAME));

    table.fence.instance_capabilities = true;
    CHECK(check_failure(table,
              {external_handle_type_t::opaque_fd},
              vksync::primitive_kind_t::fence) ==
        vksync::missing_device_extension(VK_KHR_EXTERNAL_FENCE_EXTENSION_NAME));

    table.fence.device_extension = true;
    table.fence.properties(external_handle_type_t::opaque_fd).exportable = true;
    CHECK(vksync::check_exportable(table,
        vksync::primitive_kind_t::fence,
        {external_handle_type_t::opaque_fd}));
}

TEST_CASE("Events are never exportable", "[vksync][gate]")
{
    vksync::capability_table_t const table{
        test::fake_driver_t::full_capabilities()};

    CHECK(check_failure(table,
              {external_handle_type_t::opaque_fd},
              vksync::primitive_kind_t::event) ==
        vksync::handle_type_not_supported(external_handle_type_t::opaque_fd));
}

TEST_CASE("Handle type without export support is reported", "[vksync][gate]")
{
    vksync::capability_table_t table{semaphore_capabilities()};
    make_exportable(table, external_handle_type_t::opaque_fd);
    make_compatible(table,
        external_handle_type_t::opaque_fd,
        external_handle_type_t::sync_fd);
    make_compatible(table,
        external_handle_type_t::sync_fd,
        external_handle_type_t::opaque_fd);

    // Import support alone isn't enough.
    table.semaphore.properties(external_handle_type_t::sync_fd).importable =
        true;

    CHECK(check_failure(table,
              {external_handle_type_t::opaque_fd,
                  external_handle_type_t::sync_fd}) ==
        vksync::handle_type_not_supported(external_handle_type_t::sync_fd));
}

TEST_CASE("Single handle type needs no compatibility", "[vksync][gate]")
{
    vksync::capability_table_t table{semaphore_capabilities()};
    make_exportable(table, external_handle_type_t::opaque_fd);

    CHECK(vksync::check_exportable(table,
        vksync::primitive_kind_t::semaphore,
        {external_handle_type_t::opaque_fd}));
}

TEST_CASE("Incompatible pair is reported in enumeration order",
    "[vksync][gate]")
{
    vksync::capability_table_t table{semaphore_capabilities()};
    make_exportable(table, external_handle_type_t::opaque_fd);
    make_exportable(table, external_handle_type_t::d3d12_fence);

    // d3d12_fence lists opaque_fd, but not the other way around.
    make_compatible(table,
        external_handle_type_t::d3d12_fence,
        external_handle_type_t::opaque_fd);

    CHECK(check_failure(table,
              {external_handle_type_t::d3d12_fence,
                  external_handle_type_t::opaque_fd}) ==
        vksync::incompatible_handle_types(external_handle_type_t::opaque_fd,
            external_handle_type_t::d3d12_fence));
}

TEST_CASE("Compatibility is checked for every pair", "[vksync][gate]")
{
    using enum external_handle_type_t;

    vksync::capability_table_t table{semaphore_capabilities()};
    for (external_handle_type_t const type : {opaque_fd, opaque_win32, sync_fd})
    {
        make_exportable(table, type);
    }

    auto const link = [&table](external_handle_type_t const a,
                          external_handle_type_t const b)
    {
        make_compatible(table, a, b);
        make_compatible(table, b, a);
    };

    link(opaque_fd, opaque_win32);
    link(opaque_win32, sync_fd);

    // opaque_fd and sync_fd are both compatible with opaque_win32, but not
    // with each other.
    CHECK(check_failure(table, {opaque_fd, opaque_win32, sync_fd}) ==
        vksync::incompatible_handle_types(opaque_fd, sync_fd));

    link(opaque_fd, sync_fd);
    CHECK(vksync::check_exportable(table,
        vksync::primitive_kind_t::semaphore,
        {opaque_fd, opaque_win32, sync_fd}));
}

TEST_CASE("Gate is pure", "[vksync][gate]")
{
    test::fake_driver_t const driver;

    vksync::capability_table_t table{semaphore_capabilities()};
    make_exportable(table, external_handle_type_t::opaque_fd);
    make_exportable(table, external_handle_type_t::d3d12_fence);

    vksync::device_ptr_t const device{driver.create_device(table)};

    vksync::external_handle_types_t const types{
        external_handle_type_t::opaque_fd,
        external_handle_type_t::d3d12_fence};

    std::expected<void, vksync::capability_failure_t> const first{
        vksync::check_exportable(*device,
            vksync::primitive_kind_t::semaphore,
            types)};
    std::expected<void, vksync::capability_failure_t> const second{
        vksync::check_exportable(*device,
            vksync::primitive_kind_t::semaphore,
            types)};

    CHECK(first == second);
    CHECK(driver.native_calls() == 0);
    CHECK_FALSE(device->capabilities.semaphore
            .properties(external_handle_type_t::opaque_fd)
            .compatible_handle_types.contains(
                external_handle_type_t::d3d12_fence));
}
