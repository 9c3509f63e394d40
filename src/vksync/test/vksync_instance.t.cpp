#include <vksync_instance.hpp>

#include <vksync_features.hpp>

#include <global_library_handle.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_contains.hpp>

#include <volk.h>

#include <algorithm>
#include <array>
#include <expected>
#include <string_view>
#include <system_error>
#include <vector>

// IWYU pragma: no_include <boost/smart_ptr/intrusive_ptr.hpp>
// IWYU pragma: no_include <boost/smart_ptr/intrusive_ref_counter.hpp>
// IWYU pragma: no_include <catch2/matchers/catch_matchers.hpp>
// IWYU pragma: no_include <span>

TEST_CASE("External capability extensions are enabled when available",
    "[vksync][instance]")
{
    if (!test::instance)
    {
        SKIP("Vulkan isn't available");
    }

    static constexpr std::array extensions{
        VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME,
        VK_KHR_EXTERNAL_SEMAPHORE_CAPABILITIES_EXTENSION_NAME,
        VK_KHR_EXTERNAL_FENCE_CAPABILITIES_EXTENSION_NAME,
    };

    for (char const* const extension : extensions)
    {
        if (vksync::is_instance_extension_available(extension))
        {
            CHECK(vksync::is_instance_extension_enabled(extension,
                *test::instance));
        }
    }
}

TEST_CASE("Optional instance extension is added when available",
    "[vksync][instance]")
{
    if (!test::library)
    {
        SKIP("Vulkan isn't available");
    }

    static constexpr auto extension{VK_KHR_SURFACE_EXTENSION_NAME};

    if (!vksync::is_instance_extension_available(extension))
    {
        SKIP(VK_KHR_SURFACE_EXTENSION_NAME " isn't supported");
    }

    static constexpr auto extensions{std::to_array<char const*>({extension})};
    std::expected<vksync::instance_ptr_t, std::error_code> instance_result{
        vksync::create_instance({.optional_extensions = extensions})};
    REQUIRE(instance_result);

    auto const& instance{*instance_result};
    CHECK_THAT(instance->extensions, Catch::Matchers::Contains(extension));
}

TEST_CASE("Unavailable optional instance extension is skipped",
    "[vksync][instance]")
{
    if (!test::library)
    {
        SKIP("Vulkan isn't available");
    }

    static constexpr auto extensions{
        std::to_array<char const*>({"VK_VKSYNC_not_an_extension"})};
    std::expected<vksync::instance_ptr_t, std::error_code> instance_result{
        vksync::create_instance({.optional_extensions = extensions})};
    REQUIRE(instance_result);

    auto const& instance{*instance_result};
    CHECK_FALSE(vksync::is_instance_extension_enabled(extensions[0],
        *instance));
}

TEST_CASE("Enabled layers are recorded", "[vksync][instance]")
{
    if (!test::library)
    {
        SKIP("Vulkan isn't available");
    }

    static constexpr auto layer{"VK_LAYER_KHRONOS_validation"};

    std::vector<VkLayerProperties> const layers{
        vksync::query_instance_layers()};
    if (!std::ranges::contains(layers,
            std::string_view{layer},
            &VkLayerProperties::layerName))
    {
        SKIP("Validation layer isn't installed");
    }

    static constexpr auto requested{std::to_array<char const*>({layer})};
    std::expected<vksync::instance_ptr_t, std::error_code> instance_result{
        vksync::create_instance({.layers = requested})};
    REQUIRE(instance_result);

    auto const& instance{*instance_result};
    CHECK_THAT(instance->layers, Catch::Matchers::Contains(layer));
}
