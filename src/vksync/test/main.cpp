#include <catch2/catch_config.hpp>
#include <catch2/catch_session.hpp>

#include <global_library_handle.hpp>

#include <vksync_device.hpp>
#include <vksync_features.hpp>
#include <vksync_instance.hpp>
#include <vksync_library_handle.hpp>

#include <spdlog/spdlog.h>

#include <volk.h>

#include <expected>
#include <optional>
#include <span>
#include <system_error>

// IWYU pragma: no_include <boost/smart_ptr/intrusive_ref_counter.hpp>
// IWYU pragma: no_include <fmt/base.h>
// IWYU pragma: no_include <string>
// IWYU pragma: no_include <vector>

namespace test
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
    vksync::library_handle_ptr_t library;
    vksync::instance_ptr_t instance;
    vksync::device_ptr_t minimal_device;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)
} // namespace test

namespace
{
    void initialize_vulkan()
    {
        if (std::expected<vksync::library_handle_ptr_t, std::error_code> lh{
                vksync::initialize()})
        {
            test::library = *lh;
        }
        else
        {
            spdlog::warn("Vulkan can't be initialized ({}): {}",
                lh.error().value(),
                lh.error().message());
            return;
        }

        if (std::expected<vksync::instance_ptr_t, std::error_code> in{
                vksync::create_instance({})})
        {
            test::instance = *in;
        }
        else
        {
            spdlog::warn("Vulkan instance can't be initialized ({}): {}",
                in.error().value(),
                in.error().message());
            return;
        }

        std::optional<vksync::physical_device_features_t> const pd{
            pick_best_physical_device(*test::instance, {})};
        if (!pd)
        {
            spdlog::warn("Physical Vulkan device can't be selected");
            return;
        }

        if (pd->queue_families.empty())
        {
            spdlog::warn("Physical Vulkan device has no queue families");
            return;
        }

        if (std::expected<vksync::device_ptr_t, std::error_code> ld{
                create_device(test::instance,
                    {},
                    *pd,
                    std::span{pd->queue_families}.first(1))})
        {
            test::minimal_device = *ld;
        }
        else
        {
            spdlog::warn("Minimal Vulkan device can't be initialized ({}): {}",
                ld.error().value(),
                ld.error().message());
        }
    }
} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char* argv[])
{
    initialize_vulkan();

    Catch::ConfigData const config{.allowZeroTests = true};
    Catch::Session session;
    session.useConfigData(config);

    int const rv{session.run(argc, argv)};

    test::minimal_device.reset();
    test::instance.reset();
    test::library.reset();

    return rv;
}
