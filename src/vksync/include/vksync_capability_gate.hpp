#ifndef VKSYNC_CAPABILITY_GATE_INCLUDED
#define VKSYNC_CAPABILITY_GATE_INCLUDED

#include <vksync_external_handle_type.hpp>
#include <vksync_primitive_error.hpp>

#include <expected>

namespace vksync
{
    struct capability_table_t;
    struct device_t;
} // namespace vksync

namespace vksync
{
    // Decides whether a primitive of the given kind can be created
    // exportable to every requested handle type. Performs no native calls.
    //
    // Checked in order: instance properties2 capability, instance external
    // capabilities, device external extension, per type export support and
    // finally pairwise compatibility of every unordered pair. The first
    // failing check is reported.
    [[nodiscard]] std::expected<void, capability_failure_t> check_exportable(
        capability_table_t const& capabilities,
        primitive_kind_t kind,
        external_handle_types_t const& handle_types);

    [[nodiscard]] std::expected<void, capability_failure_t> check_exportable(
        device_t const& device,
        primitive_kind_t kind,
        external_handle_types_t const& handle_types);
} // namespace vksync

#endif
