#pragma once

// topology_store.hpp - where projects, devices, facts and links live
// the core only talks to this interface; durability is somebody else's problem

#include "common.hpp"
#include "device_facts.hpp"
#include "link_validator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netval
{

    // ============================================================================
    // records
    // ============================================================================

    struct project_record
    {
        std::string id{};
        std::string name{};
        std::string description{};
    };

    struct device_spec
    {
        std::string hostname{};
        std::string role{};
        std::optional<std::string> vendor{};    // store default when unset
        std::optional<std::string> platform{};  // store default when unset
        std::optional<std::string> management_address{};
    };

    struct device_record
    {
        std::string id{};
        std::string project_id{};
        std::string hostname{};
        std::string role{};
        std::string vendor{};
        std::string platform{};
        std::optional<std::string> management_address{};
        std::optional<std::string> config_hash{};
        std::vector<interface_facts> interfaces{};
        std::vector<vlan_facts> vlans{};
    };

    struct config_snapshot
    {
        std::string id{};
        std::string device_id{};
        std::string content{};
        std::uint64_t sequence{0};  // monotonically increasing per store
    };

    struct link_spec
    {
        std::string source_device_id{};
        std::string source_interface{};
        std::string target_device_id{};
        std::string target_interface{};
        std::string medium{constants::default_medium};
        vlan_set vlan_allow_list{};
    };

    struct link_record
    {
        std::string id{};
        std::string project_id{};
        std::string source_device_id{};
        std::string source_interface{};
        std::string target_device_id{};
        std::string target_interface{};
        std::string medium{constants::default_medium};
        vlan_set vlan_allow_list{};
        link_state state{link_state::pending};

        [[nodiscard]] auto touches(std::string_view const device_id) const noexcept -> bool
        {
            return source_device_id == device_id || target_device_id == device_id;
        }
    };

    // ============================================================================
    // persistence contract
    // ============================================================================

    class topology_store
    {
    public:
        topology_store() = default;
        virtual ~topology_store() = default;

        topology_store(topology_store const &) = delete;
        auto operator=(topology_store const &) -> topology_store & = delete;

        // projects
        [[nodiscard]] virtual auto create_project(std::string name, std::string description)
            -> result<project_record> = 0;
        [[nodiscard]] virtual auto find_project(std::string_view project_id) const -> result<project_record> = 0;
        [[nodiscard]] virtual auto remove_project(std::string_view project_id) -> void_result = 0;

        // devices
        [[nodiscard]] virtual auto add_device(std::string_view project_id, device_spec const &spec)
            -> result<device_record> = 0;
        [[nodiscard]] virtual auto find_device(std::string_view device_id) const -> result<device_record> = 0;
        [[nodiscard]] virtual auto list_devices(std::string_view project_id) const
            -> result<std::vector<device_record>> = 0;
        [[nodiscard]] virtual auto remove_device(std::string_view device_id) -> void_result = 0;

        // links
        [[nodiscard]] virtual auto add_link(std::string_view project_id, link_spec const &spec)
            -> result<link_record> = 0;
        [[nodiscard]] virtual auto find_link(std::string_view link_id) const -> result<link_record> = 0;
        [[nodiscard]] virtual auto list_links(std::string_view project_id) const
            -> result<std::vector<link_record>> = 0;
        [[nodiscard]] virtual auto remove_link(std::string_view link_id) -> void_result = 0;

        // raw configuration history
        [[nodiscard]] virtual auto save_config(std::string_view device_id, std::string content)
            -> result<config_snapshot> = 0;
        [[nodiscard]] virtual auto latest_config(std::string_view device_id) const -> result<config_snapshot> = 0;

        // extraction results: everything previously stored for the device is superseded
        [[nodiscard]] virtual auto replace_device_facts(std::string_view device_id, device_facts const &facts)
            -> void_result = 0;

        // nothing when either the device or the interface is unknown
        [[nodiscard]] virtual auto resolve_interface(std::string_view device_id, std::string_view name) const
            -> std::optional<interface_facts> = 0;

        [[nodiscard]] virtual auto set_link_state(std::string_view link_id, link_state state) -> void_result = 0;

        // links whose source or target is the device, in creation order
        [[nodiscard]] virtual auto links_touching(std::string_view device_id) const -> std::vector<std::string> = 0;
    };

    // 64-bit FNV-1a of the content as 16 hex digits; only equality matters
    [[nodiscard]] auto content_fingerprint(std::string_view content) noexcept -> std::string;

} // namespace netval
