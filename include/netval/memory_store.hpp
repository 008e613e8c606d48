#pragma once

// memory_store.hpp - in-process topology_store
// one shared_mutex, readers in parallel, writers one at a time

#include "settings.hpp"
#include "topology_store.hpp"

#include <map>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

namespace netval
{

    class memory_store final : public topology_store
    {
    private:
        settings settings_{};

        mutable std::shared_mutex mutex_{};
        std::map<std::string, project_record, std::less<>> projects_{};
        std::map<std::string, device_record, std::less<>> devices_{};
        std::vector<link_record> links_{};  // creation order
        std::map<std::string, std::vector<config_snapshot>, std::less<>> configs_{};
        std::uint64_t next_sequence_{1};
        std::mt19937_64 id_engine_;

    public:
        explicit memory_store(settings cfg = {});

        [[nodiscard]] auto create_project(std::string name, std::string description)
            -> result<project_record> override;
        [[nodiscard]] auto find_project(std::string_view project_id) const -> result<project_record> override;
        [[nodiscard]] auto remove_project(std::string_view project_id) -> void_result override;

        [[nodiscard]] auto add_device(std::string_view project_id, device_spec const &spec)
            -> result<device_record> override;
        [[nodiscard]] auto find_device(std::string_view device_id) const -> result<device_record> override;
        [[nodiscard]] auto list_devices(std::string_view project_id) const
            -> result<std::vector<device_record>> override;
        [[nodiscard]] auto remove_device(std::string_view device_id) -> void_result override;

        [[nodiscard]] auto add_link(std::string_view project_id, link_spec const &spec)
            -> result<link_record> override;
        [[nodiscard]] auto find_link(std::string_view link_id) const -> result<link_record> override;
        [[nodiscard]] auto list_links(std::string_view project_id) const
            -> result<std::vector<link_record>> override;
        [[nodiscard]] auto remove_link(std::string_view link_id) -> void_result override;

        [[nodiscard]] auto save_config(std::string_view device_id, std::string content)
            -> result<config_snapshot> override;
        [[nodiscard]] auto latest_config(std::string_view device_id) const -> result<config_snapshot> override;

        [[nodiscard]] auto replace_device_facts(std::string_view device_id, device_facts const &facts)
            -> void_result override;
        [[nodiscard]] auto resolve_interface(std::string_view device_id, std::string_view name) const
            -> std::optional<interface_facts> override;

        [[nodiscard]] auto set_link_state(std::string_view link_id, link_state state) -> void_result override;
        [[nodiscard]] auto links_touching(std::string_view device_id) const -> std::vector<std::string> override;

    private:
        // caller holds the unique lock
        [[nodiscard]] auto generate_id() -> std::string;
        auto drop_device_locked(std::string_view device_id) -> void;
    };

} // namespace netval
