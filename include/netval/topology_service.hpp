#pragma once

// topology_service.hpp - extraction and link re-validation as one unit per device
// upload a config, get facts stored and every touching link rechecked

#include "extractor.hpp"
#include "link_validator.hpp"
#include "settings.hpp"
#include "topology_store.hpp"

#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace netval
{

    struct link_revalidation
    {
        std::string link_id{};
        link_evaluation evaluation{};
    };

    struct upload_report
    {
        config_snapshot snapshot{};
        device_facts facts{};
        std::vector<link_revalidation> revalidated{};
    };

    // device update locks held together, released on destruction
    struct device_lock_set
    {
        std::vector<std::string> ids{}; // sorted, unique
        std::vector<std::shared_ptr<std::mutex>> mutexes{};
        std::vector<std::unique_lock<std::mutex>> locks{};

        [[nodiscard]] auto covers(std::string_view device_id) const -> bool;
    };

    class topology_service
    {
    private:
        topology_store &store_;
        settings settings_{};

        // one entry per device seen; removing a device through the service drops it
        std::mutex locks_mutex_{};
        std::unordered_map<std::string, std::shared_ptr<std::mutex>> device_locks_{};

    public:
        explicit topology_service(topology_store &store, settings cfg = {});

        topology_service(topology_service const &) = delete;
        auto operator=(topology_service const &) -> topology_service & = delete;

        // store the snapshot, replace the device's facts, re-validate its links;
        // the device and every link peer stay locked from save to re-validation
        [[nodiscard]] auto upload_config(std::string_view device_id, std::string content) -> result<upload_report>;

        // recompute one link from the current endpoint facts and store the state
        [[nodiscard]] auto validate(std::string_view link_id) -> result<link_evaluation>;

        // add a link and validate it once right away
        [[nodiscard]] auto create_link(std::string_view project_id, link_spec const &spec) -> result<link_record>;

        // remove the device with its links, configs and update lock
        [[nodiscard]] auto remove_device(std::string_view device_id) -> void_result;

        // remove the project with all of its devices
        [[nodiscard]] auto remove_project(std::string_view project_id) -> void_result;

        [[nodiscard]] auto tracked_device_locks() -> std::size_t;

        [[nodiscard]] auto store() noexcept -> topology_store & { return store_; }
        [[nodiscard]] auto config() const noexcept -> settings const & { return settings_; }

    private:
        // created on first use
        [[nodiscard]] auto device_mutex(std::string_view device_id) -> std::shared_ptr<std::mutex>;

        // always acquired in sorted id order, so overlapping sets never deadlock
        [[nodiscard]] auto lock_devices(std::vector<std::string> device_ids) -> device_lock_set;

        // the device plus both endpoints of every link touching it
        [[nodiscard]] auto update_scope(std::string_view device_id) const -> std::vector<std::string>;

        // locks the update scope, widening it when links appear before the locks are held
        [[nodiscard]] auto lock_update_scope(std::string_view device_id) -> device_lock_set;

        auto forget_device_locks(std::span<std::string const> device_ids) -> void;

        // caller holds the update locks of both endpoint devices
        [[nodiscard]] auto validate_locked(link_record const &link) -> result<link_evaluation>;
    };

} // namespace netval
