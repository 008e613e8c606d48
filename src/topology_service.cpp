// topology_service.cpp - per-device serialization of save + replace + re-validate
// unrelated devices never wait on each other

#include "netval/topology_service.hpp"
#include "netval/logging.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <utility>

namespace netval
{

    namespace
    {
        constexpr std::string_view component = "topology";
    }

    auto device_lock_set::covers(std::string_view const device_id) const -> bool
    {
        return std::ranges::binary_search(ids, device_id, std::less<>{});
    }

    topology_service::topology_service(topology_store &store, settings cfg)
        : store_{store}, settings_{std::move(cfg)}
    {
    }

    // ============================================================================
    // device locks
    // ============================================================================

    auto topology_service::device_mutex(std::string_view const device_id) -> std::shared_ptr<std::mutex>
    {
        std::lock_guard guard{locks_mutex_};

        auto &slot = device_locks_[std::string{device_id}];
        if (!slot)
        {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    auto topology_service::lock_devices(std::vector<std::string> device_ids) -> device_lock_set
    {
        std::ranges::sort(device_ids);
        auto const duplicates = std::ranges::unique(device_ids);
        device_ids.erase(duplicates.begin(), duplicates.end());

        device_lock_set held{};
        held.mutexes.reserve(device_ids.size());
        held.locks.reserve(device_ids.size());
        for (auto const &id : device_ids)
        {
            held.mutexes.push_back(device_mutex(id));
            held.locks.emplace_back(*held.mutexes.back());
        }
        held.ids = std::move(device_ids);
        return held;
    }

    auto topology_service::update_scope(std::string_view const device_id) const -> std::vector<std::string>
    {
        std::vector<std::string> ids{std::string{device_id}};
        for (auto const &link_id : store_.links_touching(device_id))
        {
            if (auto const link = store_.find_link(link_id); link.has_value())
            {
                ids.push_back(link->source_device_id);
                ids.push_back(link->target_device_id);
            }
        }
        return ids;
    }

    auto topology_service::lock_update_scope(std::string_view const device_id) -> device_lock_set
    {
        auto ids = update_scope(device_id);
        while (true)
        {
            auto held = lock_devices(ids);

            auto current = update_scope(device_id);
            if (std::ranges::all_of(current, [&](auto const &id)
                                    { return held.covers(id); }))
            {
                return held;
            }

            logging::trace(component, "device {}: link peers changed while locking, retrying", device_id);
            ids.insert(ids.end(), std::make_move_iterator(current.begin()), std::make_move_iterator(current.end()));
        }
    }

    auto topology_service::forget_device_locks(std::span<std::string const> const device_ids) -> void
    {
        std::lock_guard guard{locks_mutex_};
        for (auto const &id : device_ids)
        {
            // holders keep their shared_ptr until they unlock
            device_locks_.erase(id);
        }
    }

    auto topology_service::tracked_device_locks() -> std::size_t
    {
        std::lock_guard guard{locks_mutex_};
        return device_locks_.size();
    }

    // ============================================================================
    // operations
    // ============================================================================

    auto topology_service::upload_config(std::string_view const device_id, std::string content)
        -> result<upload_report>
    {
        if (auto const device = store_.find_device(device_id); !device.has_value())
        {
            logging::warn(component, "config upload for unknown device {}", device_id);
            return std::unexpected{device.error()};
        }

        auto const held = lock_update_scope(device_id);

        auto snapshot = store_.save_config(device_id, std::move(content));
        if (!snapshot.has_value())
        {
            return std::unexpected{snapshot.error()};
        }

        upload_report report{};
        report.facts = extract_device_facts(snapshot->content, settings_.extraction());

        logging::info(component, "device {}: {} interfaces, {} vlans, hostname {}",
                      device_id, report.facts.interfaces.size(), report.facts.vlans.size(),
                      report.facts.hostname.value_or("<none>"));

        if (auto const replaced = store_.replace_device_facts(device_id, report.facts); !replaced.has_value())
        {
            return std::unexpected{replaced.error()};
        }

        for (auto const &link_id : store_.links_touching(device_id))
        {
            auto const link = store_.find_link(link_id);
            if (!link.has_value())
            {
                // removed since the lookup
                continue;
            }

            // created after the locks were taken; its own validation runs once we release
            if (!held.covers(link->source_device_id) || !held.covers(link->target_device_id))
            {
                logging::debug(component, "link {} appeared during upload of {}, left to its creator",
                               link_id, device_id);
                continue;
            }

            auto const evaluation = validate_locked(*link);
            if (!evaluation.has_value())
            {
                if (evaluation.error() == error_code::link_not_found)
                {
                    continue;
                }
                return std::unexpected{evaluation.error()};
            }
            report.revalidated.push_back(link_revalidation{.link_id = link_id, .evaluation = *evaluation});
        }

        report.snapshot = std::move(*snapshot);
        return report;
    }

    auto topology_service::validate(std::string_view const link_id) -> result<link_evaluation>
    {
        auto const link = store_.find_link(link_id);
        if (!link.has_value())
        {
            logging::warn(component, "validation requested for unknown link {}", link_id);
            return std::unexpected{link.error()};
        }

        auto const held = lock_devices({link->source_device_id, link->target_device_id});
        return validate_locked(*link);
    }

    auto topology_service::create_link(std::string_view const project_id, link_spec const &spec)
        -> result<link_record>
    {
        auto link = store_.add_link(project_id, spec);
        if (!link.has_value())
        {
            return std::unexpected{link.error()};
        }

        auto const evaluation = validate(link->id);
        if (!evaluation.has_value())
        {
            return std::unexpected{evaluation.error()};
        }
        link->state = evaluation->state;
        return link;
    }

    auto topology_service::remove_device(std::string_view const device_id) -> void_result
    {
        auto const dropped = [&]
        {
            auto const held = lock_update_scope(device_id);
            return store_.remove_device(device_id);
        }();

        // an unknown id has no use for a lock either
        std::vector<std::string> const removed{std::string{device_id}};
        forget_device_locks(removed);

        if (!dropped.has_value())
        {
            logging::warn(component, "remove of unknown device {}", device_id);
            return std::unexpected{dropped.error()};
        }

        logging::info(component, "device {} removed", device_id);
        return {};
    }

    auto topology_service::remove_project(std::string_view const project_id) -> void_result
    {
        auto const devices = store_.list_devices(project_id);
        if (!devices.has_value())
        {
            logging::warn(component, "remove of unknown project {}", project_id);
            return std::unexpected{devices.error()};
        }

        std::vector<std::string> removed;
        std::vector<std::string> scope;
        for (auto const &device : *devices)
        {
            removed.push_back(device.id);
            auto peers = update_scope(device.id);
            scope.insert(scope.end(), std::make_move_iterator(peers.begin()), std::make_move_iterator(peers.end()));
        }

        {
            auto const held = lock_devices(std::move(scope));
            if (auto const dropped = store_.remove_project(project_id); !dropped.has_value())
            {
                return std::unexpected{dropped.error()};
            }
        }

        forget_device_locks(removed);
        logging::info(component, "project {} removed with {} devices", project_id, removed.size());
        return {};
    }

    auto topology_service::validate_locked(link_record const &link) -> result<link_evaluation>
    {
        auto const source = store_.resolve_interface(link.source_device_id, link.source_interface);
        auto const target = store_.resolve_interface(link.target_device_id, link.target_interface);

        auto const evaluation = evaluate_link(source ? &*source : nullptr, target ? &*target : nullptr);

        if (auto const stored = store_.set_link_state(link.id, evaluation.state); !stored.has_value())
        {
            return std::unexpected{stored.error()};
        }

        logging::debug(component, "link {} ({}:{} <-> {}:{}): l2 {} l3 {} -> {}",
                       link.id, link.source_device_id, link.source_interface,
                       link.target_device_id, link.target_interface,
                       evaluation.l2_up ? "up" : "down", evaluation.l3_up ? "up" : "down",
                       evaluation.state);
        return evaluation;
    }

} // namespace netval
