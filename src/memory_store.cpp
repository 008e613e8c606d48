// memory_store.cpp - the in-process store behind the service and the tests

#include "netval/memory_store.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>

namespace netval
{

    auto content_fingerprint(std::string_view const content) noexcept -> std::string
    {
        constexpr std::uint64_t fnv_offset = 0xcbf29ce484222325ULL;
        constexpr std::uint64_t fnv_prime = 0x100000001b3ULL;

        std::uint64_t hash = fnv_offset;
        for (auto const c : content)
        {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= fnv_prime;
        }
        return fmt::format("{:016x}", hash);
    }

    memory_store::memory_store(settings cfg)
        : settings_{std::move(cfg)}, id_engine_{std::random_device{}()}
    {
    }

    auto memory_store::generate_id() -> std::string
    {
        // uuid4 layout
        auto const hi = id_engine_();
        auto const lo = id_engine_();
        return fmt::format("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}",
                           static_cast<std::uint32_t>(hi >> 32),
                           static_cast<std::uint16_t>(hi >> 16),
                           static_cast<std::uint16_t>(hi & 0x0FFF),
                           static_cast<std::uint16_t>(0x8000 | ((lo >> 48) & 0x3FFF)),
                           lo & 0xFFFFFFFFFFFFULL);
    }

    // ----------------------------------------------------------------------------
    // projects
    // ----------------------------------------------------------------------------

    auto memory_store::create_project(std::string name, std::string description) -> result<project_record>
    {
        std::unique_lock lock{mutex_};

        project_record project{.id = generate_id(), .name = std::move(name), .description = std::move(description)};
        auto const [it, inserted] = projects_.emplace(project.id, project);
        if (!inserted)
        {
            return std::unexpected{error_code::duplicate_id};
        }
        return it->second;
    }

    auto memory_store::find_project(std::string_view const project_id) const -> result<project_record>
    {
        std::shared_lock lock{mutex_};

        auto const it = projects_.find(project_id);
        if (it == projects_.end())
        {
            return std::unexpected{error_code::project_not_found};
        }
        return it->second;
    }

    auto memory_store::remove_project(std::string_view const project_id) -> void_result
    {
        std::unique_lock lock{mutex_};

        auto const it = projects_.find(project_id);
        if (it == projects_.end())
        {
            return std::unexpected{error_code::project_not_found};
        }

        std::vector<std::string> doomed;
        for (auto const &[id, device] : devices_)
        {
            if (device.project_id == project_id)
            {
                doomed.push_back(id);
            }
        }
        for (auto const &id : doomed)
        {
            drop_device_locked(id);
        }

        std::erase_if(links_, [&](auto const &link)
                      { return link.project_id == project_id; });
        projects_.erase(it);
        return {};
    }

    // ----------------------------------------------------------------------------
    // devices
    // ----------------------------------------------------------------------------

    auto memory_store::add_device(std::string_view const project_id, device_spec const &spec)
        -> result<device_record>
    {
        std::unique_lock lock{mutex_};

        if (!projects_.contains(project_id))
        {
            return std::unexpected{error_code::project_not_found};
        }

        device_record device{
            .id = generate_id(),
            .project_id = std::string{project_id},
            .hostname = spec.hostname,
            .role = spec.role,
            .vendor = spec.vendor.value_or(settings_.default_vendor),
            .platform = spec.platform.value_or(settings_.default_platform),
            .management_address = spec.management_address,
            .config_hash = std::nullopt,
            .interfaces = {},
            .vlans = {}};

        auto const [it, inserted] = devices_.emplace(device.id, std::move(device));
        if (!inserted)
        {
            return std::unexpected{error_code::duplicate_id};
        }
        return it->second;
    }

    auto memory_store::find_device(std::string_view const device_id) const -> result<device_record>
    {
        std::shared_lock lock{mutex_};

        auto const it = devices_.find(device_id);
        if (it == devices_.end())
        {
            return std::unexpected{error_code::device_not_found};
        }
        return it->second;
    }

    auto memory_store::list_devices(std::string_view const project_id) const -> result<std::vector<device_record>>
    {
        std::shared_lock lock{mutex_};

        if (!projects_.contains(project_id))
        {
            return std::unexpected{error_code::project_not_found};
        }

        std::vector<device_record> out;
        for (auto const &[id, device] : devices_)
        {
            if (device.project_id == project_id)
            {
                out.push_back(device);
            }
        }
        return out;
    }

    auto memory_store::remove_device(std::string_view const device_id) -> void_result
    {
        std::unique_lock lock{mutex_};

        if (!devices_.contains(device_id))
        {
            return std::unexpected{error_code::device_not_found};
        }
        drop_device_locked(device_id);
        return {};
    }

    auto memory_store::drop_device_locked(std::string_view const device_id) -> void
    {
        std::erase_if(links_, [&](auto const &link)
                      { return link.touches(device_id); });

        if (auto const it = configs_.find(device_id); it != configs_.end())
        {
            configs_.erase(it);
        }
        if (auto const it = devices_.find(device_id); it != devices_.end())
        {
            devices_.erase(it);
        }
    }

    // ----------------------------------------------------------------------------
    // links
    // ----------------------------------------------------------------------------

    auto memory_store::add_link(std::string_view const project_id, link_spec const &spec) -> result<link_record>
    {
        std::unique_lock lock{mutex_};

        if (!projects_.contains(project_id))
        {
            return std::unexpected{error_code::project_not_found};
        }

        auto const in_project = [&](std::string_view const device_id)
        {
            auto const it = devices_.find(device_id);
            return it != devices_.end() && it->second.project_id == project_id;
        };
        if (!in_project(spec.source_device_id) || !in_project(spec.target_device_id))
        {
            return std::unexpected{error_code::device_not_found};
        }

        links_.push_back(link_record{
            .id = generate_id(),
            .project_id = std::string{project_id},
            .source_device_id = spec.source_device_id,
            .source_interface = spec.source_interface,
            .target_device_id = spec.target_device_id,
            .target_interface = spec.target_interface,
            .medium = spec.medium,
            .vlan_allow_list = spec.vlan_allow_list,
            .state = link_state::pending});
        return links_.back();
    }

    auto memory_store::find_link(std::string_view const link_id) const -> result<link_record>
    {
        std::shared_lock lock{mutex_};

        auto const it = std::ranges::find(links_, link_id, &link_record::id);
        if (it == links_.end())
        {
            return std::unexpected{error_code::link_not_found};
        }
        return *it;
    }

    auto memory_store::list_links(std::string_view const project_id) const -> result<std::vector<link_record>>
    {
        std::shared_lock lock{mutex_};

        if (!projects_.contains(project_id))
        {
            return std::unexpected{error_code::project_not_found};
        }

        std::vector<link_record> out;
        std::ranges::copy_if(links_, std::back_inserter(out), [&](auto const &link)
                             { return link.project_id == project_id; });
        return out;
    }

    auto memory_store::remove_link(std::string_view const link_id) -> void_result
    {
        std::unique_lock lock{mutex_};

        auto const it = std::ranges::find(links_, link_id, &link_record::id);
        if (it == links_.end())
        {
            return std::unexpected{error_code::link_not_found};
        }
        links_.erase(it);
        return {};
    }

    // ----------------------------------------------------------------------------
    // configs and facts
    // ----------------------------------------------------------------------------

    auto memory_store::save_config(std::string_view const device_id, std::string content)
        -> result<config_snapshot>
    {
        std::unique_lock lock{mutex_};

        auto const device = devices_.find(device_id);
        if (device == devices_.end())
        {
            return std::unexpected{error_code::device_not_found};
        }

        device->second.config_hash = content_fingerprint(content);

        config_snapshot snapshot{
            .id = generate_id(),
            .device_id = std::string{device_id},
            .content = std::move(content),
            .sequence = next_sequence_++};

        auto &history = configs_[std::string{device_id}];
        history.push_back(std::move(snapshot));
        return history.back();
    }

    auto memory_store::latest_config(std::string_view const device_id) const -> result<config_snapshot>
    {
        std::shared_lock lock{mutex_};

        if (!devices_.contains(device_id))
        {
            return std::unexpected{error_code::device_not_found};
        }

        auto const it = configs_.find(device_id);
        if (it == configs_.end() || it->second.empty())
        {
            return std::unexpected{error_code::config_not_found};
        }
        return it->second.back();
    }

    auto memory_store::replace_device_facts(std::string_view const device_id, device_facts const &facts)
        -> void_result
    {
        std::unique_lock lock{mutex_};

        auto const it = devices_.find(device_id);
        if (it == devices_.end())
        {
            return std::unexpected{error_code::device_not_found};
        }

        auto &device = it->second;
        device.interfaces = facts.interfaces;
        device.vlans = facts.vlans;

        if (facts.hostname.has_value())
        {
            device.hostname = *facts.hostname;
        }
        if (facts.vendor.has_value())
        {
            device.vendor = *facts.vendor;
        }
        if (facts.platform.has_value())
        {
            device.platform = *facts.platform;
        }
        if (facts.management_address.has_value())
        {
            device.management_address = facts.management_address;
        }
        return {};
    }

    auto memory_store::resolve_interface(std::string_view const device_id, std::string_view const name) const
        -> std::optional<interface_facts>
    {
        std::shared_lock lock{mutex_};

        auto const device = devices_.find(device_id);
        if (device == devices_.end())
        {
            return std::nullopt;
        }

        auto const &interfaces = device->second.interfaces;
        auto const it = std::ranges::find(interfaces, name, &interface_facts::name);
        if (it == interfaces.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    auto memory_store::set_link_state(std::string_view const link_id, link_state const state) -> void_result
    {
        std::unique_lock lock{mutex_};

        auto const it = std::ranges::find(links_, link_id, &link_record::id);
        if (it == links_.end())
        {
            return std::unexpected{error_code::link_not_found};
        }
        it->state = state;
        return {};
    }

    auto memory_store::links_touching(std::string_view const device_id) const -> std::vector<std::string>
    {
        std::shared_lock lock{mutex_};

        std::vector<std::string> ids;
        for (auto const &link : links_)
        {
            if (link.touches(device_id))
            {
                ids.push_back(link.id);
            }
        }
        return ids;
    }

} // namespace netval
