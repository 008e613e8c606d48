// link_validator.cpp - L2/L3 agreement between two interface snapshots
// stateless: same inputs, same answer, every time

#include "netval/link_validator.hpp"
#include "netval/prefix.hpp"

namespace netval
{

    namespace
    {

        [[nodiscard]] auto sets_intersect(vlan_set const &a, vlan_set const &b) noexcept -> bool
        {
            // both sorted, walk them together
            auto ia = a.begin();
            auto ib = b.begin();
            while (ia != a.end() && ib != b.end())
            {
                if (*ia == *ib)
                {
                    return true;
                }
                if (*ia < *ib)
                {
                    ++ia;
                }
                else
                {
                    ++ib;
                }
            }
            return false;
        }

        [[nodiscard]] auto l3_applicable(interface_facts const &a, interface_facts const &b) noexcept -> bool
        {
            return a.has_address() && b.has_address();
        }

    } // anonymous namespace

    auto l2_compatible(interface_facts const &a, interface_facts const &b) noexcept -> bool
    {
        if (a.mode == interface_mode::access && b.mode == interface_mode::access)
        {
            return a.access_vlan.has_value() && b.access_vlan.has_value() && *a.access_vlan == *b.access_vlan;
        }

        if (a.mode == interface_mode::trunk && b.mode == interface_mode::trunk)
        {
            return sets_intersect(a.trunk_allowed_vlans, b.trunk_allowed_vlans);
        }

        // TODO: decide whether an access vlan inside the trunk's allowed set should count
        return false;
    }

    auto l3_compatible(interface_facts const &a, interface_facts const &b) noexcept -> bool
    {
        if (!l3_applicable(a, b))
        {
            return false;
        }
        return same_network(*a.address, *a.mask, *b.address, *b.mask);
    }

    auto evaluate_link(interface_facts const *const source, interface_facts const *const target) noexcept
        -> link_evaluation
    {
        link_evaluation eval{};

        if (source == nullptr || target == nullptr)
        {
            eval.state = link_state::down;
            return eval;
        }
        eval.endpoints_resolved = true;

        eval.l2_checked = source->mode == target->mode;
        eval.l2_up = l2_compatible(*source, *target);

        eval.l3_checked = l3_applicable(*source, *target);
        eval.l3_up = eval.l3_checked && l3_compatible(*source, *target);

        eval.state = (eval.l2_up || eval.l3_up) ? link_state::up : link_state::down;
        return eval;
    }

    auto validate_link(interface_facts const *const source, interface_facts const *const target) noexcept
        -> link_state
    {
        return evaluate_link(source, target).state;
    }

} // namespace netval
