#pragma once

#include <cstddef>
#include <vector>

template<typename Command, typename Resource>
struct ResolvedCommand {
    const Command* command = nullptr;
    const Resource* resource = nullptr;
};

template<typename Command, typename Resource>
struct ResolvedCommands {
    std::vector<ResolvedCommand<Command, Resource>> commands;
    size_t dropped = 0;
};

/**
 * Looks up each command's asset with lookup(const AssetId&) -> const Resource*.
 * Commands whose asset has no ready resource are dropped for this frame; the
 * rest keep their order.
 */
template<typename Resource, typename Command, typename Lookup>
ResolvedCommands<Command, Resource> resolveCommands(const std::vector<Command>& commands, Lookup&& lookup) {
    ResolvedCommands<Command, Resource> result;
    result.commands.reserve(commands.size());
    for (const auto& command : commands) {
        const Resource* resource = lookup(command.asset);
        if (resource) {
            result.commands.push_back({&command, resource});
        } else {
            ++result.dropped;
        }
    }
    return result;
}
