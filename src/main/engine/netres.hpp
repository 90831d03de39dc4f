#pragma once

#include <optional>
#include <string>
#include <endpoint/endpoint.hpp>
#include "container.hpp"

namespace moordns {

/**
 * Picks the address to publish from a container's network attachments.
 *
 * With a preferred network: that network's address, or nothing if the container is not attached to it.
 * Without: the address of the only attachment, or nothing if there are zero or several.
 * @returns zero or one target
 */
Targets resolveNetworkTarget(const NetworkMap& networks, const std::optional<std::string>& preferred);

}
