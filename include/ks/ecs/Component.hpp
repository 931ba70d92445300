#pragma once

namespace ks::ecs {

/**
 * @brief Base for every record a World can attach to an entity.
 *
 * Components are plain data. At most one instance of each concrete type is
 * attached to a given entity.
 */
class Component {
public:
    virtual ~Component() = default;
};

} // namespace ks::ecs
