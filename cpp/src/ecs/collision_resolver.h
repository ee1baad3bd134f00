#ifndef WISP_COLLISION_RESOLVER_H
#define WISP_COLLISION_RESOLVER_H

#include "snapshot.h"
#include <cstdint>
#include <vector>

namespace wisp {

// Groups live enemies by exact cell. A same-color pile keeps its lowest
// creation-order member; the ids of every other member are returned (in
// creation order) for purification. Mixed-color piles are left alone.
//
// `live` must be in creation order.
std::vector<uint32_t> resolve_collisions(const std::vector<EnemyRecord> &live);

} // namespace wisp

#endif // WISP_COLLISION_RESOLVER_H
