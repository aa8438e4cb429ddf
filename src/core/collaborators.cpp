#include "chaosmine/core/collaborators.h"

#include "chaosmine/util/hash_rng.h"

namespace chaosmine {

std::uint64_t SeededEntropySource::block_seed(BlockNumber block) const { return util::mix64(seed_, block); }

} // namespace chaosmine
