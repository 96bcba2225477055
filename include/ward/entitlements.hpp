#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace ward
{
    /** Feature identifiers unlocked by a tier, in a fixed order */
    const std::vector<std::string> &tier_entitlements(Tier tier);

    bool tier_has_feature(Tier tier, const std::string &feature);

} // namespace ward
