#pragma once

#include "workgraph/core/error.hpp"
#include "workgraph/graph/reference.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace workgraph {

inline constexpr std::size_t kDefaultMaxRangeSize = 1000;

// Expands "7-10", "1,3-5", "4.1-4.3" or "4.1-3" into an ordered list of
// references, first occurrence wins. Fails with MalformedRange on an empty
// spec or term, non-numeric or zero ids, reversed bounds, a dotted range that
// spans two parents, mixed bare and dotted bounds, or an expansion larger
// than `max_size`.
[[nodiscard]] auto parse_range_spec(std::string_view spec,
                                    std::size_t max_size = kDefaultMaxRangeSize)
    -> Result<std::vector<Reference>>;

}  // namespace workgraph
