#pragma once

#include "InstanceId.hpp"

#include <string>
#include <vector>

namespace roster {

/**
 * Finds the smallest ID not claimed by any of the given record names.
 *
 * The names may arrive in any order (object stores usually list them lexicographically, so "10" precedes "2"); they
 * are parsed and sorted numerically before scanning. Starting from zero, the scan walks the sorted IDs and stops at
 * the first one that is more than one past the last ID seen; the answer is the last ID seen plus one.
 *
 * Throws NamespaceCorruptError for the first name that is not a valid record name, and IdSpaceExhaustedError if every
 * ID up to MaxInstanceId is taken.
 */
InstanceId find_smallest_free_id(const std::vector<std::string> &record_names);

}
