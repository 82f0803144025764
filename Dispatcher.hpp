#ifndef DISPATCHER_DOT_HPP
#define DISPATCHER_DOT_HPP

#include "Validator.hpp"

#include <string>
#include <vector>

// Validate a batch of addresses in parallel, using at most
// options().max_concurrency threads, or one per address when that is zero.
// Results come back in completion order, match them up by original.

std::vector<Validation_result>
validate_many(Validator& validator, std::vector<std::string> const& emails);

#endif // DISPATCHER_DOT_HPP
