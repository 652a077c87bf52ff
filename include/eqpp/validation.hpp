#ifndef EQPP_VALIDATION_HPP
#define EQPP_VALIDATION_HPP

#include "eqpp/errors.hpp"
#include "eqpp/job.hpp"

#include <vector>

namespace eqpp {

/**
 * @brief Field-level checks that need no parsing. Field names follow the JSON
 * request layout (timespan, integrator.rtol, initial_conditions[2], ...).
 *
 * @return every problem found; empty when the request is acceptable.
 */
std::vector<FieldError>
validate_request(const JobRequest &request);

/**
 * @brief Convenience wrapper.
 * @throws InvalidRequestError if validate_request() reports anything.
 */
void
require_valid_request(const JobRequest &request);

} // namespace eqpp

#endif // EQPP_VALIDATION_HPP
