#ifndef EQPP_SERIALIZATION_HPP
#define EQPP_SERIALIZATION_HPP

#include "eqpp/errors.hpp"
#include "eqpp/job.hpp"
#include "eqpp/notification_channel.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace eqpp {

//-----------------------------------------------------------------------------
// nlohmann::json conversions (found by ADL)
//-----------------------------------------------------------------------------
void
to_json(nlohmann::json &j, const SolverOptions &options);
void
to_json(nlohmann::json &j, const JobRequest &request);
void
to_json(nlohmann::json &j, const Trajectory &trajectory);
void
from_json(const nlohmann::json &j, Trajectory &trajectory);
void
to_json(nlohmann::json &j, const SolveFailure &failure);
void
from_json(const nlohmann::json &j, SolveFailure &failure);
void
to_json(nlohmann::json &j, const JobFailure &failure);
void
from_json(const nlohmann::json &j, JobFailure &failure);
void
to_json(nlohmann::json &j, const JobResult &result);
void
from_json(const nlohmann::json &j, JobResult &result);
void
to_json(nlohmann::json &j, const JobRecord &record);
void
from_json(const nlohmann::json &j, JobRecord &record);
void
to_json(nlohmann::json &j, const JobEvent &event);
void
to_json(nlohmann::json &j, const FieldError &error);

//-----------------------------------------------------------------------------
// Untrusted input
//-----------------------------------------------------------------------------

/**
 * @brief Reads an "integrator" object on top of `defaults`. Type problems and
 * unknown method names are appended to `errors` with the field name prefixed
 * by `prefix` ("integrator" for requests, "defaults" for configuration).
 */
SolverOptions
parse_solver_options(const nlohmann::json &j,
                     const SolverOptions &defaults,
                     const std::string &prefix,
                     std::vector<FieldError> &errors);

/**
 * @brief Decodes a job request document:
 * {"equations", "name", "parameters", "timespan": [t0, tf],
 *  "initial_conditions": [[...], ...], "integrator": {...}}
 *
 * Only types are checked here; value ranges are checked by validate_request().
 *
 * @throws InvalidRequestError listing every malformed field.
 */
JobRequest
parse_request(const nlohmann::json &j, const SolverOptions &defaults = {});

} // namespace eqpp

#endif // EQPP_SERIALIZATION_HPP
