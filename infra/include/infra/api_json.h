#pragma once

#include "core/job.h"
#include "core/job_error.h"
#include "core/result.h"

#include <optional>
#include <string>
#include <vector>

namespace ermes::infra::api_json {

/// Login response `{ "access_token": "..." }`.
core::Result<std::string, core::JobError>
parse_access_token(const std::string &body);

/// Job detail response
/// `{ status, status_code, result, resource_url?, body: { datatype_id? } }`.
core::Result<core::JobHandle, core::JobError>
parse_job_handle(const std::string &job_id, const std::string &body);

/// Job list response `{ "jobs": [ ... ] }`.
core::Result<std::vector<core::JobSummary>, core::JobError>
parse_job_list(const std::string &body);

/// `detail` of a FastAPI-style error body. A non-string detail is returned
/// serialised. Nothing for bodies that are not JSON objects.
std::optional<std::string> extract_error_detail(const std::string &body);

} // namespace ermes::infra::api_json
