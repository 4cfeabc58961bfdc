#include "infra/api_json.h"

#include <json/json.h>

#include <exception>
#include <memory>

namespace ermes::infra::api_json {

namespace {

using core::JobError;

bool parse_root(const std::string &body, Json::Value &root, std::string &errs) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(body.data(), body.data() + body.size(), &root, &errs);
}

JobError parse_error(const std::string &what, const std::string &errs) {
  return JobError(core::ErrorCategory::Internal, 1007, false,
                  "Unexpected response from the API",
                  what + ": " + errs);
}

// Ids and codes arrive as either numbers or strings.
std::optional<std::string> scalar_text(const Json::Value &v) {
  if (v.isString()) {
    return v.asString();
  }
  if (v.isIntegral()) {
    return std::to_string(v.asLargestInt());
  }
  if (v.isNumeric()) {
    return std::to_string(v.asDouble());
  }
  return std::nullopt;
}

int scalar_int(const Json::Value &v) {
  if (v.isIntegral()) {
    return v.asInt();
  }
  if (v.isString()) {
    try {
      return std::stoi(v.asString());
    } catch (const std::exception &) {
      return 0;
    }
  }
  return 0;
}

std::optional<std::string> datatype_of(const Json::Value &job) {
  const Json::Value &body = job["body"];
  if (!body.isObject()) {
    return std::nullopt;
  }
  return scalar_text(body["datatype_id"]);
}

// null, false, 0, "" and empty containers are all "absent".
bool truthy(const Json::Value &v) {
  switch (v.type()) {
  case Json::nullValue:
    return false;
  case Json::booleanValue:
    return v.asBool();
  case Json::intValue:
  case Json::uintValue:
  case Json::realValue:
    return v.asDouble() != 0.0;
  case Json::stringValue:
    return !v.asString().empty();
  case Json::arrayValue:
  case Json::objectValue:
    return !v.empty();
  }
  return false;
}

} // namespace

core::Result<std::string, core::JobError>
parse_access_token(const std::string &body) {
  using R = core::Result<std::string, core::JobError>;
  Json::Value root;
  std::string errs;
  try {
    if (!parse_root(body, root, errs)) {
      return R::Err(parse_error("login response is not JSON", errs));
    }
    if (!root.isObject() || !root["access_token"].isString() ||
        root["access_token"].asString().empty()) {
      return R::Err(JobError::AuthFailure(
          "authentication failed: no access token in login response"));
    }
    return R::Ok(root["access_token"].asString());
  } catch (const Json::Exception &e) {
    return R::Err(parse_error("login response", e.what()));
  }
}

core::Result<core::JobHandle, core::JobError>
parse_job_handle(const std::string &job_id, const std::string &body) {
  using R = core::Result<core::JobHandle, core::JobError>;
  Json::Value root;
  std::string errs;
  try {
    if (!parse_root(body, root, errs) || !root.isObject()) {
      return R::Err(parse_error("job detail is not a JSON object", errs));
    }

    core::JobHandle handle;
    handle.id = job_id;
    handle.status_text = root["status"].isString() ? root["status"].asString() : "";
    handle.status = core::parse_job_status(handle.status_text);
    handle.status_code = scalar_int(root["status_code"]);
    if (const auto result = scalar_text(root["result"])) {
      handle.result_message = *result;
    } else if (!root["result"].isNull()) {
      handle.result_message =
          Json::writeString(Json::StreamWriterBuilder(), root["result"]);
    }
    handle.resource_available = truthy(root["resource_url"]);
    handle.datatype_id = datatype_of(root);
    return R::Ok(std::move(handle));
  } catch (const Json::Exception &e) {
    return R::Err(parse_error("job detail", e.what()));
  }
}

core::Result<std::vector<core::JobSummary>, core::JobError>
parse_job_list(const std::string &body) {
  using R = core::Result<std::vector<core::JobSummary>, core::JobError>;
  Json::Value root;
  std::string errs;
  try {
    if (!parse_root(body, root, errs) || !root.isObject() ||
        !root["jobs"].isArray()) {
      return R::Err(parse_error("job list has no `jobs` array", errs));
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    std::vector<core::JobSummary> jobs;
    for (const Json::Value &item : root["jobs"]) {
      if (!item.isObject()) {
        continue;
      }
      core::JobSummary summary;
      if (auto id = scalar_text(item["id"])) {
        summary.id = *id;
      } else if (auto job_id = scalar_text(item["job_id"])) {
        summary.id = *job_id;
      }
      summary.status = item["status"].isString() ? item["status"].asString() : "";
      if (auto result = scalar_text(item["result"])) {
        summary.result_message = *result;
      }
      summary.datatype_id = datatype_of(item);
      summary.raw_json = Json::writeString(writer, item);
      jobs.push_back(std::move(summary));
    }
    return R::Ok(std::move(jobs));
  } catch (const Json::Exception &e) {
    return R::Err(parse_error("job list", e.what()));
  }
}

std::optional<std::string> extract_error_detail(const std::string &body) {
  Json::Value root;
  std::string errs;
  try {
    if (body.empty() || !parse_root(body, root, errs) || !root.isObject() ||
        !root.isMember("detail")) {
      return std::nullopt;
    }
    const Json::Value &detail = root["detail"];
    if (detail.isString()) {
      return detail.asString();
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, detail);
  } catch (const Json::Exception &) {
    return std::nullopt;
  }
}

} // namespace ermes::infra::api_json
