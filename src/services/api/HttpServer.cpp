#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/pipeline/CertificatePipeline.hpp"

using nlohmann::json;

namespace certgen {

static const char* const kApiKeyHeader = "x-internal-api-key";

// -------- helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  // messages may quote raw request bytes or converter output
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

static void send_error(httplib::Response& res, const PipelineError& err) {
  send_json(res, status_for(err.code), {{"detail", err.message}});
}

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true;
  if (req.get_header_value(kApiKeyHeader) == apiKey) return true;
  send_json(res, 403, {{"detail", "forbidden"}});
  return false;
}

static bool origin_allowed(const std::vector<std::string>& origins, const std::string& origin) {
  if (origin.empty()) return false;
  return std::find(origins.begin(), origins.end(), origin) != origins.end();
}

static Result<std::string> string_member(const json& j, const char* name, bool required) {
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) {
    if (required) return Result<std::string>::fail(ErrorCode::Validation, std::string(name) + " missing");
    return std::string();
  }
  if (!it->is_string()) {
    return Result<std::string>::fail(ErrorCode::Validation, std::string(name) + " must be a string");
  }
  return it->get<std::string>();
}

// -------- request decoding --------

Result<GenerationRequest> parse_generation_request(const std::string& body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error& e) {
    return Result<GenerationRequest>::fail(ErrorCode::Validation,
                                           std::string("invalid JSON body: ") + e.what());
  }
  if (!j.is_object()) {
    return Result<GenerationRequest>::fail(ErrorCode::Validation, "request body must be a JSON object");
  }

  GenerationRequest req;

  auto templateKey = string_member(j, "templateKey", true);
  if (!templateKey) return templateKey.error();
  req.templateKey = templateKey.value();

  auto signatureKey = string_member(j, "signatureKey", true);
  if (!signatureKey) return signatureKey.error();
  req.signatureKey = signatureKey.value();

  auto outputKey = string_member(j, "outputKey", false);
  if (!outputKey) return outputKey.error();
  req.outputKey = outputKey.value();

  auto format = string_member(j, "outputFormat", false);
  if (!format) return format.error();
  if (format.value() == "pdf") {
    req.outputFormat = OutputFormat::Pdf;
  } else if (format.value() == "docx") {
    req.outputFormat = OutputFormat::Docx;
  } else if (!format.value().empty()) {
    return Result<GenerationRequest>::fail(ErrorCode::Validation,
                                           "outputFormat must be 'docx' or 'pdf'");
  }

  auto data = j.find("data");
  if (data == j.end() || !data->is_object()) {
    return Result<GenerationRequest>::fail(ErrorCode::Validation, "data must be an object");
  }
  for (auto it = data->begin(); it != data->end(); ++it) {
    if (it->is_string()) {
      req.fields[it.key()] = it->get<std::string>();
    } else if (it->is_null()) {
      req.fields[it.key()] = "";
    } else {
      req.fields[it.key()] = it->dump();
    }
  }
  return req;
}

int status_for(ErrorCode code) {
  if (code == ErrorCode::Unauthorized) return 403;
  return is_client_error(code) ? 400 : 500;
}

// -------- routes --------

static void handle_generate(const CertificatePipeline& pipeline,
                            const httplib::Request& req,
                            httplib::Response& res,
                            bool forcePdf) {
  auto parsed = parse_generation_request(req.body);
  if (!parsed) {
    spdlog::warn("{} rejected: {}", req.path, parsed.error().message);
    send_error(res, parsed.error());
    return;
  }
  GenerationRequest request = std::move(parsed).value();
  if (forcePdf) request.outputFormat = OutputFormat::Pdf;

  try {
    auto key = pipeline.run(request);
    if (!key) {
      spdlog::error("{} failed [{}]: {}", req.path, to_string(key.error().code), key.error().message);
      send_error(res, key.error());
      return;
    }
    send_json(res, 200, {{"key", key.value()}});
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", req.path, e.what());
    send_json(res, 500, {{"detail", e.what()}});
  }
}

void configure_routes(httplib::Server& svr,
                      const CertificatePipeline& pipeline,
                      const ServerOptions& opts) {
  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, {{"status", "ok"}});
  });

  // POST /generate-docx
  // Body: {"templateKey", "signatureKey", "outputKey", "data": {...}, "outputFormat"?}
  svr.Post("/generate-docx", [&pipeline, &opts](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, opts.apiKey, res)) return;
    handle_generate(pipeline, req, res, false);
  });

  // POST /generate-pdf: same body, always converted.
  svr.Post("/generate-pdf", [&pipeline, &opts](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, opts.apiKey, res)) return;
    handle_generate(pipeline, req, res, true);
  });

  // CORS preflight
  svr.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });

  svr.set_post_routing_handler([&opts](const httplib::Request& req, httplib::Response& res) {
    const std::string origin = req.get_header_value("Origin");
    if (!origin_allowed(opts.corsOrigins, origin)) return;
    res.set_header("Access-Control-Allow-Origin", origin);
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS, PATCH");
    const std::string reqHeaders = req.get_header_value("Access-Control-Request-Headers");
    res.set_header("Access-Control-Allow-Headers", reqHeaders.empty() ? "*" : reqHeaders);
    res.set_header("Vary", "Origin");
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) send_json(res, 404, {{"detail", "Not Found"}});
  });
}

// -------- server --------

void run_http_server(const CertificatePipeline& pipeline, const ServerOptions& opts) {
  httplib::Server svr;
  configure_routes(svr, pipeline, opts);

  spdlog::info("HTTP server listening on http://{}:{}", opts.host, opts.port);
  if (!svr.listen(opts.host, opts.port)) {
    throw std::runtime_error("failed to bind " + opts.host + ":" + std::to_string(opts.port));
  }
}

} // namespace certgen
