#pragma once
#include <string>
#include <vector>

#include "core/common/Result.hpp"
#include "core/common/Types.hpp"

namespace httplib { class Server; }

namespace certgen {

class CertificatePipeline;

struct ServerOptions {
  std::string host = "0.0.0.0";
  int port = 8080;
  std::string apiKey;                    // empty = auth disabled
  std::vector<std::string> corsOrigins;  // empty = no CORS headers
};

// Decodes a /generate-* JSON body. Malformed JSON or wrongly typed members
// are Validation errors. Non-string scalars in "data" are kept as their JSON
// text; null reads as "".
Result<GenerationRequest> parse_generation_request(const std::string& body);

// HTTP status for a pipeline error tag.
int status_for(ErrorCode code);

// Registers /health, /generate-docx and /generate-pdf plus CORS handling.
void configure_routes(httplib::Server& svr,
                      const CertificatePipeline& pipeline,
                      const ServerOptions& opts);

// Start a blocking HTTP server. Throws when the address cannot be bound.
void run_http_server(const CertificatePipeline& pipeline, const ServerOptions& opts);

} // namespace certgen
