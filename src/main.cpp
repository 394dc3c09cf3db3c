// src/main.cpp
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/config/AppConfig.hpp"
#include "core/pipeline/CertificatePipeline.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/S3Backend.hpp"
#include "services/api/HttpServer.hpp"

using namespace certgen;

// ---------- helpers ----------

// RAII wrapper around curl_global_init / curl_global_cleanup.
struct CurlGlobal {
  CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  }
  ~CurlGlobal() { curl_global_cleanup(); }
};

static std::unique_ptr<ObjectStore> make_store(const AppConfig& cfg) {
  if (cfg.storageBackend == "local") {
    std::filesystem::create_directories(cfg.localStorageRoot);
    return std::make_unique<LocalFSBackend>(cfg.localStorageRoot);
  }
  return std::make_unique<S3Backend>(cfg.s3);
}

static std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --serve                 # start HTTP server (PORT or 8080)\n"
            << "  " << argv0 << " --generate <req.json>   # run one generation request\n";
}

static int generate_once(const CertificatePipeline& pipeline, const std::string& path) {
  auto request = parse_generation_request(read_file(path));
  if (!request) {
    std::cout << nlohmann::json({{"detail", request.error().message}}).dump() << "\n";
    return 1;
  }
  auto key = pipeline.run(request.value());
  if (!key) {
    std::cout << nlohmann::json({{"error", to_string(key.error().code)},
                                 {"detail", key.error().message}}).dump() << "\n";
    return 1;
  }
  std::cout << nlohmann::json({{"key", key.value()}}).dump() << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const std::string mode = argc > 1 ? argv[1] : "";
    if (mode != "--serve" && !(mode == "--generate" && argc > 2)) {
      print_usage(argv[0]);
      return 1;
    }

    load_env_file(get_env_or("CERTGEN_ENV_FILE", ".env"));
    AppConfig cfg = AppConfig::fromEnvironment();
    init_logging(cfg.logLevel);
    cfg.validate();
    cfg.logSummary();

    CurlGlobal curl;
    std::unique_ptr<ObjectStore> store = make_store(cfg);
    spdlog::info("object store: {}", store->describe());

    CertificatePipeline pipeline(*store, cfg.pipelineSettings(), FormatConverter(cfg.converterOptions()));

    if (mode == "--generate") {
      return generate_once(pipeline, argv[2]);
    }

    ServerOptions opts;
    opts.host = cfg.host;
    opts.port = cfg.port;
    opts.apiKey = cfg.internalApiKey;
    opts.corsOrigins = cfg.corsOrigins;
    run_http_server(pipeline, opts);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
