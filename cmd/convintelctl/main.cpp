#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "convintel/services/v1/admin_service.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/pattern_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using namespace convintel::services::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  convintelctl <config.yaml> get <tenant> <who|what|when|how>\n"
            << "  convintelctl <config.yaml> list <tenant>\n"
            << "  convintelctl <config.yaml> history <tenant> <who|what|when|how> [limit]\n"
            << "  convintelctl <config.yaml> learn [tenant]\n"
            << "  convintelctl <config.yaml> backfill <tenant>\n"
            << "  convintelctl <config.yaml> candidates\n"
            << "  convintelctl <config.yaml> weights <tenant>\n"
            << "  convintelctl <config.yaml> health\n";
}

static std::optional<convintel::v1::PatternType> ParseType(const std::string& value) {
  auto parsed = convintel::model::ParsePatternType(value);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  return convintel::model::ToProto(*parsed);
}

static int Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.ToString() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = convintel::config::ConfigLoader::LoadFromYaml(config_path);
    convintel::observability::InitializeLogging(config);

    auto  app     = convintel::factory::Build(config);
    auto& service = *app.admin_service;

    int rc = 1;

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 5) return 1;

      auto type = ParseType(argv[4]);
      if (!type.has_value()) {
        std::cerr << "unsupported pattern type: " << argv[4] << "\n";
        return 1;
      }

      GetPatternRequest req;
      req.set_tenant_id(argv[3]);
      req.set_pattern_type(*type);
      rc = Print(service.GetPattern(req));
    }

    // ------------------------------------------------------------

    else if (cmd == "list") {
      if (argc < 4) return 1;

      ListPatternsRequest req;
      req.set_tenant_id(argv[3]);
      rc = Print(service.ListPatterns(req));
    }

    // ------------------------------------------------------------

    else if (cmd == "history") {
      if (argc < 5) return 1;

      auto type = ParseType(argv[4]);
      if (!type.has_value()) {
        std::cerr << "unsupported pattern type: " << argv[4] << "\n";
        return 1;
      }

      GetPatternHistoryRequest req;
      req.set_tenant_id(argv[3]);
      req.set_pattern_type(*type);
      req.set_limit(argc >= 6 ? static_cast<uint32_t>(std::stoul(argv[5])) : 0);
      rc = Print(service.GetPatternHistory(req));
    }

    // ------------------------------------------------------------

    else if (cmd == "learn") {
      TriggerLearningRequest req;
      if (argc >= 4) req.set_tenant_id(argv[3]);
      rc = Print(service.TriggerLearning(req));
    }

    // ------------------------------------------------------------

    else if (cmd == "backfill") {
      if (argc < 4) return 1;

      TriggerBackfillRequest req;
      req.set_tenant_id(argv[3]);
      rc = Print(service.TriggerBackfill(req));
    }

    // ------------------------------------------------------------

    else if (cmd == "candidates") {
      for (const auto& tenant_id : app.orchestrator->FindBackfillCandidates(convintel::util::Now())) {
        std::cout << tenant_id << "\n";
      }
      rc = 0;
    }

    // ------------------------------------------------------------

    else if (cmd == "weights") {
      if (argc < 4) return 1;

      const auto weights = app.weight_cache->GetWeightsForScoring(argv[3], convintel::util::Now());
      std::cout << "data_quality=" << weights.data_quality << "\n";
      std::cout << "authority=" << weights.authority << "\n";
      std::cout << "company_fit=" << weights.company_fit << "\n";
      std::cout << "timing=" << weights.timing << "\n";
      rc = 0;
    }

    // ------------------------------------------------------------

    else if (cmd == "health") {
      rc = Print(service.RunHealthCheck(RunHealthCheckRequest{}));
    }

    else {
      Usage();
    }

    app.pool->Stop();
    convintel::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    convintel::observability::ShutdownLogging();
    return 2;
  }
}
