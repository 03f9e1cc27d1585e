#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace convintel::runtime::config {
class RuntimeConfig;
}

namespace convintel::observability {

inline constexpr std::string_view kServiceName    = "convintel";
inline constexpr std::string_view kServiceVersion = "0.1.0";

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{kServiceName};
  std::string   environment{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  double        sample_ratio{1.0};
};

OtlpConfig OtlpConfigFromRuntime(const convintel::runtime::config::RuntimeConfig& config);

/*
  Endpoint precedence:
    1. configured otlp_endpoint
    2. OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT
    3. OTEL_EXPORTER_OTLP_ENDPOINT
    4. collector default for the transport
*/
std::string ResolveEndpoint(const OtlpConfig& config, OtlpSignal signal);

// service.* and deployment.environment; shared by the tracer and meter providers.
std::vector<std::pair<std::string, std::string>> ResourceAttributes(const OtlpConfig& config);

// Leading segment of a span name, lower-cased: "learning.tenant" -> "learning",
// "AdminService.GetPattern" -> "adminservice".
std::string SpanComponent(std::string_view span_name);

// Span attribute keys without a namespace land under "convintel.".
std::string QualifiedAttributeKey(std::string_view key);

} // namespace convintel::observability
