#include "internal/observability/otlp.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace convintel::observability {

namespace {

const char* SignalEndpointVariable(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

const char* SignalPath(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

} // namespace

OtlpConfig OtlpConfigFromRuntime(const convintel::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.environment = observability.environment();
  otlp.endpoint    = observability.otlp_endpoint();
  otlp.transport =
      observability.transport() == convintel::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const double ratio = observability.tracing().sample_ratio();
  otlp.sample_ratio  = ratio <= 0.0 ? 1.0 : std::min(ratio, 1.0);
  return otlp;
}

std::string ResolveEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv(SignalEndpointVariable(signal))) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return std::string("http://localhost:4318") + SignalPath(signal);
  }
  return "localhost:4317";
}

std::vector<std::pair<std::string, std::string>> ResourceAttributes(const OtlpConfig& config) {
  std::vector<std::pair<std::string, std::string>> attrs = {
      {"service.name", config.service_name},
      {"service.namespace", "conversion-intelligence"},
      {"service.version", std::string(kServiceVersion)},
  };
  if (!config.environment.empty()) {
    attrs.emplace_back("deployment.environment", config.environment);
  }
  return attrs;
}

std::string SpanComponent(std::string_view span_name) {
  const auto  dot = span_name.find('.');
  std::string component(span_name.substr(0, dot));
  std::transform(component.begin(), component.end(), component.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return component;
}

std::string QualifiedAttributeKey(std::string_view key) {
  if (key.find('.') != std::string_view::npos) {
    return std::string(key);
  }
  return "convintel." + std::string(key);
}

} // namespace convintel::observability
