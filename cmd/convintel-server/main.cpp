#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/orchestration/interval_job_runner.hpp"
#if CONVINTEL_WITH_GRPC
#include "internal/grpc/admin_server.hpp"
#include "internal/runtime/server.hpp"
#endif

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: convintel-server <config.yaml> OR convintel-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = convintel::config::ConfigLoader::LoadFromYaml(config_path);

    convintel::observability::InitializeTracing(config);
    convintel::observability::InitializeMetrics(config);
    convintel::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = convintel::factory::Build(config);

    // ------------------------------------------------------------
    // Schedule recurring learning and health jobs
    // ------------------------------------------------------------
    convintel::orchestration::IntervalJobRunner jobs(app.settings.scheduler.run_on_start);
    convintel::factory::RegisterJobs(jobs, app);

    // Register signal handlers before starting anything to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    jobs.Start();

#if CONVINTEL_WITH_GRPC
    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<convintel::grpc::AdminServer>(app.admin_service));

    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();
    convintel::runtime::Server server(bind_address, std::move(services));
    server.Start();
#endif

    CONVINTEL_LOG_INFO("Conversion intelligence service started",
                       {convintel::observability::IntField("learning_interval_hours", app.settings.scheduler.learning_interval.count()),
                        convintel::observability::IntField("health_interval_hours", app.settings.scheduler.health_interval.count())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CONVINTEL_LOG_INFO("Shutting down conversion intelligence service");

#if CONVINTEL_WITH_GRPC
    server.Stop();
#endif
    jobs.Stop();
    app.pool->Stop();

    convintel::observability::ShutdownLogging();
    convintel::observability::ShutdownMetrics();
    convintel::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    CONVINTEL_LOG_ERROR("Fatal error", {convintel::observability::StringField("error", e.what())});
    convintel::observability::ShutdownLogging();
    convintel::observability::ShutdownMetrics();
    convintel::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
