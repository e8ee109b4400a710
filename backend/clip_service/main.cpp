#include "application/clip_service.hpp"
#include "application/job_pipeline.hpp"
#include "infrastructure/history_log.hpp"
#include "infrastructure/in_memory_job_repository.hpp"
#include "infrastructure/s3_object_store.hpp"
#include "infrastructure/ytdlp_fetcher.hpp"
#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#ifdef CLIP_SERVICE_WITH_GRPC
#include "interface/clip_service_impl.hpp"
#include <grpcpp/server_builder.h>
#endif
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();
    const auto& server_cfg = cfg.getServer();
    const auto& store_cfg = cfg.getObjectStore();
    const auto& fetcher_cfg = cfg.getFetcher();

    std::filesystem::create_directories(fetcher_cfg.staging_dir);

    auto repository = std::make_shared<clip_service::InMemoryJobRepository>();
    auto history = std::make_shared<clip_service::HistoryLog>();
    auto fetcher = std::make_shared<clip_service::YtDlpFetcher>(fetcher_cfg);
    auto store = std::make_shared<clip_service::S3ObjectStore>(store_cfg);

    auto pipeline = std::make_shared<clip_service::JobPipeline>(
      repository, history, fetcher, store,
      clip_service::PipelineSettings{
        .staging_dir = fetcher_cfg.staging_dir,
        .key_prefix = store_cfg.key_prefix,
        .url_ttl = store_cfg.url_ttl
      });

    auto service = std::make_shared<clip_service::ClipService>(
      repository, history, pipeline, store, cfg.getJobs());

#ifdef CLIP_SERVICE_WITH_GRPC
    clip_service::ClipServiceImpl grpc_service(service);
    std::unique_ptr<grpc::Server> grpc_server;
    if (server_cfg.grpc_port != 0) {
      grpc::ServerBuilder builder;
      builder.AddListeningPort(cfg.getGrpcIpPort(), grpc::InsecureServerCredentials());
      builder.RegisterService(&grpc_service);
      grpc_server = builder.BuildAndStart();
      if (!grpc_server) {
        throw std::runtime_error("Failed to start gRPC server on " + cfg.getGrpcIpPort());
      }
      std::cout << "gRPC Server listening on " << cfg.getGrpcIpPort() << std::endl;
    }
    std::thread grpc_thread([&grpc_server]() {
      if (grpc_server) {
        grpc_server->Wait();
      }
    });
#endif

    // Start REST API server
    boost::asio::io_context ioc{1};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(server_cfg.host),
      server_cfg.port
    };

    common::CorsPolicy cors{server_cfg.allow_all_origins, server_cfg.cors_origins};
    auto api_handler = std::make_shared<clip_service::RestApiHandler>(
      service, cors, server_cfg.public_dir);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, server_cfg.body_limit};

    std::cout << "HTTP Server listening on " << server_cfg.host << ":" << http_server.port()
              << std::endl;

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    http_server.run();
    ioc.run();

    // 先停止接收请求, 再取消并等待正在执行的任务
#ifdef CLIP_SERVICE_WITH_GRPC
    if (grpc_server) {
      grpc_server->Shutdown();
    }
    if (grpc_thread.joinable()) {
      grpc_thread.join();
    }
#endif
    service->shutdown();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
