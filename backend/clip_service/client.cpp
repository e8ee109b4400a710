#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include "common/config/config.hpp"
#include "clip_service.grpc.pb.h"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;

namespace {

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " <url> [video|audio] [quality]\n";
}

}

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 2;
  }

  // 创建客户端
  const auto& cfg = config::Config::getInstance();

  auto channel = grpc::CreateChannel(cfg.getGrpcIpPort(), grpc::InsecureChannelCredentials());
  auto stub = clip::ClipService::NewStub(channel);

  // 提交下载任务
  clip::SubmitDownloadRequest request;
  request.set_url(argv[1]);
  request.set_type(argc > 2 ? argv[2] : "video");
  request.set_quality(argc > 3 ? argv[3] : "1080p");

  clip::SubmitDownloadResponse submitted;
  {
    ClientContext context;
    Status status = stub->SubmitDownload(&context, request, &submitted);
    if (!status.ok()) {
      std::cout << "RPC failed: " << status.error_message() << "\n";
      return 1;
    }
  }
  if (!submitted.success()) {
    std::cout << "Submit failed (" << submitted.error_kind() << "): " << submitted.message() << "\n";
    return 1;
  }
  std::cout << "Queued job " << submitted.job_id() << "\n";

  // 轮询直到任务结束
  int last_progress = -1;
  while (true) {
    clip::GetJobStatusRequest status_request;
    status_request.set_job_id(submitted.job_id());
    clip::GetJobStatusResponse response;
    ClientContext context;
    Status status = stub->GetJobStatus(&context, status_request, &response);

    if (!status.ok()) {
      std::cout << "RPC failed: " << status.error_message() << "\n";
      return 1;
    }
    if (!response.success()) {
      std::cout << "Status failed: " << response.message() << "\n";
      return 1;
    }

    const auto& job = response.job();
    if (job.progress() != last_progress) {
      last_progress = job.progress();
      std::cout << "- " << job.status() << " " << job.progress() << "%\n";
    }
    if (job.status() == "done") {
      std::cout << "Download URL: " << job.download_url() << "\n"
                << "Size: " << job.file_size() << " bytes\n";
      return 0;
    }
    if (job.status() == "error") {
      std::cout << "Job failed (" << job.error_kind() << "): " << job.error() << "\n";
      return 1;
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
}
