#pragma once
#include "application/clip_service.hpp"
#include "clip_service.grpc.pb.h"
#include <grpcpp/grpcpp.h>

namespace clip_service {
class ClipServiceImpl final : public clip::ClipService::Service {
public:
  ClipServiceImpl(std::shared_ptr<ClipService> service);

  grpc::Status ParseSource(grpc::ServerContext* context,
                           const clip::ParseSourceRequest* request,
                           clip::ParseSourceResponse* response) override;

  grpc::Status SubmitDownload(grpc::ServerContext* context,
                              const clip::SubmitDownloadRequest* request,
                              clip::SubmitDownloadResponse* response) override;

  grpc::Status GetJobStatus(grpc::ServerContext* context,
                            const clip::GetJobStatusRequest* request,
                            clip::GetJobStatusResponse* response) override;

  grpc::Status CancelJob(grpc::ServerContext* context,
                         const clip::CancelJobRequest* request,
                         clip::CancelJobResponse* response) override;

  grpc::Status ListHistory(grpc::ServerContext* context,
                           const clip::ListHistoryRequest* request,
                           clip::ListHistoryResponse* response) override;
private:
  std::shared_ptr<ClipService> service_;
};
}
