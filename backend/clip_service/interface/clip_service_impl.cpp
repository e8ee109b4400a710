#include "clip_service_impl.hpp"
#include "interface/job_json.hpp"

namespace clip_service {

namespace {

void fillJob(const Job& job, clip::Job* out) {
  out->set_job_id(job.id);
  out->set_status(toString(job.status));
  out->set_progress(job.progress);
  out->set_type(toString(job.media_type));
  out->set_quality(job.quality);
  out->set_url(job.source_url);
  out->set_platform(job.platform);
  out->set_resource_id(job.resource_id);
  if (job.result_url) out->set_download_url(*job.result_url);
  if (job.result_key) out->set_file_key(*job.result_key);
  if (job.file_size) out->set_file_size(*job.file_size);
  if (job.error_message) out->set_error(*job.error_message);
  if (job.error_kind) out->set_error_kind(toString(*job.error_kind));
  out->set_created_at_ms(epochMillis(job.created_at));
  out->set_updated_at_ms(epochMillis(job.updated_at));
}

}

ClipServiceImpl::ClipServiceImpl(std::shared_ptr<ClipService> service)
  : service_(service) {}

grpc::Status ClipServiceImpl::ParseSource(grpc::ServerContext* context,
                                          const clip::ParseSourceRequest* request,
                                          clip::ParseSourceResponse* response) {
  auto result = service_->parseSource(request->url());

  if (!result) {
    response->set_success(false);
    response->set_message(result.error().message);
    return grpc::Status::OK;
  }

  response->set_success(true);
  response->set_platform(result->platform);
  response->set_resource_id(result->resource_id);
  return grpc::Status::OK;
}

grpc::Status ClipServiceImpl::SubmitDownload(grpc::ServerContext* context,
                                             const clip::SubmitDownloadRequest* request,
                                             clip::SubmitDownloadResponse* response) {
  DownloadRequest download;
  download.url = request->url();
  if (!request->type().empty()) download.type = request->type();
  if (!request->quality().empty()) download.quality = request->quality();
  download.platform = request->platform();
  download.resource_id = request->resource_id();

  auto result = service_->submitDownload(download);

  if (!result) {
    response->set_success(false);
    response->set_message(result.error().message);
    response->set_error_kind(toString(result.error().kind));
    return grpc::Status::OK;
  }

  response->set_success(true);
  response->set_job_id(*result);
  response->set_estimated_sec(30);
  return grpc::Status::OK;
}

grpc::Status ClipServiceImpl::GetJobStatus(grpc::ServerContext* context,
                                           const clip::GetJobStatusRequest* request,
                                           clip::GetJobStatusResponse* response) {
  auto result = service_->getJob(request->job_id());

  if (!result) {
    response->set_success(false);
    response->set_message(result.error().message);
    return grpc::Status::OK;
  }

  response->set_success(true);
  fillJob(*result, response->mutable_job());
  return grpc::Status::OK;
}

grpc::Status ClipServiceImpl::CancelJob(grpc::ServerContext* context,
                                        const clip::CancelJobRequest* request,
                                        clip::CancelJobResponse* response) {
  auto result = service_->cancelJob(request->job_id());

  if (!result) {
    response->set_success(false);
    response->set_message(result.error().message);
    return grpc::Status::OK;
  }

  response->set_success(true);
  return grpc::Status::OK;
}

grpc::Status ClipServiceImpl::ListHistory(grpc::ServerContext* context,
                                          const clip::ListHistoryRequest* request,
                                          clip::ListHistoryResponse* response) {
  response->set_success(true);
  for (const auto& entry : service_->listHistory()) {
    auto* item = response->add_items();
    fillJob(entry.job, item->mutable_job());
    item->set_at_ms(epochMillis(entry.captured_at));
  }
  return grpc::Status::OK;
}

}
