#pragma once
#include <memory>
#include "proto/review.grpc.pb.h"
#include "review/ReviewEngine.hpp"

namespace pyguard::service {

// Streams loop transitions of one analysis session to the caller.
class ReviewServiceImpl final : public pyguard::ReviewService::Service {
public:
    explicit ReviewServiceImpl(std::shared_ptr<review::ReviewEngine> engine) : engine_(std::move(engine)) {}

    grpc::Status SubmitAnalysis(grpc::ServerContext* context,
                                const AnalysisRequest* request,
                                grpc::ServerWriter<AnalysisEvent>* writer) override;

private:
    std::shared_ptr<review::ReviewEngine> engine_;
};

}
