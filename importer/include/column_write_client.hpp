#pragma once

#include "clients.hpp"
#include "config/config_manager.hpp"
#include "write_service.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>

namespace tsimport {
namespace importer {

// Domain request -> wire message
rpc::WriteRequest to_proto(const WriteRequest& request);

class GrpcColumnWriteClient : public ColumnWriteClient {
public:
    explicit GrpcColumnWriteClient(const config::ConnectionConfig& config);
    GrpcColumnWriteClient(std::shared_ptr<rpc::WriteService::StubInterface> stub, int timeout_ms);

    WriteResponse write(const utils::RequestContext& ctx, const WriteRequest& request) override;

private:
    std::shared_ptr<rpc::WriteService::StubInterface> stub_;
    int timeout_ms_;
};

} // namespace importer
} // namespace tsimport
