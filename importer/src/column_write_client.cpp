#include "column_write_client.hpp"
#include "network/network_exception.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <sstream>
#include <type_traits>

namespace tsimport {
namespace importer {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConnectionException("failed to read TLS material: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::shared_ptr<grpc::ChannelCredentials> make_credentials(const config::ConnectionConfig& config) {
    if (!config.enable_tls) {
        return grpc::InsecureChannelCredentials();
    }
    grpc::SslCredentialsOptions options;
    if (!config.ca_cert.empty()) {
        options.pem_root_certs = read_file(config.ca_cert);
    }
    if (!config.cert.empty()) {
        options.pem_cert_chain = read_file(config.cert);
    }
    if (!config.cert_key.empty()) {
        options.pem_private_key = read_file(config.cert_key);
    }
    return grpc::SslCredentials(options);
}

void fill_value(const types::FieldValue& value, rpc::Value* out) {
    std::visit([out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            out->set_string_value(v);
        } else if constexpr (std::is_same_v<T, double>) {
            out->set_float_value(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out->set_int_value(v);
        } else {
            out->set_bool_value(v);
        }
    }, value);
}

} // namespace

rpc::WriteRequest to_proto(const WriteRequest& request) {
    rpc::WriteRequest message;
    message.set_database(request.database);
    message.set_retention_policy(request.retention_policy);
    message.set_username(request.username);
    message.set_password(request.password);

    for (const auto& record : request.records) {
        auto* rec = message.add_records();
        rec->set_measurement(record.measurement);
        rec->set_min_time(record.min_time);
        rec->set_max_time(record.max_time);
        rec->set_row_count(static_cast<uint32_t>(record.row_count));
        for (const auto& column : record.columns) {
            auto* col = rec->add_columns();
            col->set_name(column.name);
            col->set_type(static_cast<rpc::ColumnType>(static_cast<int>(column.type)));
            for (const auto& cell : column.values) {
                auto* value = col->add_values();
                if (cell) {
                    fill_value(*cell, value);
                }
            }
        }
    }
    return message;
}

GrpcColumnWriteClient::GrpcColumnWriteClient(const config::ConnectionConfig& config)
    : timeout_ms_(config.timeout_ms) {
    std::string target = config.host + ":" + std::to_string(config.column_write_port);
    auto channel = grpc::CreateChannel(target, make_credentials(config));
    stub_ = rpc::WriteService::NewStub(channel);
    TSIMPORT_LOG_DEBUG("Column write channel created for {}", target);
}

GrpcColumnWriteClient::GrpcColumnWriteClient(std::shared_ptr<rpc::WriteService::StubInterface> stub,
                                             int timeout_ms)
    : stub_(std::move(stub)), timeout_ms_(timeout_ms) {}

WriteResponse GrpcColumnWriteClient::write(const utils::RequestContext& ctx, const WriteRequest& request) {
    if (ctx.is_cancelled()) {
        throw CancelledException("column write cancelled");
    }
    if (ctx.expired()) {
        throw TimeoutException("column write deadline exceeded");
    }

    grpc::ClientContext context;
    auto remaining = ctx.remaining(std::chrono::milliseconds(timeout_ms_));
    context.set_deadline(std::chrono::system_clock::now() + remaining);

    rpc::WriteRequest message = to_proto(request);
    rpc::WriteResponse reply;
    grpc::Status status = stub_->Write(&context, message, &reply);

    if (!status.ok()) {
        if (status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED) {
            throw TimeoutException("column write timed out: " + status.error_message());
        }
        if (status.error_code() == grpc::StatusCode::CANCELLED) {
            throw CancelledException("column write cancelled: " + status.error_message());
        }
        throw ConnectionException("column write rpc failed: " + status.error_message());
    }

    WriteResponse response;
    response.code = reply.code();
    response.message = reply.message();
    return response;
}

} // namespace importer
} // namespace tsimport
