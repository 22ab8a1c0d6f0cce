#include "../../gateway/command_gateway.hpp"
#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace mup1gw {
namespace http {

namespace {
constexpr const char *kMethodField = "method";
constexpr const char *kDeviceField = "device";
constexpr const char *kUploadField = "input_file";
}  // namespace

//=============================================================================
// POST /api/run-mup1cc
//=============================================================================
void HttpServer::handle_post_run(const httplib::Request &req, httplib::Response &res) {
    try {
        gateway::InvocationRequest request;

        // Required fields; an empty value counts as missing
        auto method = form_field(req, kMethodField);
        if (!method || method->empty()) {
            send_json(res, StatusCode::UNPROCESSABLE,
                      make_error_response(std::string("Missing required form field: ") + kMethodField));
            return;
        }
        auto device = form_field(req, kDeviceField);
        if (!device || device->empty()) {
            send_json(res, StatusCode::UNPROCESSABLE,
                      make_error_response(std::string("Missing required form field: ") + kDeviceField));
            return;
        }

        request.method = *method;
        request.device = *device;
        request.upload = form_upload(req, kUploadField);

        if (request.upload) {
            LOG_DEBUG("[HTTP] Upload '" << request.upload->filename << "' (" << request.upload->content.size()
                                        << " bytes)");
        }

        const gateway::GatewayResponse response = gateway_.handle(request);
        LOG_DEBUG("[HTTP] Run " << request.method << " on " << request.device << " -> "
                                << status_code_to_string(response.status));
        send_json(res, response.status, response.body);
    } catch (const std::exception &e) {
        LOG_ERROR("[HTTP] Run request failed: " << e.what());
        send_json(res, StatusCode::INTERNAL, make_error_response(e.what()));
    }
}

}  // namespace http
}  // namespace mup1gw
