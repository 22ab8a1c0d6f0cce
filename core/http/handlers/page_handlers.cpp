#include "../errors.hpp"
#include "../server.hpp"
#include "../static_page.hpp"

namespace mup1gw {
namespace http {

//=============================================================================
// GET /
//=============================================================================
void HttpServer::handle_get_index(const httplib::Request &, httplib::Response &res) {
    res.status = status_code_to_http(StatusCode::OK);
    res.set_content(kIndexHtml, "text/html; charset=utf-8");
}

}  // namespace http
}  // namespace mup1gw
