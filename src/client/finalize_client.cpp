#include "client/finalize_client.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <iostream>

namespace funnel::client {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

FunnelError error_from_response(unsigned status, const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    std::string message = "relay answered HTTP " + std::to_string(status);
    ErrorCode code = status == 404 ? ErrorCode::UnknownSession : ErrorCode::ConnectionFailure;

    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("message") && parsed["message"].is_string()) {
            message = parsed["message"].get<std::string>();
        }
        if (parsed.contains("error") && parsed["error"].is_string()) {
            if (auto known = error_code_from_string(parsed["error"].get<std::string>())) {
                code = *known;
            }
        }
    }
    return FunnelError(code, message);
}

BeastFinalizeClient::BeastFinalizeClient(std::string host, std::string port, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(std::move(port)), timeout_(timeout) {}

AssembledTranscript BeastFinalizeClient::finalize(const std::string& session_id, uint64_t audio_bytes_sent) {
    const std::string target = "/recordings/" + session_id + "/done";
    std::cout << "[finalize] POST " << target << " (" << audio_bytes_sent << " bytes streamed)" << std::endl;

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;

    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host_ + ":" + port_);
    req.set(http::field::user_agent, "funnel-record");
    req.set(http::field::content_type, "application/json");
    req.body() = make_finalize_request(audio_bytes_sent);
    req.prepare_payload();

    http::response<http::string_body> res;
    boost::system::error_code result_ec;

    // tcp_stream deadlines only apply to asynchronous operations, so the
    // request runs as a short async chain on a private io_context.
    try {
        auto endpoints = resolver.resolve(host_, port_);
        stream.expires_after(timeout_);
        stream.async_connect(endpoints, [&](boost::system::error_code ec, const tcp::endpoint&) {
            if (ec) { result_ec = ec; return; }
            http::async_write(stream, req, [&](boost::system::error_code ec, std::size_t) {
                if (ec) { result_ec = ec; return; }
                http::async_read(stream, buffer, res, [&](boost::system::error_code ec, std::size_t) {
                    result_ec = ec;
                });
            });
        });
        ioc.run();
    } catch (const std::exception& e) {
        throw FunnelError(ErrorCode::ConnectionFailure, std::string("finalize request failed: ") + e.what());
    }

    if (result_ec == beast::error::timeout) {
        throw FunnelError(ErrorCode::FinalizeTimeout,
                          "no finalize response within " + std::to_string(timeout_.count()) + "ms");
    }
    if (result_ec) {
        throw FunnelError(ErrorCode::ConnectionFailure, "finalize request failed: " + result_ec.message());
    }

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    if (res.result_int() != 200) {
        throw error_from_response(res.result_int(), res.body());
    }

    try {
        return json::parse(res.body()).get<AssembledTranscript>();
    } catch (const json::exception& e) {
        throw FunnelError(ErrorCode::ProtocolError, std::string("malformed finalize response: ") + e.what());
    }
}

} // namespace funnel::client
