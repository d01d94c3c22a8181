#include <utility>
#include <chrono>
#include <stdexcept>
#include <boost/asio/redirect_error.hpp>
#include "FeedClient.hpp"

FeedClient::FeedClient(boost::asio::io_context& ioc, FeedEndpoint endpoint, std::string key)
    : ioContext(ioc)
    , sslContext(boost::asio::ssl::context::tlsv12_client)
    , endpoint(std::move(endpoint))
    , apiKey(std::move(key))
{
    sslContext.set_options(
        boost::asio::ssl::context::default_workarounds
        | boost::asio::ssl::context::no_sslv2
        | boost::asio::ssl::context::single_dh_use
    );

    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
}

void FeedClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()), "Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(endpoint.host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> FeedClient::resolve(boost::asio::ip::tcp::resolver& resolver)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(endpoint.host, endpoint.port, boost::asio::use_awaitable);
    co_return results;
}

boost::asio::awaitable<void> FeedClient::connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);

    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
    co_return;
}

boost::beast::http::request<boost::beast::http::string_body> FeedClient::buildGetRequest() const
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, endpoint.target, 11);
    request.set(boost::beast::http::field::host, endpoint.host);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/x-protobuf");
    if (!apiKey.empty())
        request.set("X-API-Key", apiKey);

    return request;
}

boost::asio::awaitable<void> FeedClient::sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request)
{
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
}

boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> FeedClient::readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::http::response<boost::beast::http::string_body> response;
    boost::beast::flat_buffer buffer;
    co_await boost::beast::http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
}

boost::asio::awaitable<std::string> FeedClient::fetch()
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(ioContext);
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);

    configureTlsStream(stream);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver);
    co_await connect(results, stream);
    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest();
    co_await sendRequest(stream, request);
    boost::beast::http::response<boost::beast::http::string_body> response = co_await readResponse(stream);
    co_await shutdownStream(stream);

    co_return checkedBody(response);
}

std::string FeedClient::checkedBody(Response const& response)
{
    if (response.result() != boost::beast::http::status::ok)
    {
        std::string message = "Feed answered HTTP " + std::to_string(response.result_int());
        auto retry = response.find(boost::beast::http::field::retry_after);
        if (retry != response.end())
            message += " (retry after " + std::string(retry->value()) + "s)";
        throw std::runtime_error(message);
    }

    auto type = response.find(boost::beast::http::field::content_type);
    if (type != response.end() && std::string(type->value()).rfind("text/html", 0) == 0)
        throw std::runtime_error("Feed answered an HTML page instead of feed data");

    if (response.body().empty())
        throw std::runtime_error("Feed answered with an empty body");

    return response.body();
}

boost::asio::awaitable<void> FeedClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::system::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}
