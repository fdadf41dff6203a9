#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast.hpp>

#include <qng/common/util.hpp>
#include <qng/common/errors.hpp>

namespace qng
{

// Response body is passed on for every status the server answered with,
// a non-200 status is reported as HTTP_POST.
using HttpCallback =
    std::function<void(qng::ErrorCode, uint32_t, const std::string&)>;

class HttpClient : public std::enable_shared_from_this<qng::HttpClient>
{
public:
    HttpClient(boost::asio::io_service&);
    HttpClient(const HttpClient&) = delete;
    std::shared_ptr<qng::HttpClient> Shared();

    bool CheckUpdateUsed();
    qng::ErrorCode Post(const qng::Url&, const std::string&,
                        const qng::HttpCallback&);

    void Resolve();
    void OnResolve(const boost::system::error_code&,
                   boost::asio::ip::tcp::resolver::iterator);
    void OnConnect(const boost::system::error_code&);
    void OnSslHandshake(const boost::system::error_code&);
    void OnWrite(const boost::system::error_code&, size_t);
    void OnRead(const boost::system::error_code&, size_t);
    void Write();
    void Read();

    boost::asio::io_service& service_;

    static char constexpr CA_FILE[] = "cacert.pem";

private:
    bool CheckUrl_() const;
    void Callback_(qng::ErrorCode, uint32_t = 0, const std::string& = "");
    bool LoadCert_();
    void PreparePostReq_(const std::string&);

    std::mutex mutex_;
    bool used_;
    qng::Url url_;
    qng::HttpCallback callback_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ssl::context ctx_;
    boost::beast::flat_buffer buffer_;
    std::shared_ptr<boost::asio::ip::tcp::socket> socket_;
    std::shared_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>
        ssl_stream_;
    std::shared_ptr<
        boost::beast::http::request<boost::beast::http::string_body>>
        post_req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;
};
}  // namespace qng
