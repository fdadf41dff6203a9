#include <qng/secure/http.hpp>

#include <boost/filesystem.hpp>
#include <qng/common/log.hpp>

char constexpr qng::HttpClient::CA_FILE[];

qng::HttpClient::HttpClient(boost::asio::io_service& service)
    : service_(service),
      used_(false),
      resolver_(service),
      ctx_(boost::asio::ssl::context::tlsv12_client)
{
}

std::shared_ptr<qng::HttpClient> qng::HttpClient::Shared()
{
    return shared_from_this();
}

bool qng::HttpClient::CheckUpdateUsed()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (used_)
    {
        return true;
    }
    used_ = true;
    return false;
}

qng::ErrorCode qng::HttpClient::Post(const qng::Url& url,
                                     const std::string& body,
                                     const qng::HttpCallback& callback)
{
    IF_ERROR_RETURN(CheckUpdateUsed(), qng::ErrorCode::HTTP_CLIENT_USED);

    url_ = url;
    callback_ = callback;
    IF_ERROR_RETURN(CheckUrl_(), qng::ErrorCode::INVALID_URL);
    if (url_.Ssl())
    {
        IF_ERROR_RETURN(LoadCert_(), qng::ErrorCode::LOAD_CERT);
    }
    PreparePostReq_(body);

    Resolve();
    return qng::ErrorCode::SUCCESS;
}

void qng::HttpClient::Resolve()
{
    std::shared_ptr<qng::HttpClient> client(Shared());
    boost::asio::ip::tcp::resolver::query query(url_.host_,
                                                std::to_string(url_.port_));
    resolver_.async_resolve(
        query, [client](const boost::system::error_code& ec,
                        boost::asio::ip::tcp::resolver::iterator results) {
            client->OnResolve(ec, results);
        });
}

void qng::HttpClient::OnResolve(
    const boost::system::error_code& ec,
    boost::asio::ip::tcp::resolver::iterator results)
{
    if (ec)
    {
        qng::Log::Network(qng::ToString("Failed to resolve ", url_.host_, ": ",
                                        ec.message()));
        Callback_(qng::ErrorCode::DNS_RESOLVE, 0, ec.message());
        return;
    }

    std::shared_ptr<qng::HttpClient> client(Shared());
    if (!url_.Ssl())
    {
        socket_ = std::make_shared<boost::asio::ip::tcp::socket>(service_);
        boost::asio::async_connect(
            *socket_, results,
            [client](const boost::system::error_code& ec,
                     boost::asio::ip::tcp::resolver::iterator) {
                client->OnConnect(ec);
            });
    }
    else
    {
        ssl_stream_ = std::make_shared<
            boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>(service_,
                                                                    ctx_);
        boost::asio::async_connect(
            ssl_stream_->next_layer(), results,
            [client](const boost::system::error_code& ec,
                     boost::asio::ip::tcp::resolver::iterator) {
                client->OnConnect(ec);
            });
    }
}

void qng::HttpClient::OnConnect(const boost::system::error_code& ec)
{
    if (ec)
    {
        qng::Log::Network(qng::ToString("Failed to connect ", url_.String(),
                                        ": ", ec.message()));
        Callback_(qng::ErrorCode::TCP_CONNECT, 0, ec.message());
        return;
    }

    if (url_.Ssl())
    {
        // SNI hostname, many hosts refuse the handshake without it
        if (!SSL_set_tlsext_host_name(ssl_stream_->native_handle(),
                                      url_.host_.c_str()))
        {
            qng::Log::Network(
                qng::ToString("Failed to set SNI: ", url_.host_));
            Callback_(qng::ErrorCode::SET_SSL_SNI, 0, url_.host_);
            return;
        }
        ssl_stream_->set_verify_mode(
            boost::asio::ssl::verify_peer
            | boost::asio::ssl::verify_fail_if_no_peer_cert);
        ssl_stream_->set_verify_callback(
            boost::asio::ssl::rfc2818_verification(url_.host_));
        std::shared_ptr<qng::HttpClient> client(Shared());
        ssl_stream_->async_handshake(
            boost::asio::ssl::stream_base::client,
            [client](const boost::system::error_code& ec) {
                client->OnSslHandshake(ec);
            });
    }
    else
    {
        Write();
    }
}

void qng::HttpClient::OnSslHandshake(const boost::system::error_code& ec)
{
    if (ec)
    {
        qng::Log::Network(
            qng::ToString("Ssl handshake failed: ", ec.message()));
        Callback_(qng::ErrorCode::SSL_HANDSHAKE, 0, ec.message());
        return;
    }

    Write();
}

void qng::HttpClient::OnWrite(const boost::system::error_code& ec, size_t size)
{
    if (ec || size == 0)
    {
        qng::Log::Network(
            qng::ToString("Failed to write stream: ", ec.message()));
        Callback_(qng::ErrorCode::WRITE_STREAM, 0, ec.message());
        return;
    }
    Read();
}

void qng::HttpClient::OnRead(const boost::system::error_code& ec, size_t size)
{
    if (ec)
    {
        qng::Log::Network(
            qng::ToString("Failed to read stream: ", ec.message()));
        Callback_(qng::ErrorCode::READ_STREAM, 0, ec.message());
        return;
    }

    uint32_t status = static_cast<uint32_t>(res_.result());
    if (res_.result() != boost::beast::http::status::ok)
    {
        qng::Log::Network(qng::ToString("Http post to ", url_.String(),
                                        " failed, status: ", status));
        Callback_(qng::ErrorCode::HTTP_POST, status, res_.body());
    }
    else
    {
        Callback_(qng::ErrorCode::SUCCESS, status, res_.body());
    }

    if (url_.Ssl())
    {
        std::shared_ptr<qng::HttpClient> client(Shared());
        ssl_stream_->async_shutdown(
            [client](const boost::system::error_code&) {});
    }
    else
    {
        boost::system::error_code ignore;
        socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
}

void qng::HttpClient::Write()
{
    std::shared_ptr<qng::HttpClient> client(Shared());
    if (url_.Ssl())
    {
        boost::beast::http::async_write(
            *ssl_stream_, *post_req_,
            [client](const boost::system::error_code& ec, size_t size) {
                client->OnWrite(ec, size);
            });
    }
    else
    {
        boost::beast::http::async_write(
            *socket_, *post_req_,
            [client](const boost::system::error_code& ec, size_t size) {
                client->OnWrite(ec, size);
            });
    }
}

void qng::HttpClient::Read()
{
    std::shared_ptr<qng::HttpClient> client(Shared());
    if (url_.Ssl())
    {
        boost::beast::http::async_read(
            *ssl_stream_, buffer_, res_,
            [client](const boost::system::error_code& ec, size_t size) {
                client->OnRead(ec, size);
            });
    }
    else
    {
        boost::beast::http::async_read(
            *socket_, buffer_, res_,
            [client](const boost::system::error_code& ec, size_t size) {
                client->OnRead(ec, size);
            });
    }
}

bool qng::HttpClient::CheckUrl_() const
{
    if (!url_ || url_.CheckProtocol())
    {
        return true;
    }
    return false;
}

void qng::HttpClient::Callback_(qng::ErrorCode error_code, uint32_t status,
                                const std::string& response)
{
    if (callback_)
    {
        auto callback = callback_;
        callback_ = nullptr;
        callback(error_code, status, response);
    }
}

bool qng::HttpClient::LoadCert_()
{
    boost::system::error_code ec;
    if (boost::filesystem::exists(qng::HttpClient::CA_FILE))
    {
        ctx_.load_verify_file(qng::HttpClient::CA_FILE, ec);
    }
    else
    {
        ctx_.set_default_verify_paths(ec);
    }

    if (ec)
    {
        qng::Log::Network(
            qng::ToString("Failed to load certificates: ", ec.message()));
        return true;
    }
    return false;
}

void qng::HttpClient::PreparePostReq_(const std::string& body)
{
    post_req_ = std::make_shared<
        boost::beast::http::request<boost::beast::http::string_body>>();
    post_req_->method(boost::beast::http::verb::post);
    post_req_->target(url_.path_);
    post_req_->version(11);
    post_req_->insert(boost::beast::http::field::host, url_.host_);
    post_req_->insert(boost::beast::http::field::content_type,
                      "application/json");
    post_req_->body() = body;
    post_req_->prepare_payload();
}
