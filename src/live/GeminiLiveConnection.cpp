#include "GeminiLiveConnection.hpp"
#include "SessionErrors.hpp"

#include <cstdio>
#include <future>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

GeminiLiveConnection::GeminiLiveConnection(const GeminiEndpoint& endpoint)
    :endpoint_(endpoint)
    ,ssl_ctx_(ssl::context::tlsv12_client)
    ,ws_(ioc_, ssl_ctx_)
    ,connected_(false)
    ,closed_(false)
    ,connect_cancelled_(false)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

GeminiLiveConnection::~GeminiLiveConnection(){
    close();
}

void GeminiLiveConnection::cancelConnect(){
    connect_cancelled_ = true;
}

void GeminiLiveConnection::connect(const Credential& credential, const SessionConfig& config){
    try{
        handshake(credential, config);
    }catch(const beast::system_error& e){
        throw ConnectionError(std::string("connect to ") + endpoint_.host + " failed: " + e.what());
    }

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    connected_ = true;
    startIoThread();
    printf("Gemini live session ready (model=%s, %s)\n",endpoint_.model.c_str(),config.describe().c_str());
}

// Every step runs asynchronously on ioc_ from this thread, so each one is
// bounded by endpoint_.timeout and can be abandoned by cancelConnect().
void GeminiLiveConnection::handshake(const Credential& credential, const SessionConfig& config){
    beast::error_code ec;
    bool done = false;
    auto finish = [&ec, &done](beast::error_code result){
        ec = result;
        done = true;
    };
    auto check = [&ec](const char* what){
        if(ec){
            throw beast::system_error(ec, what);
        }
    };
    auto abortSocket = [this]{ closeSocket(); };

    tcp::resolver resolver(ioc_);
    tcp::resolver::results_type results;
    resolver.async_resolve(endpoint_.host, endpoint_.port,
        [&](beast::error_code result, tcp::resolver::results_type found){
            results = found;
            finish(result);
        });
    runStep("resolve", done, [&resolver]{ resolver.cancel(); });
    check("resolve");

    done = false;
    beast::get_lowest_layer(ws_).expires_after(endpoint_.timeout);
    beast::get_lowest_layer(ws_).async_connect(results,
        [&](beast::error_code result, tcp::endpoint){ finish(result); });
    runStep("tcp connect", done, abortSocket);
    check("tcp connect");

    if(!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str())){
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
            "SSL_set_tlsext_host_name");
    }
    ws_.next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));

    done = false;
    beast::get_lowest_layer(ws_).expires_after(endpoint_.timeout);
    ws_.next_layer().async_handshake(ssl::stream_base::client, finish);
    runStep("tls handshake", done, abortSocket);
    check("tls handshake");

    // the websocket stream keeps its own timers from here on
    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout timeouts =
        websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = endpoint_.timeout;
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(http::field::user_agent, "livevoice/0.1");
        }
    ));

    done = false;
    ws_.async_handshake(endpoint_.host, endpoint_.path + "?key=" + credential, finish);
    runStep("websocket handshake", done, abortSocket);
    check("websocket handshake");

    done = false;
    ws_.text(true);
    std::string setup = buildSetupMessage(endpoint_.model, config);
    ws_.async_write(net::buffer(setup), [&](beast::error_code result, std::size_t){ finish(result); });
    runStep("setup", done, abortSocket);
    check("setup");

    done = false;
    ws_.async_read(read_buffer_, [&](beast::error_code result, std::size_t){ finish(result); });
    runStep("setup reply", done, abortSocket);
    if(ec){
        throw ConnectionError("no setup reply: " + ec.message());
    }
    std::string reply = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    if(!isSetupComplete(reply)){
        std::string error = serverErrorText(reply);
        throw ConnectionError(error.empty() ? "unexpected setup reply" : error);
    }
}

// Runs ioc_ in short slices until the pending operation completes. On a
// deadline or cancelConnect() it aborts the operation and waits for its
// handler, so nothing still refers to the caller's stack afterwards.
void GeminiLiveConnection::runStep(const char* what, const bool& done, const std::function<void()>& abort){
    auto deadline = std::chrono::steady_clock::now() + endpoint_.timeout;
    bool aborted = false;
    bool cancelled = false;
    while(!done){
        if(!aborted && (connect_cancelled_ || std::chrono::steady_clock::now() >= deadline)){
            cancelled = connect_cancelled_;
            aborted = true;
            abort();
        }
        ioc_.run_for(std::chrono::milliseconds(50));
        if(ioc_.stopped()){
            ioc_.restart();
        }
    }
    if(aborted){
        throw ConnectionError(cancelled ? std::string("connection cancelled") : std::string(what) + " timed out");
    }
    if(endpoint_.verbose){
        printf("%s done\n",what);
    }
}

void GeminiLiveConnection::closeSocket(){
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(ws_).close();
}

void GeminiLiveConnection::startIoThread(){
    work_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc_));
    startRead();
    io_thread_ = std::make_unique<std::thread>([this]{
        ioc_.run();
        if(endpoint_.verbose){
            printf("gemini io thread finished\n");
        }
    });
}

void GeminiLiveConnection::startRead(){
    ws_.async_read(read_buffer_, [this](beast::error_code ec, std::size_t bytes){
        onRead(ec, bytes);
    });
}

void GeminiLiveConnection::onRead(beast::error_code ec, std::size_t bytes){
    if(ec){
        if(closed_){
            return;
        }
        if(ec == websocket::error::closed){
            events_.fail("connection closed by server: " + std::string(ws_.reason().reason.c_str()));
        }else{
            events_.fail("read failed: " + ec.message());
        }
        return;
    }

    std::string message = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    if(endpoint_.verbose){
        printf("received %zu bytes from server\n",bytes);
    }

    if(!events_.handleMessage(message)){
        return;
    }
    startRead();
}

void GeminiLiveConnection::writeMessage(const std::string& message){
    if(!connected_ || closed_){
        throw ConnectionError("connection is closed");
    }
    if(events_.hasFailed()){
        throw ConnectionError(events_.error());
    }

    // one outstanding write at a time, websocket streams allow no more
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto payload = std::make_shared<std::string>(message);
    auto done = std::make_shared<std::promise<beast::error_code>>();
    std::future<beast::error_code> result = done->get_future();

    net::post(ioc_, [this, payload, done]{
        ws_.async_write(net::buffer(*payload), [payload, done](beast::error_code ec, std::size_t){
            done->set_value(ec);
        });
    });
    // handlers dropped by a shutdown break the promise instead of hanging here
    done.reset();

    beast::error_code ec;
    try{
        auto deadline = std::chrono::steady_clock::now() + endpoint_.timeout;
        while(result.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready){
            if(closed_){
                throw ConnectionError("connection is closed");
            }
            if(std::chrono::steady_clock::now() >= deadline){
                events_.fail("write timed out");
                throw ConnectionError("write timed out");
            }
        }
        ec = result.get();
    }catch(const std::future_error&){
        throw ConnectionError("connection is closed");
    }
    if(ec){
        throw ConnectionError("write failed: " + ec.message());
    }
}

void GeminiLiveConnection::sendAudio(const AudioChunk& chunk){
    writeMessage(buildRealtimeInputMessage(chunk));
}

void GeminiLiveConnection::sendText(const std::string& text, bool end_of_turn){
    writeMessage(buildClientTextMessage(text, end_of_turn));
}

bool GeminiLiveConnection::receive(InboundEvent& event){
    return events_.next(event);
}

void GeminiLiveConnection::close(){
    bool expected = false;
    if(!closed_.compare_exchange_strong(expected, true)){
        return;
    }
    events_.close();

    if(io_thread_){
        net::post(ioc_, [this]{ closeSocket(); });
        work_.reset();
        if(io_thread_->joinable() && io_thread_->get_id() != std::this_thread::get_id()){
            io_thread_->join();
        }
        io_thread_.reset();
    }else{
        closeSocket();
    }
    if(connected_){
        printf("Gemini live session closed\n");
    }
}

std::unique_ptr<LiveConnection> GeminiLiveConnector::open(const Credential& credential,
                                                          const SessionConfig& config){
    std::unique_ptr<GeminiLiveConnection> connection = std::make_unique<GeminiLiveConnection>(endpoint_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(cancelled_){
            throw ConnectionError("connection cancelled");
        }
        pending_ = connection.get();
    }
    struct PendingReset {
        GeminiLiveConnector& connector;
        ~PendingReset() {
            std::lock_guard<std::mutex> lock(connector.mutex_);
            connector.pending_ = nullptr;
        }
    } pending_reset{*this};

    connection->connect(credential, config);
    return connection;
}

void GeminiLiveConnector::cancel(){
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    if(pending_){
        pending_->cancelConnect();
    }
}

void GeminiLiveConnector::reset(){
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}
