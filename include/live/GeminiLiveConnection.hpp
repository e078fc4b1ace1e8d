#ifndef GEMINILIVECONNECTION
#define GEMINILIVECONNECTION

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include "GeminiProtocol.hpp"
#include "LiveConnection.hpp"
#include "LiveEventQueue.hpp"

struct GeminiEndpoint {
    std::string host = "generativelanguage.googleapis.com";
    std::string port = "443";
    std::string path = "/ws/google.ai.generativelanguage.v1alpha.GenerativeService.BidiGenerateContent";
    std::string model = GEMINI_DEFAULT_MODEL;
    // bounds each connect step and each write
    std::chrono::seconds timeout{10};
    bool verbose = false;
};

// TLS WebSocket session. connect() drives the socket on the calling thread,
// afterwards it is only touched from the io thread; callers hand writes over
// and wait for the result.
class GeminiLiveConnection : public LiveConnection {
public:
    explicit GeminiLiveConnection(const GeminiEndpoint& endpoint);
    ~GeminiLiveConnection();

    // handshake + setup exchange; throws ConnectionError
    void connect(const Credential& credential, const SessionConfig& config);
    // makes a connect() running on another thread give up promptly
    void cancelConnect();

    void sendAudio(const AudioChunk& chunk) override;
    void sendText(const std::string& text, bool end_of_turn) override;
    bool receive(InboundEvent& event) override;
    void close() override;

private:
    typedef boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>> WebSocket;

    void writeMessage(const std::string& message);
    void startRead();
    void onRead(boost::beast::error_code ec, std::size_t bytes);
    void handshake(const Credential& credential, const SessionConfig& config);
    void runStep(const char* what, const bool& done, const std::function<void()>& abort);
    void closeSocket();
    void startIoThread();

    GeminiEndpoint endpoint_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    WebSocket ws_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::beast::flat_buffer read_buffer_;
    std::unique_ptr<std::thread> io_thread_;

    std::mutex write_mutex_;
    LiveEventQueue events_;

    std::atomic<bool> connected_;
    std::atomic<bool> closed_;
    std::atomic<bool> connect_cancelled_;
};

class GeminiLiveConnector : public LiveConnector {
public:
    explicit GeminiLiveConnector(const GeminiEndpoint& endpoint = GeminiEndpoint())
        : endpoint_(endpoint) {}

    std::unique_ptr<LiveConnection> open(const Credential& credential,
                                         const SessionConfig& config) override;
    void cancel() override;
    void reset() override;

private:
    GeminiEndpoint endpoint_;

    std::mutex mutex_;
    bool cancelled_ = false;
    GeminiLiveConnection* pending_ = nullptr;
};

#endif
