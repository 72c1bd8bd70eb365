#pragma once

#include "beamdrop/signaling/relay_hub.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace beamdrop::signaling {

using boost::asio::ip::tcp;

constexpr const char* RELAY_PATH_PREFIX = "/api/ws/";

class RelaySession : public std::enable_shared_from_this<RelaySession> {
public:
    RelaySession(tcp::socket socket, RelayHub& hub);
    ~RelaySession();

    void start();
    void send(const std::string& frame);
    void close();

    const std::string& peer_id() const { return peer_id_; }

private:
    void on_request(boost::beast::error_code ec);
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void do_write();
    void handle_error(boost::beast::error_code ec, const char* what);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    RelayHub& hub_;
    boost::beast::flat_buffer read_buffer_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    std::deque<std::string> write_queue_;
    bool write_in_progress_;
    bool joined_;
    bool closed_;
    std::string peer_id_;
    std::uint64_t connection_id_;
};

// WebSocket signaling relay. Participants connect to /api/ws/{peerId}.
class RelayServer {
public:
    RelayServer(boost::asio::io_context& io_context, std::uint16_t port);
    ~RelayServer();

    bool start();
    void stop();

    bool is_running() const { return running_; }
    std::uint16_t local_port() const;
    RelayHub& hub() { return hub_; }

private:
    void do_accept();

    boost::asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    std::uint16_t port_;
    RelayHub hub_;
    std::vector<std::weak_ptr<RelaySession>> sessions_;
    bool running_;
};

// Extracts the peer id from a relay request target; empty when malformed.
std::string peer_id_from_target(const std::string& target);

}
