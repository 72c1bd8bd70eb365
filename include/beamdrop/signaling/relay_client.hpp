#pragma once

#include "beamdrop/signaling/signaling_channel.hpp"
#include "beamdrop/signaling/reconnect_policy.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

namespace beamdrop::signaling {

enum class RelayClientState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    CLOSED
};

const char* to_string(RelayClientState state);

// WebSocket connection to the signaling relay at ws://host:port/api/ws/{id}.
// Runs entirely on the caller's io_context. An unexpected drop is retried per
// the ReconnectPolicy; close() is final.
class RelayClient : public SignalingChannel {
public:
    RelayClient(boost::asio::io_context& io_context,
                std::string host,
                std::uint16_t port,
                std::string local_id,
                ReconnectPolicy policy = ReconnectPolicy());
    ~RelayClient() override;

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    void connect();

    bool is_open() const override { return state_ == RelayClientState::CONNECTED; }
    void close() override;

    RelayClientState state() const { return state_; }
    const std::string& local_id() const { return local_id_; }
    const ReconnectPolicy& reconnect_policy() const { return policy_; }

protected:
    void send_frame(std::string frame) override;

private:
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void start_attempt();
    void on_resolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(boost::beast::error_code ec);
    void on_handshake(boost::beast::error_code ec);
    void do_read();
    void do_write();
    void handle_failure(boost::beast::error_code ec, const char* what);
    void schedule_reconnect();
    void teardown_stream();
    void set_state(RelayClientState state);

    // Completion handlers from a previous stream or a destroyed client are ignored.
    bool is_current(const std::weak_ptr<bool>& token, std::uint64_t generation) const {
        return !token.expired() && generation == generation_;
    }

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer reconnect_timer_;
    std::unique_ptr<WebSocket> ws_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;
    bool write_in_progress_;

    std::string host_;
    std::uint16_t port_;
    std::string local_id_;
    ReconnectPolicy policy_;
    RelayClientState state_;
    std::uint64_t generation_;
    std::shared_ptr<bool> alive_;
};

}
