#include "beamdrop/signaling/relay_client.hpp"
#include "beamdrop/signaling/relay_server.hpp"
#include "beamdrop/core/logger.hpp"
#include <chrono>

namespace beamdrop::signaling {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

namespace {
constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(10);
}

const char* to_string(RelayClientState state) {
    switch (state) {
        case RelayClientState::DISCONNECTED: return "DISCONNECTED";
        case RelayClientState::CONNECTING: return "CONNECTING";
        case RelayClientState::CONNECTED: return "CONNECTED";
        case RelayClientState::RECONNECTING: return "RECONNECTING";
        case RelayClientState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

RelayClient::RelayClient(boost::asio::io_context& io_context,
                         std::string host,
                         std::uint16_t port,
                         std::string local_id,
                         ReconnectPolicy policy)
    : io_context_(io_context)
    , resolver_(io_context)
    , reconnect_timer_(io_context)
    , write_in_progress_(false)
    , host_(std::move(host))
    , port_(port)
    , local_id_(std::move(local_id))
    , policy_(std::move(policy))
    , state_(RelayClientState::DISCONNECTED)
    , generation_(0)
    , alive_(std::make_shared<bool>(true)) {
}

RelayClient::~RelayClient() {
    alive_.reset();

    boost::system::error_code ignored;
    reconnect_timer_.cancel(ignored);
    resolver_.cancel();
    if (ws_) {
        beast::get_lowest_layer(*ws_).socket().close(ignored);
    }
}

void RelayClient::connect() {
    if (state_ != RelayClientState::DISCONNECTED) {
        LOG_WARN("Relay client already {}", to_string(state_));
        return;
    }

    policy_.reset();
    start_attempt();
}

void RelayClient::close() {
    if (state_ == RelayClientState::CLOSED) {
        return;
    }

    bool was_open = is_open();
    set_state(RelayClientState::CLOSED);
    ++generation_;

    boost::system::error_code ignored;
    reconnect_timer_.cancel(ignored);
    resolver_.cancel();
    write_queue_.clear();
    write_in_progress_ = false;

    if (ws_ && ws_->is_open()) {
        // The stream is kept alive by the completion handler until the close handshake ends.
        auto stream = std::shared_ptr<WebSocket>(std::move(ws_));
        stream->async_close(websocket::close_code::normal,
            [stream](beast::error_code ec) {
                if (ec && ec != boost::asio::error::operation_aborted) {
                    LOG_DEBUG("Relay close handshake failed: {}", ec.message());
                }
            });
    } else {
        teardown_stream();
    }

    LOG_INFO("Relay connection closed by local request");
    if (was_open) {
        notify_state(false);
    }
}

void RelayClient::send_frame(std::string frame) {
    write_queue_.push_back(std::move(frame));
    if (!write_in_progress_) {
        do_write();
    }
}

void RelayClient::start_attempt() {
    teardown_stream();
    ++generation_;
    set_state(policy_.attempts() == 0 ? RelayClientState::CONNECTING : RelayClientState::RECONNECTING);

    ws_ = std::make_unique<WebSocket>(io_context_);
    read_buffer_.consume(read_buffer_.size());

    LOG_INFO("Connecting to relay ws://{}:{}{}{}", host_, port_, RELAY_PATH_PREFIX, local_id_);

    std::weak_ptr<bool> token = alive_;
    auto generation = generation_;
    resolver_.async_resolve(host_, std::to_string(port_),
        [this, token, generation](beast::error_code ec, tcp::resolver::results_type results) {
            if (!is_current(token, generation)) return;
            on_resolve(ec, std::move(results));
        });
}

void RelayClient::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        handle_failure(ec, "resolve");
        return;
    }

    auto& stream = beast::get_lowest_layer(*ws_);
    stream.expires_after(CONNECT_TIMEOUT);

    std::weak_ptr<bool> token = alive_;
    auto generation = generation_;
    stream.async_connect(results,
        [this, token, generation](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
            if (!is_current(token, generation)) return;
            on_connect(ec);
        });
}

void RelayClient::on_connect(beast::error_code ec) {
    if (ec) {
        handle_failure(ec, "connect");
        return;
    }

    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->text(true);

    auto host = host_ + ":" + std::to_string(port_);
    auto target = std::string(RELAY_PATH_PREFIX) + local_id_;

    std::weak_ptr<bool> token = alive_;
    auto generation = generation_;
    ws_->async_handshake(host, target,
        [this, token, generation](beast::error_code ec) {
            if (!is_current(token, generation)) return;
            on_handshake(ec);
        });
}

void RelayClient::on_handshake(beast::error_code ec) {
    if (ec) {
        handle_failure(ec, "handshake");
        return;
    }

    LOG_INFO("Connected to relay {}:{} as '{}'", host_, port_, local_id_);
    policy_.reset();
    set_state(RelayClientState::CONNECTED);

    do_read();
    notify_state(true);
}

void RelayClient::do_read() {
    std::weak_ptr<bool> token = alive_;
    auto generation = generation_;
    ws_->async_read(read_buffer_,
        [this, token, generation](beast::error_code ec, std::size_t) {
            if (!is_current(token, generation)) return;

            if (ec) {
                handle_failure(ec, "read");
                return;
            }

            auto frame = beast::buffers_to_string(read_buffer_.data());
            read_buffer_.consume(read_buffer_.size());

            do_read();
            dispatch_frame(frame);
        });
}

void RelayClient::do_write() {
    if (write_queue_.empty() || write_in_progress_ || !ws_) {
        return;
    }

    write_in_progress_ = true;
    // The in-flight frame belongs to the handler; close() and handle_failure() only drop the tail.
    auto frame = std::make_shared<std::string>(std::move(write_queue_.front()));
    write_queue_.pop_front();

    std::weak_ptr<bool> token = alive_;
    auto generation = generation_;
    ws_->async_write(boost::asio::buffer(*frame),
        [this, token, generation, frame](beast::error_code ec, std::size_t) {
            if (!is_current(token, generation)) return;
            write_in_progress_ = false;

            if (ec) {
                handle_failure(ec, "write");
                return;
            }

            do_write();
        });
}

void RelayClient::handle_failure(beast::error_code ec, const char* what) {
    bool was_open = is_open();

    if (ec == websocket::error::closed) {
        LOG_WARN("Relay closed the connection");
    } else {
        LOG_ERROR("Relay {} failed: {}", what, ec.message());
    }

    ++generation_;
    write_queue_.clear();
    write_in_progress_ = false;
    teardown_stream();
    set_state(RelayClientState::DISCONNECTED);

    if (was_open) {
        notify_state(false);
    }

    // A state handler may have closed the client.
    if (state_ == RelayClientState::CLOSED) {
        return;
    }
    schedule_reconnect();
}

void RelayClient::schedule_reconnect() {
    auto delay = policy_.next_delay();
    if (!delay) {
        LOG_ERROR("Giving up on relay {}:{} after {} attempts", host_, port_, policy_.attempts());
        set_state(RelayClientState::DISCONNECTED);
        return;
    }

    LOG_INFO("Reconnecting to relay in {} ms (attempt {}/{})",
             delay->count(), policy_.attempts(), policy_.max_attempts());
    set_state(RelayClientState::RECONNECTING);

    reconnect_timer_.expires_after(*delay);
    std::weak_ptr<bool> token = alive_;
    auto generation = generation_;
    reconnect_timer_.async_wait(
        [this, token, generation](const boost::system::error_code& ec) {
            if (ec || !is_current(token, generation)) return;
            start_attempt();
        });
}

void RelayClient::teardown_stream() {
    if (!ws_) {
        return;
    }

    boost::system::error_code ignored;
    auto& socket = beast::get_lowest_layer(*ws_).socket();
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    ws_.reset();
}

void RelayClient::set_state(RelayClientState state) {
    if (state_ == state) {
        return;
    }
    LOG_DEBUG("Relay client {} -> {}", to_string(state_), to_string(state));
    state_ = state;
}

}
