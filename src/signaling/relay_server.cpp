#include "beamdrop/signaling/relay_server.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <algorithm>

namespace beamdrop::signaling {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

std::string peer_id_from_target(const std::string& target) {
    auto path = target.substr(0, target.find('?'));
    if (!core::utils::StringUtils::starts_with(path, RELAY_PATH_PREFIX)) {
        return "";
    }

    auto id = path.substr(std::string(RELAY_PATH_PREFIX).size());
    if (id.empty() || id.find('/') != std::string::npos) {
        return "";
    }
    return id;
}

RelaySession::RelaySession(tcp::socket socket, RelayHub& hub)
    : ws_(std::move(socket))
    , hub_(hub)
    , write_in_progress_(false)
    , joined_(false)
    , closed_(false)
    , connection_id_(0) {
}

RelaySession::~RelaySession() {
    LOG_DEBUG("Relay session for '{}' destroyed", peer_id_);
}

void RelaySession::start() {
    auto self = shared_from_this();
    http::async_read(ws_.next_layer(), read_buffer_, request_,
        [this, self](beast::error_code ec, std::size_t) {
            on_request(ec);
        });
}

void RelaySession::on_request(beast::error_code ec) {
    if (ec) {
        handle_error(ec, "read request");
        return;
    }

    if (!websocket::is_upgrade(request_)) {
        LOG_WARN("Rejecting non-WebSocket request for {}", std::string(request_.target()));
        close();
        return;
    }

    peer_id_ = peer_id_from_target(std::string(request_.target()));
    if (peer_id_.empty()) {
        LOG_WARN("Rejecting relay request with target {}", std::string(request_.target()));
        close();
        return;
    }

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.text(true);

    auto self = shared_from_this();
    ws_.async_accept(request_,
        [this, self](beast::error_code ec) {
            on_accept(ec);
        });
}

void RelaySession::on_accept(beast::error_code ec) {
    if (ec) {
        handle_error(ec, "accept");
        return;
    }

    std::weak_ptr<RelaySession> weak_self = shared_from_this();
    connection_id_ = hub_.join(peer_id_, [weak_self](const std::string& frame) {
        if (auto session = weak_self.lock()) {
            session->send(frame);
        }
    });
    joined_ = true;

    do_read();
}

void RelaySession::do_read() {
    auto self = shared_from_this();
    ws_.async_read(read_buffer_,
        [this, self](beast::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec, "read");
                return;
            }

            auto frame = beast::buffers_to_string(read_buffer_.data());
            read_buffer_.consume(read_buffer_.size());

            hub_.handle_frame(peer_id_, frame);
            do_read();
        });
}

void RelaySession::send(const std::string& frame) {
    if (closed_) {
        return;
    }

    write_queue_.push_back(frame);
    if (!write_in_progress_) {
        do_write();
    }
}

void RelaySession::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }

    write_in_progress_ = true;
    // The in-flight frame belongs to the handler; close() and handle_error() only drop the tail.
    auto frame = std::make_shared<std::string>(std::move(write_queue_.front()));
    write_queue_.pop_front();

    auto self = shared_from_this();
    ws_.async_write(boost::asio::buffer(*frame),
        [this, self, frame](beast::error_code ec, std::size_t) {
            write_in_progress_ = false;

            if (closed_) {
                write_queue_.clear();
                return;
            }

            if (ec) {
                handle_error(ec, "write");
                return;
            }

            do_write();
        });
}

void RelaySession::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    write_queue_.clear();

    if (joined_) {
        joined_ = false;
        hub_.leave(peer_id_, connection_id_);
    }

    if (ws_.is_open()) {
        auto self = shared_from_this();
        ws_.async_close(websocket::close_code::normal,
            [self](beast::error_code) {});
    } else {
        beast::error_code ignored;
        ws_.next_layer().socket().shutdown(tcp::socket::shutdown_both, ignored);
        ws_.next_layer().socket().close(ignored);
    }
}

void RelaySession::handle_error(beast::error_code ec, const char* what) {
    if (ec == websocket::error::closed || ec == boost::asio::error::eof ||
        ec == http::error::end_of_stream) {
        LOG_INFO("Relay connection for '{}' closed", peer_id_);
    } else if (ec == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Relay {} aborted for '{}'", what, peer_id_);
    } else {
        LOG_ERROR("Relay {} failed for '{}': {}", what, peer_id_, ec.message());
    }

    // The stream is unusable after a failed operation; only hub bookkeeping remains.
    closed_ = true;
    write_queue_.clear();
    if (joined_) {
        joined_ = false;
        hub_.leave(peer_id_, connection_id_);
    }
}

RelayServer::RelayServer(boost::asio::io_context& io_context, std::uint16_t port)
    : io_context_(io_context)
    , acceptor_(io_context)
    , port_(port)
    , running_(false) {
}

RelayServer::~RelayServer() {
    stop();
}

bool RelayServer::start() {
    if (running_) {
        LOG_WARN("Relay server already running");
        return false;
    }

    try {
        tcp::endpoint endpoint(tcp::v4(), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        running_ = true;

        do_accept();

        LOG_INFO("Relay server listening on port {}", local_port());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start relay server on port {}: {}", port_, e.what());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }
}

void RelayServer::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping relay server");
    running_ = false;

    boost::system::error_code ec;
    acceptor_.close(ec);

    for (auto& weak_session : sessions_) {
        if (auto session = weak_session.lock()) {
            session->close();
        }
    }
    sessions_.clear();
}

std::uint16_t RelayServer::local_port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void RelayServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (!ec) {
                auto session = std::make_shared<RelaySession>(std::move(socket), hub_);
                sessions_.erase(
                    std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<RelaySession>& s) { return s.expired(); }),
                    sessions_.end());
                sessions_.push_back(session);
                session->start();
            } else {
                LOG_ERROR("Relay accept failed: {}", ec.message());
            }

            do_accept();
        });
}

}
