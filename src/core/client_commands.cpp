#include "beamdrop/core/client_commands.hpp"
#include "beamdrop/core/config.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/peer_session.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/random.hpp"
#include "beamdrop/network/rtc_transport.hpp"
#include "beamdrop/signaling/relay_client.hpp"
#include <boost/asio.hpp>
#include <boost/asio/use_future.hpp>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <thread>

namespace beamdrop::core {

namespace {

constexpr auto ROSTER_TIMEOUT = std::chrono::seconds(10);
constexpr auto CHANNEL_TIMEOUT = std::chrono::seconds(30);

// Relay connection, transport factory and session for one CLI invocation.
class ClientRuntime {
public:
    ClientRuntime()
        : local_id_(Config::instance().get_string("user.id"))
        , transports_(io_context_, network::TransportConfig{Config::instance().get_list("ice.stun_servers")}) {
        auto& config = Config::instance();
        if (local_id_.empty()) {
            local_id_ = crypto::SecureRandom::generate_peer_id();
        }

        signaling::ReconnectPolicy policy(
            static_cast<std::uint32_t>(config.get_int("relay.reconnect.max_attempts", 5)),
            signaling::ReconnectPolicy::linear_backoff(
                std::chrono::milliseconds(config.get_int("relay.reconnect.base_delay_ms", 2000))));

        relay_ = std::make_unique<signaling::RelayClient>(
            io_context_,
            config.get_string("relay.host", "127.0.0.1"),
            static_cast<std::uint16_t>(config.get_int("relay.port", 8001)),
            local_id_,
            std::move(policy));

        network::RtcTransportFactory::enable_library_logging();
        session_ = std::make_unique<PeerSession>(io_context_, SessionOptions::from_config(config, local_id_),
                                                 *relay_, transports_);
    }

    ~ClientRuntime() {
        session_.reset();
        relay_.reset();
    }

    void start() {
        LOG_INFO("Joining relay as {}", local_id_);
        relay_->connect();
    }

    boost::asio::io_context& io() { return io_context_; }
    PeerSession& session() { return *session_; }
    const std::string& local_id() const { return local_id_; }

private:
    boost::asio::io_context io_context_;
    std::string local_id_;
    network::RtcTransportFactory transports_;
    std::unique_ptr<signaling::RelayClient> relay_;
    std::unique_ptr<PeerSession> session_;
};

// Runs the runtime's io_context on a worker thread until stopped.
class EventLoopThread {
public:
    explicit EventLoopThread(boost::asio::io_context& io_context)
        : io_context_(io_context)
        , work_(boost::asio::make_work_guard(io_context))
        , thread_([this]() { io_context_.run(); }) {
    }

    ~EventLoopThread() {
        stop();
    }

    void stop() {
        if (!thread_.joinable()) {
            return;
        }
        work_.reset();
        io_context_.stop();
        thread_.join();
    }

private:
    boost::asio::io_context& io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
};

void print_roster(const std::vector<signaling::OnlineUser>& users) {
    if (users.empty()) {
        std::cout << "No other peers online.\n";
        return;
    }

    std::cout << users.size() << " peer(s) online:\n";
    for (const auto& user : users) {
        std::cout << "  " << user.emoji << " " << user.display_name << "\n";
        std::cout << "      ID: " << user.peer_id << "\n";
        std::cout << "      Online since: " << utils::TimeUtils::to_iso_string(user.connected_at) << "\n";
    }
}

void print_progress(const transfer::ProgressUpdate& update) {
    std::cout << "\r" << (update.direction == transfer::TransferDirection::SENDING ? "Sending " : "Receiving ")
              << update.file_name << ": " << update.progress_percent << "% ("
              << utils::StringUtils::format_bytes(update.bytes_transferred) << " / "
              << utils::StringUtils::format_bytes(update.total_bytes) << ", "
              << utils::StringUtils::format_bytes(update.speed_bps) << "/s)" << std::flush;
    if (update.progress_percent == 100) {
        std::cout << "\n";
    }
}

}

CommandResult PeersCommandHandler::execute(const std::vector<std::string>& args) {
    ClientRuntime runtime;
    auto& io = runtime.io();
    bool received = false;

    runtime.session().on_online_users_change([&](const std::vector<signaling::OnlineUser>& users) {
        if (received) return;
        received = true;
        print_roster(users);
        runtime.session().disconnect();
        io.stop();
    });

    boost::asio::steady_timer timeout(io, ROSTER_TIMEOUT);
    timeout.async_wait([&](const boost::system::error_code& ec) {
        if (ec) return;
        runtime.session().disconnect();
        io.stop();
    });

    runtime.start();
    io.run();

    if (!received) {
        return CommandResult::error("No roster received from the relay");
    }
    return CommandResult::ok();
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& peer_id = args[1];
    std::shared_ptr<transfer::ByteSource> source;
    try {
        source = transfer::FileByteSource::open(args[2]);
    } catch (const TransferError& e) {
        return CommandResult::error(std::string(to_string(ErrorCode::INVALID_STATE)) + ": " + e.what());
    }

    ClientRuntime runtime;
    auto& io = runtime.io();
    auto& session = runtime.session();

    std::promise<void> channel_ready;
    auto channel_future = channel_ready.get_future();
    bool initiated = false;
    bool settled = false;

    boost::asio::post(io, [&]() {
        session.on_online_users_change([&](const std::vector<signaling::OnlineUser>& users) {
            if (initiated) return;
            for (const auto& user : users) {
                if (user.peer_id == peer_id) {
                    initiated = true;
                    std::cout << "Connecting to " << user.display_name << "...\n";
                    session.initiate(peer_id);
                    return;
                }
            }
            LOG_INFO("Waiting for {} to come online", peer_id);
        });

        session.on_channel_open([&](const std::string& peer) {
            if (peer != peer_id || settled) return;
            settled = true;
            channel_ready.set_value();
        });

        session.on_peer_state_change([&](const std::string& peer, network::PeerState state) {
            if (peer != peer_id || settled || state != network::PeerState::FAILED) return;
            settled = true;
            channel_ready.set_exception(std::make_exception_ptr(
                TransferError(ErrorCode::NEGOTIATION_FAILURE, "Connection to " + peer_id + " failed")));
        });

        runtime.start();
    });

    EventLoopThread loop(io);
    auto shutdown = [&]() {
        boost::asio::post(io, boost::asio::use_future([&]() { session.disconnect(); })).wait();
        loop.stop();
    };

    try {
        if (channel_future.wait_for(CHANNEL_TIMEOUT) != std::future_status::ready) {
            shutdown();
            return CommandResult::error("Timed out waiting for a data channel to " + peer_id);
        }
        channel_future.get();

        auto started = boost::asio::post(io, boost::asio::use_future([&]() {
            return session.send_file(peer_id, source, print_progress);
        }));
        auto result = started.get().get();
        shutdown();

        if (!result) {
            return CommandResult::error(std::string(to_string(result.error)) + ": " + result.message);
        }
        std::cout << "Sent " << source->name() << " to " << peer_id << "\n";
        return CommandResult::ok("Transfer complete");
    } catch (const TransferError& e) {
        shutdown();
        return CommandResult::error(std::string(to_string(e.code())) + ": " + e.what());
    }
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    std::filesystem::path download_dir = Config::instance().get_string("transfer.download_dir", "./downloads");
    if (!utils::FileUtils::create_directories(download_dir)) {
        return CommandResult::error("Cannot create download directory " + download_dir.string());
    }

    ClientRuntime runtime;
    auto& io = runtime.io();
    auto& session = runtime.session();
    std::size_t saved = 0;

    session.on_file_received([&](const std::string& peer_id, const transfer::ReceivedFile& file) {
        auto path = utils::FileUtils::unique_path(download_dir, file.name);
        if (!utils::FileUtils::write_binary_file(path, file.data)) {
            LOG_ERROR("Failed to write {}", path.string());
            std::cout << "Failed to save " << file.name << "\n";
            return;
        }

        ++saved;
        std::cout << "Saved " << file.name << " from " << peer_id << " to " << path.string() << "\n";
        if (file.missing_chunks > 0) {
            std::cout << "  Warning: " << file.missing_chunks << " chunk(s) were missing\n";
        }
    });

    session.on_progress_update([](const transfer::ProgressUpdate& update) {
        if (update.direction == transfer::TransferDirection::RECEIVING) {
            print_progress(update);
        }
    });

    session.on_transfer_failed([](const transfer::TransferFailure& failure) {
        std::cout << "\nTransfer of " << failure.file_name << " from " << failure.peer_id << " failed: "
                  << failure.error.message << "\n";
    });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        session.disconnect();
        io.stop();
    });

    std::cout << "Waiting for files as " << runtime.local_id() << " (Ctrl+C to stop)\n";
    runtime.start();
    io.run();

    return CommandResult::ok("Received " + std::to_string(saved) + " file(s)");
}

}
