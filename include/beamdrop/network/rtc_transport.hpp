#pragma once

#include "beamdrop/network/transport.hpp"
#include <boost/asio.hpp>
#include <rtc/rtc.hpp>
#include <memory>
#include <string>

namespace beamdrop::network {

// libdatachannel-backed transport. Library callbacks arrive on libdatachannel's
// threads and are re-posted onto the io_context before reaching any handler.
class RtcDataChannel : public DataChannel {
public:
    RtcDataChannel(boost::asio::io_context& io_context, std::shared_ptr<rtc::DataChannel> channel);
    ~RtcDataChannel() override;

    const std::string& label() const override { return label_; }
    ChannelState state() const override { return state_; }
    bool send(const std::string& message) override;
    void close() override;

private:
    void bind_callbacks();

    boost::asio::io_context& io_context_;
    std::shared_ptr<rtc::DataChannel> channel_;
    std::string label_;
    ChannelState state_;
    std::shared_ptr<bool> alive_;
};

class RtcPeerTransport : public PeerTransport {
public:
    RtcPeerTransport(boost::asio::io_context& io_context, const rtc::Configuration& config);
    ~RtcPeerTransport() override;

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override;
    void set_local_description() override;
    void set_remote_description(const SessionDescription& description) override;
    void add_remote_candidate(const IceCandidate& candidate) override;
    void close() override;
    PeerState state() const override { return state_; }

private:
    void bind_callbacks();

    // Runs `fn` on the io_context unless this transport is gone by then.
    template<typename Fn>
    void post(Fn fn) {
        std::weak_ptr<bool> token = alive_;
        boost::asio::post(io_context_, [token, fn = std::move(fn)]() mutable {
            if (!token.expired()) {
                fn();
            }
        });
    }

    boost::asio::io_context& io_context_;
    std::shared_ptr<rtc::PeerConnection> connection_;
    PeerState state_;
    bool closed_;
    std::shared_ptr<bool> alive_;
};

class RtcTransportFactory : public TransportFactory {
public:
    RtcTransportFactory(boost::asio::io_context& io_context, TransportConfig config);

    std::unique_ptr<PeerTransport> create(NegotiationRole role) override;

    // Routes libdatachannel's own log output through our logger.
    static void enable_library_logging();

private:
    boost::asio::io_context& io_context_;
    TransportConfig config_;
};

}
