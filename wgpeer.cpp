#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <cxxopts.hpp>
#include <fmt/format.h>
#include <tdutil/epollman.hpp>
#include <tdutil/fildes.hpp>

#include "wgpeer.hpp"
#include "config.hpp"
#include "server.hpp"
#include "util/bounded_queue.hpp"
#include "tun.hpp"
#include "udpsock.hpp"
#include "dbgprint.hpp"

/*
 * schema:
 * - bind udp socket to the listen address. this is the *encrypted traffic* side
 * - open tun (optional). tun is the *user and applications* side
 * - read udp -> inbound queue, read tun -> outbound queue, timerfd -> timer queue
 * - PeerServer::poll drains the three queues and writes back to udp and tun
 */

using namespace wgpeer;
using namespace wgpeer::time;
using namespace tdutil;

static cxxopts::Options make_options() {
    cxxopts::Options opt{"wgpeer"};
    auto g = opt.add_options();
    g("c,config", "configuration file", cxxopts::value<std::string>());
    g("a,listen-address", "listen ip:port or [ip6]:port, overrides the configuration", cxxopts::value<std::string>());
    g("i,interface", "tun interface name", cxxopts::value<std::string>()->default_value("wgp%d"));
    g("M,mtu", "tun mtu", cxxopts::value<int>()->default_value("1420"));
    g("n,no-tun", "run without a tun device");
    g("h,help", "show help");
    return opt;
}

struct Args {
    std::string config_path;
    std::optional<Endpoint> listen_addr;
    std::string iface_name;
    int mtu;
    bool no_tun;
};

namespace {

// Sends immediately; datagrams that hit EAGAIN wait until the socket is writable again.
// The backlog keeps the newest QueueCapacity datagrams.
class UdpSink : public DatagramSink {
public:
    explicit UdpSink(UdpServer *server) : _server(server) {
    }

    void send_datagram(const Endpoint &to, std::span<const uint8_t> data) override {
        if (_pending.empty()) {
            auto ret = _server->send_to(to, data);
            if (ret)
                return;
            if (!is_eagain(ret.error().value())) {
                warn_error("sendto", ret.error());
                return;
            }
        }
        if (!_pending.emplace_evict(to, std::vector<uint8_t>(data.begin(), data.end())))
            DBG_PRINT("send backlog full, dropped oldest datagram\n");
    }

    // Stops at the first EAGAIN; pending() tells whether to keep waiting for EPOLLOUT.
    void flush() {
        while (!_pending.empty()) {
            auto &[to, data] = _pending.front();
            auto ret = _server->send_to(to, data);
            if (!ret && is_eagain(ret.error().value()))
                return;
            else if (!ret)
                warn_error("sendto", ret.error());
            _pending.try_pop();
        }
    }

    bool pending() const {
        return !_pending.empty();
    }

private:
    UdpServer *_server;
    BoundedQueue<std::pair<Endpoint, std::vector<uint8_t>>, PeerServer::QueueCapacity> _pending;
};

class TunSink : public TunnelSink {
public:
    explicit TunSink(Tun *tun) : _tun(tun) {
    }

    void deliver(PeerId peer, std::span<const uint8_t> data) override {
        if (!_tun) {
            DBG_PRINT("peer {}: discarding {} bytes\n", peer, data.size());
            return;
        }
        auto res = _tun->write_packet(data);
        if (!res)
            warn_error("tun write", res.error());
    }

private:
    Tun *_tun;
};

} // namespace

static void arm_timer(FileDescriptor &timer, std::optional<uint64_t> deadline) {
    itimerspec tmrspec{};
    if (deadline)
        // a zero it_value would disarm instead
        tmrspec.it_value = to_timespec(std::max<uint64_t>(*deadline, 1));
    if (timerfd_settime(timer, TFD_TIMER_ABSTIME, &tmrspec, nullptr) < 0)
        throw std::system_error(errno, std::system_category(), "timerfd_settime");
}

static void doit(const Args &args) {
    init_crypto();

    auto config = load_config(args.config_path);
    if (args.listen_addr)
        config.listen_address = args.listen_addr;
    validate_config(config);
    if (!config.listen_address)
        throw std::invalid_argument("no listen address");

    sigset_t sigs;
    make_exit_sigset(sigs);
    auto err = pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    if (err)
        throw std::system_error(err, std::system_category(), "pthread_sigmask(sigs)");
    FileDescriptor sigfd(signalfd(-1, &sigs, SFD_NONBLOCK));
    sigfd.check();

    UdpServer udp(*config.listen_address, true);
    fmt::print("listening on {}\n", format_endpoint(*config.listen_address));

    std::unique_ptr<Tun> tun;
    if (!args.no_tun) {
        tun = std::make_unique<Tun>(args.iface_name);
        tun->fd().set_nonblock(true);
        tun->set_mtu(args.mtu);
        tun->set_up();
        fmt::print("tun device {} up, mtu {}\n", tun->name(), args.mtu);
    }

    FileDescriptor timer(timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK));
    timer.check();

    UdpSink net(&udp);
    TunSink tunsink(tun.get());
    PeerServer server(*config.private_key, &net, &tunsink);
    fmt::print("public key {}\n", [&] {
        std::array<char, sodium_base64_ENCODED_LEN(32, sodium_base64_VARIANT_ORIGINAL)> b64;
        sodium_bin2base64(
            b64.data(),
            b64.size(),
            &server.public_key().key[0],
            sizeof(server.public_key().key),
            sodium_base64_VARIANT_ORIGINAL);
        return std::string(b64.data());
    }());

    std::vector<PeerId> peers;
    for (const auto &peer : config.peers)
        peers.push_back(server.add_peer(peer));

    auto start = gettime(CLOCK_MONOTONIC);
    for (size_t i = 0; i < peers.size(); i++) {
        if (!config.peers[i].endpoint)
            continue;
        auto res = server.initiate_handshake(peers[i], start);
        if (!res)
            warn_error("initial handshake", res.error());
    }

    EpollManager<> poll;
    uint32_t udp_events = EPOLLIN;
    poll.add(sigfd, EPOLLIN);
    poll.add(timer, EPOLLIN);
    poll.add(udp.fd(), udp_events);
    if (tun)
        poll.add(tun->fd(), EPOLLIN);

    std::vector<uint8_t> buf(65536);
    std::array<epoll_event, 4> evbuf;
    while (1) {
        arm_timer(timer, server.next_deadline());
        auto nevents = poll.wait(evbuf, server.idle() ? -1 : 0);
        if (nevents < 0) {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::system_category(), "epoll_wait");
        }
        for (int i = 0; i < nevents; i++) {
            auto fd = evbuf[i].data.fd;
            if (fd == sigfd && (evbuf[i].events & EPOLLIN)) {
                fmt::print("exiting\n");
                return;
            } else if (fd == timer) {
                uint64_t val;
                if (read(timer, &val, sizeof(val)) < 0 && !is_eagain())
                    throw std::system_error(errno, std::system_category(), "read(timerfd)");
            } else if (fd == udp.fd()) {
                if (evbuf[i].events & EPOLLOUT)
                    net.flush();
                while ((evbuf[i].events & EPOLLIN) && !server.inbound_full()) {
                    auto ret = udp.recv_from(buf);
                    if (!ret) {
                        if (!is_eagain(ret.error().value()))
                            warn_error("recvfrom", ret.error());
                        break;
                    }
                    auto [size, source] = ret.value();
                    server.push_datagram(source, std::span(buf.data(), size));
                }
            } else if (tun && fd == tun->fd()) {
                while (!server.outbound_full()) {
                    auto ret = tun->read_packet(buf);
                    if (!ret) {
                        if (!is_eagain(ret.error().value()))
                            warn_error("tun read", ret.error());
                        break;
                    }
                    // no allowed-ip routing: traffic only has somewhere to go with a single peer
                    if (peers.size() == 1)
                        server.push_plaintext(peers[0], std::span(buf.data(), ret.value()));
                    else
                        DBG_PRINT("dropping {} bytes from tun, no route\n", ret.value());
                }
            }
        }

        server.poll(gettime(CLOCK_MONOTONIC));

        uint32_t want = EPOLLIN | (net.pending() ? EPOLLOUT : 0);
        if (want != udp_events) {
            poll.set_events(udp.fd(), want);
            udp_events = want;
        }
    }
}

int main(int argc, char **argv) {
    Args args{};

    auto opts = make_options();
    try {
        auto argm = opts.parse(argc, argv);
        if (argm.count("help")) {
            fmt::print("{}\n", opts.help());
            return 0;
        }

        args.config_path = argm["config"].as<std::string>();
        if (argm.count("listen-address")) {
            auto listen_ipport = argm["listen-address"].as<std::string>();
            auto ep = parse_ipport(listen_ipport.c_str());
            if (auto sin = std::get_if<sockaddr_in>(&ep))
                args.listen_addr = *sin;
            else if (auto sin6 = std::get_if<sockaddr_in6>(&ep))
                args.listen_addr = *sin6;
            else
                throw std::invalid_argument("invalid listen address");
        }
        args.iface_name = argm["interface"].as<std::string>();
        args.mtu = argm["mtu"].as<int>();
        args.no_tun = argm.count("no-tun") > 0;
    } catch (const std::exception &ex) {
        fmt::print("{}\n", ex.what());
        fmt::print("{}\n", opts.help());
        return 1;
    }

    try {
        doit(args);
    } catch (const ConfigError &ex) {
        fmt::print(stderr, "configuration error: {}\n", ex.what());
        return 1;
    } catch (const std::exception &ex) {
        fmt::print(stderr, "fatal: {}\n", ex.what());
        return 1;
    }
    return 0;
}
