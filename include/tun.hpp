#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <net/if.h>
#include <linux/if_tun.h>
#include <tdutil/fildes.hpp>

#include "result.hpp" // IWYU pragma: keep

namespace wgpeer {

struct Ifr {
    Ifr() {
        memset(&ifr, 0, sizeof(ifreq));
    }
    explicit Ifr(const std::string &name) : Ifr() {
        strncpy(&ifr.ifr_name[0], name.c_str(), IFNAMSIZ - 1);
    }

    ifreq *operator->() {
        return &ifr;
    }
    ifreq *get() {
        return &ifr;
    }

    ifreq ifr;
};

// Layer 3 tun device carrying bare IP packets, one per read or write.
class Tun {
public:
    // devname may contain %d to let the kernel pick a number
    explicit Tun(const std::string &devname) {
        _tun = tdutil::FileDescriptor("/dev/net/tun", O_RDWR);
        _tun.check();

        Ifr ifr(devname);
        ifr->ifr_flags = IFF_TUN | IFF_NO_PI;
        if (ioctl(_tun, TUNSETIFF, ifr.get()) < 0)
            throw std::system_error(errno, std::system_category(), "ioctl(TUNSETIFF)");
        _name = ifr->ifr_name;
    }

    tdutil::FileDescriptor &fd() {
        return _tun;
    }

    const std::string &name() const {
        return _name;
    }

    void set_mtu(int mtu) {
        Ifr ifr(_name);
        ifr->ifr_mtu = mtu;
        ctl(SIOCSIFMTU, ifr, "ioctl(SIOCSIFMTU)");
    }

    void set_up() {
        Ifr ifr(_name);
        ctl(SIOCGIFFLAGS, ifr, "ioctl(SIOCGIFFLAGS)");
        ifr->ifr_flags |= IFF_UP | IFF_RUNNING;
        ctl(SIOCSIFFLAGS, ifr, "ioctl(SIOCSIFFLAGS)");
    }

    // EAGAIN is returned, not thrown
    outcome::result<size_t> read_packet(std::span<uint8_t> buf) {
        auto ret = read(_tun, buf.data(), buf.size());
        if (ret < 0)
            return fail();
        return static_cast<size_t>(ret);
    }

    outcome::result<void> write_packet(std::span<const uint8_t> pkt) {
        if (write(_tun, pkt.data(), pkt.size()) < 0)
            return fail();
        return outcome::success();
    }

private:
    static void ctl(unsigned long req, Ifr &ifr, const char *what) {
        auto sock = tdutil::FileDescriptor(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
        sock.check();
        if (ioctl(sock, req, ifr.get()) < 0)
            throw std::system_error(errno, std::system_category(), what);
    }

    tdutil::FileDescriptor _tun;
    std::string _name;
};

} // namespace wgpeer
