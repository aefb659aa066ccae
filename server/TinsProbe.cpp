#include "TinsProbe.hpp"
#include <tins/tins.h>
#include <iostream>
#include <thread>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <poll.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace lan_sentry::server
{
    bool IsRoot() {
        return geteuid() == 0;
    }

    static std::optional<std::string> LookupArpCache(const std::string &target_ip) {
        std::ifstream arpFile("/proc/net/arp");
        if (!arpFile.is_open()) return std::nullopt;

        std::string line;
        std::getline(arpFile, line);
        while (std::getline(arpFile, line)) {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            ss >> ip >> hw_type >> flags >> mac >> mask >> dev;

            if (ip == target_ip && mac != "00:00:00:00:00:00") {
                return mac;
            }
        }
        return std::nullopt;
    }

    static std::optional<std::string> ReverseLookup(const std::string &ip) {
        struct sockaddr_in sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<const struct sockaddr *>(&sa), sizeof(sa),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;
        return std::string(host);
    }

    TinsNetworkProbe::TinsNetworkProbe()
        : m_next_echo_id(static_cast<uint16_t>(getpid() & 0xFFFF)),
          m_names(ReverseLookup, NAME_LOOKUP_THREADS)
    {
        if (!IsRoot()) {
            std::cerr << "[Probe] WARNING: Not running as root. ICMP and ARP probes will fail.\n";
        }
    }

    std::vector<InterfaceInfo> TinsNetworkProbe::ListInterfaces()
    {
        std::vector<InterfaceInfo> out;

        for (const auto &iface : Tins::NetworkInterface::all())
        {
            try
            {
                Tins::NetworkInterface::Info info = iface.info();

                InterfaceInfo entry;
                entry.name = iface.name();
                entry.address = info.ip_addr.to_string();
                entry.netmask = info.netmask.to_string();
                entry.is_loopback = iface.is_loopback();
                entry.is_up = info.is_up;
                out.push_back(entry);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Probe] Skipping interface " << iface.name() << ": " << e.what() << "\n";
            }
        }
        return out;
    }

    // RETURNS: Latency in ms, or nullopt if no reply before the deadline
    std::optional<double> TinsNetworkProbe::Ping(const std::string &ip, std::chrono::milliseconds timeout)
    {
        if (!IsRoot())
            throw std::runtime_error("ICMP probe requires root");

        Tins::IPv4Address target(ip);
        Tins::NetworkInterface iface(target);

        const uint16_t echo_id = m_next_echo_id.fetch_add(1);

        Tins::SnifferConfiguration config;
        config.set_promisc_mode(false);
        config.set_immediate_mode(true);
        config.set_snap_len(256);
        config.set_buffer_size(256 * 1024);
        config.set_filter("icmp[icmptype] == icmp-echoreply and src host " + ip);
        config.set_timeout(50);

        Tins::Sniffer sniffer(iface.name(), config);

        Tins::IP packet = Tins::IP(target) / Tins::ICMP();
        Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
        icmp.type(Tins::ICMP::ECHO_REQUEST);
        icmp.id(echo_id);
        icmp.sequence(1);

        Tins::PacketSender sender;

        auto start = std::chrono::steady_clock::now();
        auto deadline = start + timeout;
        sender.send(packet);

        const int fd = sniffer.get_fd();

        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return std::nullopt;

            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int poll_ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (poll_ret < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
            }
            if (poll_ret == 0)
                return std::nullopt;

            Tins::PtrPacket captured = sniffer.next_packet();
            std::unique_ptr<Tins::PDU> pdu(captured.release_pdu());
            if (!pdu)
                continue;

            const Tins::ICMP *reply = pdu->find_pdu<Tins::ICMP>();
            if (reply && reply->type() == Tins::ICMP::ECHO_REPLY && reply->id() == echo_id)
            {
                std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
                return elapsed.count();
            }
        }
    }

    std::optional<std::string> TinsNetworkProbe::ResolveLinkAddress(const std::string &ip)
    {
        // A successful echo has normally left the neighbour in the kernel cache.
        auto cached = LookupArpCache(ip);
        if (cached)
            return cached;

        if (!IsRoot())
            return std::nullopt;

        try
        {
            Tins::IPv4Address target(ip);
            Tins::NetworkInterface iface(target);
            Tins::PacketSender sender;
            Tins::HWAddress<6> mac = Tins::Utils::resolve_hwaddr(iface, target, sender);
            return mac.to_string();
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    std::optional<std::string> TinsNetworkProbe::ResolveName(const std::string &ip, std::chrono::milliseconds timeout)
    {
        return m_names.Lookup(ip, timeout);
    }
}
