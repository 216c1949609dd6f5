#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace bacnet_scan {

using DeviceInstance = std::uint32_t;
using NetworkNumber = std::uint16_t;

constexpr DeviceInstance kMaxDeviceInstance = 4194303;
constexpr NetworkNumber kMaxNetworkNumber = 65534;
constexpr std::uint16_t kDefaultBacnetPort = 47808; // 0xBAC0

inline bool valid_device_instance(long long v){ return v >= 0 && v <= kMaxDeviceInstance; }
inline bool valid_network_number(long long v){ return v >= 0 && v <= kMaxNetworkNumber; }

struct Ipv4Address {
    std::uint32_t value = 0; // host byte order

    static std::optional<Ipv4Address> parse(const std::string& text);
    std::string to_string() const;

    bool operator==(const Ipv4Address& o) const { return value == o.value; }
    bool operator!=(const Ipv4Address& o) const { return value != o.value; }
    bool operator<(const Ipv4Address& o) const { return value < o.value; }
};

// IPv4 network range. Host bits are always cleared on construction.
class Subnet {
public:
    Subnet() = default;
    Subnet(Ipv4Address addr, int prefix);

    // "10.0.0.0/24"; host bits are tolerated and masked off ("10.0.0.7/24" -> 10.0.0.0/24).
    static std::optional<Subnet> parse(const std::string& text);

    bool contains(Ipv4Address ip) const;
    Ipv4Address network() const { return network_; }
    int prefix() const { return prefix_; }
    std::uint32_t mask() const;
    std::string to_string() const;

    bool operator==(const Subnet& o) const { return network_ == o.network_ && prefix_ == o.prefix_; }
    bool operator!=(const Subnet& o) const { return !(*this == o); }
    bool operator<(const Subnet& o) const { return network_ < o.network_ || (network_ == o.network_ && prefix_ < o.prefix_); }
private:
    Ipv4Address network_{};
    int prefix_ = 32;
};

// Transport address as reported by the application layer: either a BACnet/IP
// endpoint or a remote station behind a router (network number + MAC).
class Address {
public:
    enum class Kind { Ip, Remote };

    Address() = default;
    static Address ip(Ipv4Address addr, std::uint16_t port = kDefaultBacnetPort);
    static Address remote(NetworkNumber net, const std::string& mac_hex);

    // Accepts "10.0.0.5", "10.0.0.5:47809", "5:0x21" and "5:21" (MAC in hex).
    static std::optional<Address> parse(const std::string& text);

    Kind kind() const { return kind_; }
    std::optional<Ipv4Address> to_ip() const;
    std::uint16_t port() const { return port_; }
    NetworkNumber network() const { return net_; }
    const std::string& mac() const { return mac_; }

    // Port is omitted when it is the BACnet default.
    std::string to_string() const;

    bool operator==(const Address& o) const;
    bool operator!=(const Address& o) const { return !(*this == o); }
    bool operator<(const Address& o) const;
private:
    Kind kind_ = Kind::Ip;
    Ipv4Address ip_{};
    std::uint16_t port_ = kDefaultBacnetPort;
    NetworkNumber net_ = 0;
    std::string mac_; // lowercase hex, no 0x
};

// The scanner's own address may carry a prefix: "192.168.1.12/24:47808".
struct LocalAddress {
    Address address;
    std::optional<Subnet> subnet;
};
std::optional<LocalAddress> parse_local_address(const std::string& text);

}
