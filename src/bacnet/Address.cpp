#include "Address.h"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <tuple>

namespace bacnet_scan {

static bool parse_uint(const std::string& s, unsigned long max, unsigned long& out, int base = 10){
    if(s.empty() || s.size() > 10) return false;
    for(char c : s){
        bool ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(c)) : std::isdigit(static_cast<unsigned char>(c));
        if(!ok) return false;
    }
    out = std::strtoul(s.c_str(), nullptr, base);
    return out <= max;
}

std::optional<Ipv4Address> Ipv4Address::parse(const std::string& text){
    std::uint32_t v = 0; int parts = 0; size_t pos = 0;
    while(true){
        size_t dot = text.find('.', pos);
        std::string octet = text.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        unsigned long n = 0;
        if(octet.size() > 3 || !parse_uint(octet, 255, n)) return std::nullopt;
        v = (v << 8) | static_cast<std::uint32_t>(n);
        if(++parts > 4) return std::nullopt;
        if(dot == std::string::npos) break;
        pos = dot + 1;
    }
    if(parts != 4) return std::nullopt;
    Ipv4Address a; a.value = v; return a;
}

std::string Ipv4Address::to_string() const {
    std::ostringstream os;
    os << ((value >> 24) & 0xFF) << '.' << ((value >> 16) & 0xFF) << '.' << ((value >> 8) & 0xFF) << '.' << (value & 0xFF);
    return os.str();
}

Subnet::Subnet(Ipv4Address addr, int prefix) : prefix_(prefix) {
    network_.value = addr.value & mask();
}

std::uint32_t Subnet::mask() const {
    if(prefix_ <= 0) return 0;
    if(prefix_ >= 32) return 0xFFFFFFFFu;
    return 0xFFFFFFFFu << (32 - prefix_);
}

std::optional<Subnet> Subnet::parse(const std::string& text){
    auto slash = text.find('/');
    std::string addr_part = slash == std::string::npos ? text : text.substr(0, slash);
    int prefix = 32;
    if(slash != std::string::npos){
        unsigned long p = 0;
        if(!parse_uint(text.substr(slash + 1), 32, p)) return std::nullopt;
        prefix = static_cast<int>(p);
    }
    auto ip = Ipv4Address::parse(addr_part);
    if(!ip) return std::nullopt;
    return Subnet(*ip, prefix);
}

bool Subnet::contains(Ipv4Address ip) const {
    return (ip.value & mask()) == network_.value;
}

std::string Subnet::to_string() const {
    return network_.to_string() + "/" + std::to_string(prefix_);
}

Address Address::ip(Ipv4Address addr, std::uint16_t port){
    Address a; a.kind_ = Kind::Ip; a.ip_ = addr; a.port_ = port; return a;
}

Address Address::remote(NetworkNumber net, const std::string& mac_hex){
    Address a; a.kind_ = Kind::Remote; a.net_ = net; a.port_ = 0;
    for(char c : mac_hex) a.mac_.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return a;
}

std::optional<Address> Address::parse(const std::string& text){
    auto colon = text.rfind(':');
    if(text.find('.') != std::string::npos){
        std::string host = colon == std::string::npos ? text : text.substr(0, colon);
        std::uint16_t port = kDefaultBacnetPort;
        if(colon != std::string::npos){
            unsigned long p = 0;
            if(!parse_uint(text.substr(colon + 1), 65535, p) || p == 0) return std::nullopt;
            port = static_cast<std::uint16_t>(p);
        }
        auto ip4 = Ipv4Address::parse(host);
        if(!ip4) return std::nullopt;
        return Address::ip(*ip4, port);
    }
    if(colon == std::string::npos) return std::nullopt;
    unsigned long net = 0;
    if(!parse_uint(text.substr(0, colon), kMaxNetworkNumber, net)) return std::nullopt;
    std::string mac = text.substr(colon + 1);
    if(mac.rfind("0x", 0) == 0 || mac.rfind("0X", 0) == 0) mac = mac.substr(2);
    if(mac.empty() || mac.size() > 14) return std::nullopt;
    for(char c : mac) if(!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    return Address::remote(static_cast<NetworkNumber>(net), mac);
}

std::optional<Ipv4Address> Address::to_ip() const {
    if(kind_ != Kind::Ip) return std::nullopt;
    return ip_;
}

std::string Address::to_string() const {
    if(kind_ == Kind::Remote) return std::to_string(net_) + ":0x" + mac_;
    if(port_ == kDefaultBacnetPort) return ip_.to_string();
    return ip_.to_string() + ":" + std::to_string(port_);
}

bool Address::operator==(const Address& o) const {
    if(kind_ != o.kind_) return false;
    if(kind_ == Kind::Ip) return ip_ == o.ip_ && port_ == o.port_;
    return net_ == o.net_ && mac_ == o.mac_;
}

bool Address::operator<(const Address& o) const {
    if(kind_ != o.kind_) return kind_ < o.kind_;
    if(kind_ == Kind::Ip) return std::tie(ip_.value, port_) < std::tie(o.ip_.value, o.port_);
    return std::tie(net_, mac_) < std::tie(o.net_, o.mac_);
}

std::optional<LocalAddress> parse_local_address(const std::string& text){
    auto slash = text.find('/');
    if(slash == std::string::npos){
        auto a = Address::parse(text);
        if(!a || a->kind() != Address::Kind::Ip) return std::nullopt;
        return LocalAddress{*a, std::nullopt};
    }
    // ip/prefix[:port]
    std::string host = text.substr(0, slash);
    std::string rest = text.substr(slash + 1);
    std::string prefix_s = rest, port_s;
    auto colon = rest.find(':');
    if(colon != std::string::npos){ prefix_s = rest.substr(0, colon); port_s = rest.substr(colon + 1); }
    unsigned long prefix = 0;
    if(!parse_uint(prefix_s, 32, prefix)) return std::nullopt;
    auto a = Address::parse(port_s.empty() ? host : host + ":" + port_s);
    if(!a || a->kind() != Address::Kind::Ip) return std::nullopt;
    return LocalAddress{*a, Subnet(*a->to_ip(), static_cast<int>(prefix))};
}

}
