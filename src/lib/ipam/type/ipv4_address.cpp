#include <array>
#include <stdexcept>

#include <arpa/inet.h>

#include "ipam/type/ipv4_address.hpp"
#include "ipam/type/validation_error.hpp"

namespace libipam::type {

static ipv4_address from_string_or_throw(std::string_view input)
{
    auto addr = parse_ipv4_address(input);
    if (!addr) { throw validation_error(addr.error()); }
    return (*addr);
}

ipv4_address::ipv4_address(const char* input)
    : m_addr(from_string_or_throw(input).data())
{}

ipv4_address::ipv4_address(const std::string& input)
    : m_addr(from_string_or_throw(input).data())
{}

ipv4_address::ipv4_address(std::initializer_list<uint8_t> data)
    : m_addr(0)
{
    if (data.size() != 4) { throw validation_error("4 items required"); }
    for (auto value : data) { m_addr = (m_addr << 8) | value; }
}

uint8_t ipv4_address::at(size_t idx) const
{
    if (idx > 3) {
        throw std::out_of_range(std::to_string(idx)
                                + " is not between 0 and 3");
    }
    return (operator[](idx));
}

tl::expected<ipv4_address, std::string> parse_ipv4_address(std::string_view input)
{
    /* inet_pton needs a NUL terminated string */
    auto text = std::string(input);
    auto addr = in_addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return (tl::make_unexpected("Invalid IPv4 address: " + text));
    }
    return (ipv4_address(ntohl(addr.s_addr)));
}

std::string to_string(const ipv4_address& addr)
{
    auto buffer = std::array<char, INET_ADDRSTRLEN>{};
    auto net_addr = in_addr{htonl(addr.data())};
    const char* p =
        inet_ntop(AF_INET, &net_addr, buffer.data(), buffer.size());
    return (std::string(p));
}

} // namespace libipam::type
