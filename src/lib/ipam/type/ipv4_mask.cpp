#include <charconv>

#include "ipam/type/ipv4_address.hpp"
#include "ipam/type/ipv4_mask.hpp"
#include "ipam/type/validation_error.hpp"

namespace libipam::type {

static uint32_t prefix_mask(unsigned prefix_length)
{
    if (prefix_length > ipv4_mask::max_prefix_length) {
        throw validation_error(
            std::to_string(prefix_length) + " is larger than "
            + std::to_string(ipv4_mask::max_prefix_length));
    }

    /* Shifting a 32 bit value by 32 is undefined, hence the wide type */
    return (static_cast<uint32_t>(0xffffffffULL << (32 - prefix_length)));
}

ipv4_mask::ipv4_mask(unsigned prefix_length)
    : m_mask(prefix_mask(prefix_length))
    , m_prefix(static_cast<uint8_t>(prefix_length))
{}

uint64_t ipv4_mask::count() const noexcept
{
    if (m_prefix == 0) { return (0); }
    return (uint64_t{1} << (max_prefix_length - m_prefix));
}

static tl::expected<ipv4_mask, std::string>
parse_dotted_mask(std::string_view input)
{
    auto addr = parse_ipv4_address(input);
    if (!addr) {
        return (tl::make_unexpected("Invalid IPv4 netmask: "
                                    + std::string(input)));
    }

    /* All one bits must be to the left of all zero bits */
    auto inverse = ~addr->data();
    if ((inverse & (inverse + 1)) != 0) {
        return (tl::make_unexpected(std::string(input)
                                    + " is not a valid IPv4 netmask"));
    }

    auto prefix = 0U;
    for (auto bits = addr->data(); bits; bits <<= 1) { prefix++; }

    return (ipv4_mask(prefix));
}

tl::expected<ipv4_mask, std::string> parse_ipv4_mask(std::string_view input)
{
    if (input.find('.') != std::string_view::npos) {
        return (parse_dotted_mask(input));
    }

    auto text = input;
    if (!text.empty() && text.front() == '/') { text.remove_prefix(1); }

    auto prefix = 0U;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), prefix);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return (tl::make_unexpected("Invalid IPv4 prefix length: "
                                    + std::string(input)));
    }

    if (prefix > ipv4_mask::max_prefix_length) {
        return (tl::make_unexpected(
            std::to_string(prefix) + " is larger than "
            + std::to_string(ipv4_mask::max_prefix_length)));
    }

    return (ipv4_mask(prefix));
}

std::string to_string(const ipv4_mask& mask)
{
    return ("/" + std::to_string(mask.prefix_length()));
}

std::string to_extended_string(const ipv4_mask& mask)
{
    return (to_string(ipv4_address(mask.data())));
}

int compare(const ipv4_mask& lhs, const ipv4_mask& rhs)
{
    if (lhs.prefix_length() < rhs.prefix_length()) {
        return (1);
    } else if (lhs.prefix_length() > rhs.prefix_length()) {
        return (-1);
    } else {
        return (0);
    }
}

} // namespace libipam::type
