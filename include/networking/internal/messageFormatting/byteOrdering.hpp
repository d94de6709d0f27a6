#pragma once

#include <cstdint>
#include <endian.h>
#include <type_traits>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * toNetworkOrder
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Converts a fixed-width integer representation into big-endian, regardless
 *    of host ordering.
 *
 * Takes:
 * -> host_data:
 *    One of:
 *    -> uint16_t
 *    -> uint32_t
 *    -> uint64_t
 *
 * Returns:
 * -> On success:
 *    A big endian version of the input.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
template <typename T>
T toNetworkOrder(T host_data) {
    static_assert(std::is_same_v<T, uint16_t> ||
                  std::is_same_v<T, uint32_t> ||
                  std::is_same_v<T, uint64_t>,
                  "toNetworkOrder takes uint16_t, uint32_t or uint64_t");
    if constexpr (sizeof(T) == sizeof(uint16_t))
        return htobe16(host_data);
    else if constexpr (sizeof(T) == sizeof(uint32_t))
        return htobe32(host_data);
    else
        return htobe64(host_data);
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * fromNetworkOrder
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses the above operation. Takes a big-endian fixed-width integer
 *    representation and converts it to the host-machine's ordering.
 *
 * Takes:
 * -> network_data:
 *    One of:
 *    -> uint16_t
 *    -> uint32_t
 *    -> uint64_t
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
template <typename T>
T fromNetworkOrder(T network_data) {
    static_assert(std::is_same_v<T, uint16_t> ||
                  std::is_same_v<T, uint32_t> ||
                  std::is_same_v<T, uint64_t>,
                  "fromNetworkOrder takes uint16_t, uint32_t or uint64_t");
    if constexpr (sizeof(T) == sizeof(uint16_t))
        return be16toh(network_data);
    else if constexpr (sizeof(T) == sizeof(uint32_t))
        return be32toh(network_data);
    else
        return be64toh(network_data);
}

} //p2ps
