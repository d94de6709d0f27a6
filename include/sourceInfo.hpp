#pragma once

#include <cstdint>
#include <string>

namespace p2ps {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * SourceInfo
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A struct to store info about a peer you're talking to.
 *
 * Fields:
 * -> ip_addr:
 *    Peers IPV4 address.
 * -> port:
 *    Peers port number.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct SourceInfo {
    std::string ip_addr;
    uint16_t    port = 0;

    std::string label() const { return ip_addr + ":" + std::to_string(port); }
};

}
