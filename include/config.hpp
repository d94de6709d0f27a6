#pragma once

#include <cstdint>
#include <string>

namespace p2ps {

//CONNECT TIMEOUTS
#define CONNECT_TIMEOUT_SEC 5 // seconds
#define PROBE_TIMEOUT_SEC   3 // seconds

//pending connections the kernel holds before accept() picks them up
#define LISTEN_BACKLOG 16

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Config
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A struct to store basic config options offered by this software.
 *
 * Fields:
 * -> port:
 *    The port the peer listener opens on.
 * -> shared_dir:
 *    Directory whose regular files are offered to other peers.
 * -> download_dir:
 *    Directory downloaded files are written into.
 * -> connect_timeout_sec:
 *    How long a connect to a peer is attempted for.
 * -> probe_timeout_sec:
 *    How long a reachability probe is attempted for.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct Config {
    uint16_t    port                = 0;
    std::string shared_dir          = "shared";
    std::string download_dir        = "downloads";
    long        connect_timeout_sec = CONNECT_TIMEOUT_SEC;
    long        probe_timeout_sec   = PROBE_TIMEOUT_SEC;
};

}
