#include "peer/internal/interrupts.hpp"

#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <signal.h>

namespace p2ps {

namespace {

int maskSigint(int how) {
    sigset_t sigint_set;
    sigemptyset(&sigint_set);
    sigaddset(&sigint_set, SIGINT);

    //returns the error instead of setting errno
    int res = pthread_sigmask(how, &sigint_set, nullptr);
    if (res != 0) {
        std::cerr << "[interrupts] Could not change signal mask: " << std::strerror(res) << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} //namespace

int blockInterrupts() {
    return maskSigint(SIG_BLOCK);
}

int catchInterrupts(void (*handler)(int)) {
    struct sigaction sa {};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) < 0) {
        std::cerr << "[interrupts] Could not install SIGINT handler: " << std::strerror(errno) << std::endl;
        return EXIT_FAILURE;
    }

    return maskSigint(SIG_UNBLOCK);
}

} //p2ps
