// src/xdp/xsk_port.hpp
// AF_XDP socket bound to the frame arena (KernelPortConcept over libxdp)
//
// Creates the UMEM over the arena, the socket on one queue, and exposes the
// four kernel-mapped rings to RingEngine. The classifier is attached before
// the socket is created so the socket binds to receive redirects.
//
// Usage:
//   FrameArena arena;  arena.init(cfg.arena_size, cfg.frame_size);
//   XskPort port;      port.open(cfg, arena);
//   RingEngine<XskPort> engine(arena, port, cfg.fill_target, cfg.rx_batch);
//   engine.prime();

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <memory>
#include <string>
#include <stdexcept>
#include <unistd.h>
#include <sys/socket.h>
#include <net/if.h>

#include <linux/if_xdp.h>
#include <linux/if_link.h>
#include <xdp/xsk.h>

#include "frame_ring.hpp"
#include "frame_arena.hpp"
#include "bpf_loader.hpp"
#include "../engine_config.hpp"
#include "../pipeline/pipeline_config.hpp"

// SO_PREFER_BUSY_POLL / SO_BUSY_POLL_BUDGET are missing from older libc headers
#ifndef SO_PREFER_BUSY_POLL
#define SO_PREFER_BUSY_POLL 69
#endif
#ifndef SO_BUSY_POLL_BUDGET
#define SO_BUSY_POLL_BUDGET 70
#endif

namespace afterburner::xdp {

struct XskPortCounters {
    uint64_t tx_kicks = 0;
    uint64_t rx_kicks = 0;
    uint64_t kick_errors = 0;   // sendto/recvfrom errors other than EAGAIN/EBUSY/ENOBUFS
};

class XskPort {
public:
    XskPort() = default;

    ~XskPort() {
        close();
    }

    XskPort(const XskPort&) = delete;
    XskPort& operator=(const XskPort&) = delete;

    /**
     * Attach the classifier, create UMEM + socket, register in xsks_map
     *
     * @param attach_classifier false = bind to an already attached program
     * @throws std::runtime_error on any setup failure; partial state is undone
     */
    void open(const EngineConfig& config, FrameArena& arena, bool attach_classifier = true) {
        config_ = config;

        ifindex_ = if_nametoindex(config_.interface.c_str());
        if (ifindex_ == 0) {
            throw std::runtime_error("XskPort: Interface not found: " + config_.interface);
        }

        // Program first, then socket
        if (attach_classifier) {
            printf("[XDP] Loading classifier before socket creation...\n");
            classifier_ = std::make_unique<ClassifierLoader>();
            classifier_->load(config_.interface.c_str(), config_.bpf_object.c_str());
            classifier_->set_service_port(config_.service_port);
            classifier_->attach();
        }

        struct xsk_umem_config umem_cfg;
        memset(&umem_cfg, 0, sizeof(umem_cfg));
        umem_cfg.fill_size = config_.ring_capacity;
        umem_cfg.comp_size = config_.ring_capacity;
        umem_cfg.frame_size = config_.frame_size;
        umem_cfg.frame_headroom = pipeline::FRAME_HEADROOM;
        umem_cfg.flags = 0;

        int ret = xsk_umem__create(&umem_, arena.base(), arena.size(),
                                   &fill_ring_, &comp_ring_, &umem_cfg);
        if (ret) {
            umem_ = nullptr;
            classifier_.reset();
            throw std::runtime_error(std::string("XskPort: Failed to create UMEM: ") + strerror(-ret));
        }

        struct xsk_socket_config xsk_cfg;
        memset(&xsk_cfg, 0, sizeof(xsk_cfg));
        xsk_cfg.rx_size = config_.ring_capacity;
        xsk_cfg.tx_size = config_.ring_capacity;
        // Our own program is attached; stop libxdp from loading its default one
        xsk_cfg.libbpf_flags = XSK_LIBBPF_FLAGS__INHIBIT_PROG_LOAD;
        xsk_cfg.xdp_flags = 0;
        // NEED_WAKEUP in both modes so the engine only kicks when asked to
        xsk_cfg.bind_flags = config_.zero_copy ? (XDP_ZEROCOPY | XDP_USE_NEED_WAKEUP)
                                               : (XDP_COPY | XDP_USE_NEED_WAKEUP);

        ret = xsk_socket__create(&xsk_, config_.interface.c_str(), config_.queue_id,
                                 umem_, &rx_ring_, &tx_ring_, &xsk_cfg);
        if (ret && config_.zero_copy) {
            printf("[XDP] Zero-copy bind failed (%s), retrying in copy mode\n", strerror(-ret));
            xsk_cfg.bind_flags = XDP_COPY | XDP_USE_NEED_WAKEUP;
            ret = xsk_socket__create(&xsk_, config_.interface.c_str(), config_.queue_id,
                                     umem_, &rx_ring_, &tx_ring_, &xsk_cfg);
            zero_copy_active_ = false;
        } else {
            zero_copy_active_ = config_.zero_copy;
        }
        if (ret) {
            xsk_ = nullptr;
            xsk_umem__delete(umem_);
            umem_ = nullptr;
            classifier_.reset();
            throw std::runtime_error(std::string("XskPort: Failed to create XDP socket: ") + strerror(-ret));
        }

        fd_ = xsk_socket__fd(xsk_);

        // Busy-poll: the kernel polls the NIC queue inside our syscalls
        int prefer = 1;
        int budget = static_cast<int>(config_.busy_poll_budget);
        int usec = static_cast<int>(config_.busy_poll_usec);
        if (setsockopt(fd_, SOL_SOCKET, SO_PREFER_BUSY_POLL, &prefer, sizeof(prefer)) < 0 ||
            setsockopt(fd_, SOL_SOCKET, SO_BUSY_POLL_BUDGET, &budget, sizeof(budget)) < 0 ||
            setsockopt(fd_, SOL_SOCKET, SO_BUSY_POLL, &usec, sizeof(usec)) < 0) {
            printf("[XDP] Warning: busy-poll socket options not applied: %s\n", strerror(errno));
        } else {
            printf("[XDP] SO_BUSY_POLL=%d us, budget=%d\n", usec, budget);
        }

        if (classifier_) {
            try {
                classifier_->register_xsk_socket(xsk_);
            } catch (const std::exception&) {
                close();
                throw;
            }
        }

        printf("[XDP] Socket on %s queue %u (%s mode, ring=%u)\n",
               config_.interface.c_str(), config_.queue_id,
               zero_copy_active_ ? "zero-copy" : "copy", config_.ring_capacity);
    }

    void close() {
        if (xsk_) {
            xsk_socket__delete(xsk_);
            xsk_ = nullptr;
        }
        if (umem_) {
            xsk_umem__delete(umem_);
            umem_ = nullptr;
        }
        classifier_.reset();
        fd_ = -1;
    }

    // ========================================================================
    // KernelPortConcept
    // ========================================================================

    struct xsk_ring_prod* fill_ring() { return &fill_ring_; }
    struct xsk_ring_cons* rx_ring() { return &rx_ring_; }
    struct xsk_ring_prod* tx_ring() { return &tx_ring_; }
    struct xsk_ring_cons* completion_ring() { return &comp_ring_; }

    uint32_t headroom() const { return pipeline::FRAME_HEADROOM; }

    // Wake the TX path; EAGAIN/EBUSY/ENOBUFS mean the kernel is already busy
    void kick_tx() {
        counters_.tx_kicks++;
        if (sendto(fd_, nullptr, 0, MSG_DONTWAIT, nullptr, 0) < 0) {
            if (errno != EAGAIN && errno != EBUSY && errno != ENOBUFS && errno != ENETDOWN) {
                counters_.kick_errors++;
            }
        }
    }

    // Wake the RX path when the Fill ring asks for it
    void kick_rx() {
        counters_.rx_kicks++;
        if (recvfrom(fd_, nullptr, 0, MSG_DONTWAIT, nullptr, nullptr) < 0) {
            if (errno != EAGAIN && errno != EBUSY && errno != ENOBUFS && errno != ENETDOWN) {
                counters_.kick_errors++;
            }
        }
    }

    int fd() const { return fd_; }
    bool zero_copy_active() const { return zero_copy_active_; }
    const XskPortCounters& counters() const { return counters_; }
    ClassifierLoader* classifier() { return classifier_.get(); }

private:
    EngineConfig config_;
    unsigned int ifindex_ = 0;
    int fd_ = -1;
    bool zero_copy_active_ = false;

    struct xsk_umem* umem_ = nullptr;
    struct xsk_socket* xsk_ = nullptr;
    struct xsk_ring_prod fill_ring_ = {};
    struct xsk_ring_cons comp_ring_ = {};
    struct xsk_ring_cons rx_ring_ = {};
    struct xsk_ring_prod tx_ring_ = {};

    std::unique_ptr<ClassifierLoader> classifier_;
    XskPortCounters counters_;
};

} // namespace afterburner::xdp
