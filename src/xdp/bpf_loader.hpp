// src/xdp/bpf_loader.hpp
// Loader for the service-port XDP classifier
//
// Loads service_filter.bpf.o, writes the service port into config_map,
// attaches the program to the interface (native mode, SKB fallback),
// registers the AF_XDP socket in xsks_map and reads the per-CPU counters.

#pragma once

#include <bpf/libbpf.h>
#include <bpf/bpf.h>
#include <xdp/xsk.h>
#include <linux/if_link.h>
#include <linux/bpf.h>
#include <net/if.h>

#include <string>
#include <vector>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <stdexcept>
#include <arpa/inet.h>

#include "bpf/classifier_logic.h"

namespace afterburner::xdp {

struct ClassifierStats {
    uint64_t total;
    uint64_t redirected;
    uint64_t passed;
    uint64_t parse_errors;
};

class ClassifierLoader {
private:
    struct bpf_object* bpf_obj_ = nullptr;
    struct bpf_program* bpf_prog_ = nullptr;
    int prog_fd_ = -1;
    int ifindex_ = 0;

    // Map file descriptors
    int xsks_map_fd_ = -1;
    int config_map_fd_ = -1;
    int stats_map_fd_ = -1;

    bool attached_ = false;
    uint32_t xdp_flags_ = 0;  // Flags used during attach, reused on detach
    std::string interface_;

public:
    ClassifierLoader() = default;

    ~ClassifierLoader() {
        cleanup();
    }

    ClassifierLoader(const ClassifierLoader&) = delete;
    ClassifierLoader& operator=(const ClassifierLoader&) = delete;

    // Open and load the classifier object into the kernel
    void load(const char* interface, const char* bpf_obj_path) {
        if (!interface || !bpf_obj_path) {
            throw std::runtime_error("ClassifierLoader: Invalid parameters");
        }

        interface_ = interface;
        ifindex_ = static_cast<int>(if_nametoindex(interface));
        if (ifindex_ == 0) {
            throw std::runtime_error(std::string("ClassifierLoader: Interface not found: ") + interface);
        }

        printf("[BPF] Loading classifier from: %s\n", bpf_obj_path);

        bpf_obj_ = bpf_object__open_file(bpf_obj_path, nullptr);
        if (libbpf_get_error(bpf_obj_)) {
            bpf_obj_ = nullptr;
            throw std::runtime_error(std::string("ClassifierLoader: Failed to open BPF object: ") +
                                     bpf_obj_path);
        }

        bpf_prog_ = bpf_object__find_program_by_name(bpf_obj_, "service_filter");
        if (!bpf_prog_) {
            cleanup();
            throw std::runtime_error("ClassifierLoader: Failed to find XDP program 'service_filter'");
        }

        int ret = bpf_object__load(bpf_obj_);
        if (ret) {
            cleanup();
            throw std::runtime_error(std::string("ClassifierLoader: Failed to load BPF program: ") +
                                     strerror(-ret));
        }

        prog_fd_ = bpf_program__fd(bpf_prog_);
        xsks_map_fd_ = bpf_object__find_map_fd_by_name(bpf_obj_, "xsks_map");
        config_map_fd_ = bpf_object__find_map_fd_by_name(bpf_obj_, "config_map");
        stats_map_fd_ = bpf_object__find_map_fd_by_name(bpf_obj_, "stats_map");

        if (prog_fd_ < 0 || xsks_map_fd_ < 0 || config_map_fd_ < 0 || stats_map_fd_ < 0) {
            cleanup();
            throw std::runtime_error("ClassifierLoader: Failed to get program/map FDs");
        }

        printf("[BPF] Program loaded (prog_fd=%d xsks=%d config=%d stats=%d)\n",
               prog_fd_, xsks_map_fd_, config_map_fd_, stats_map_fd_);
    }

    // Set the UDP destination port to redirect (host byte order)
    void set_service_port(uint16_t port) {
        if (config_map_fd_ < 0) {
            throw std::runtime_error("ClassifierLoader: Config map not available");
        }

        uint32_t key = 0;
        uint16_t port_be = htons(port);
        if (bpf_map_update_elem(config_map_fd_, &key, &port_be, BPF_ANY) < 0) {
            throw std::runtime_error(
                std::string("ClassifierLoader: Failed to set service port: ") + strerror(errno));
        }
        printf("[BPF] Service port: %u\n", port);
    }

    // Attach in native driver mode, falling back to SKB (generic) mode
    void attach(uint32_t xdp_flags = XDP_FLAGS_DRV_MODE) {
        if (prog_fd_ < 0) {
            throw std::runtime_error("ClassifierLoader: Program not loaded");
        }
        if (attached_) {
            return;
        }

        printf("[BPF] Attaching to %s (ifindex=%d)...\n", interface_.c_str(), ifindex_);

        __u32 existing_prog_id = 0;
        if (bpf_xdp_query_id(ifindex_, 0, &existing_prog_id) == 0 && existing_prog_id != 0) {
            printf("[BPF] Found existing XDP program (ID %u), will replace\n", existing_prog_id);
        }

        int ret = bpf_xdp_attach(ifindex_, prog_fd_, xdp_flags, nullptr);
        if (ret < 0) {
            printf("[BPF] Native mode failed (%s), trying SKB mode...\n", strerror(-ret));
            xdp_flags = XDP_FLAGS_SKB_MODE;
            ret = bpf_xdp_attach(ifindex_, prog_fd_, xdp_flags, nullptr);
        }

        if (ret < 0) {
            throw std::runtime_error(
                std::string("ClassifierLoader: Failed to attach XDP program: ") + strerror(-ret));
        }

        xdp_flags_ = xdp_flags;
        attached_ = true;
        printf("[BPF] Program attached to %s (%s mode)\n", interface_.c_str(),
               (xdp_flags & XDP_FLAGS_SKB_MODE) ? "SKB" : "native");
    }

    void detach() {
        if (!attached_ || ifindex_ == 0) {
            return;
        }

        int ret = bpf_xdp_detach(ifindex_, xdp_flags_, nullptr);
        if (ret < 0) {
            fprintf(stderr, "[BPF] Detach from %s failed: %s\n", interface_.c_str(), strerror(-ret));
        } else {
            printf("[BPF] Program detached from %s\n", interface_.c_str());
        }
        attached_ = false;
        xdp_flags_ = 0;
    }

    // Register AF_XDP socket in xsks_map under its queue id
    // xsk_socket__update_xskmap() is required for XSKMAP; a plain map update does not work
    void register_xsk_socket(struct xsk_socket* xsk) {
        if (xsks_map_fd_ < 0) {
            throw std::runtime_error("ClassifierLoader: XSKS map not available");
        }
        if (!xsk) {
            throw std::runtime_error("ClassifierLoader: Invalid XSK socket pointer");
        }

        int ret = xsk_socket__update_xskmap(xsk, xsks_map_fd_);
        if (ret < 0) {
            throw std::runtime_error(
                std::string("ClassifierLoader: Failed to register XSK socket: ") + strerror(-ret));
        }
        printf("[BPF] Registered AF_XDP socket fd=%d in xsks_map\n", xsk_socket__fd(xsk));
    }

    // Sum the per-CPU counters
    ClassifierStats get_stats() const {
        ClassifierStats stats = {};
        if (stats_map_fd_ < 0) {
            return stats;
        }

        int ncpus = libbpf_num_possible_cpus();
        if (ncpus <= 0) {
            return stats;
        }
        std::vector<uint64_t> values(static_cast<size_t>(ncpus));

        uint64_t* slots[AB_STAT_MAX] = {&stats.total, &stats.redirected, &stats.passed,
                                        &stats.parse_errors};
        for (uint32_t key = 0; key < AB_STAT_MAX; key++) {
            if (bpf_map_lookup_elem(stats_map_fd_, &key, values.data()) != 0) {
                continue;
            }
            for (uint64_t v : values) {
                *slots[key] += v;
            }
        }
        return stats;
    }

    void print_stats() const {
        ClassifierStats stats = get_stats();
        printf("[BPF] total=%lu redirected=%lu passed=%lu parse_errors=%lu\n",
               stats.total, stats.redirected, stats.passed, stats.parse_errors);
    }

    bool is_attached() const { return attached_; }

private:
    void cleanup() {
        detach();

        if (bpf_obj_) {
            bpf_object__close(bpf_obj_);
            bpf_obj_ = nullptr;
        }

        bpf_prog_ = nullptr;
        prog_fd_ = -1;
        xsks_map_fd_ = -1;
        config_map_fd_ = -1;
        stats_map_fd_ = -1;
    }
};

} // namespace afterburner::xdp
