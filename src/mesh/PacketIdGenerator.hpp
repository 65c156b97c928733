#pragma once

#include "mesh/MeshTypes.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace meshirc::mesh {

// Packet ids the way radio firmware hands them out: a random starting point,
// then monotonically increasing, never 0 (0 means "no request").
class PacketIdGenerator {
public:
    PacketIdGenerator()
        : rng_(seed_engine_()),
          last_(dist32_(rng_)) {}

    RequestId next() {
        std::lock_guard<std::mutex> lk(mu_);
        ++last_;
        if (last_ == 0) ++last_;
        return last_;
    }

private:
    static std::mt19937 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937(seq);
    }

    std::mt19937 rng_;
    std::uniform_int_distribution<std::uint32_t> dist32_{1, 0x7FFFFFFFu};

    std::mutex mu_;
    RequestId last_;
};

} // namespace meshirc::mesh
