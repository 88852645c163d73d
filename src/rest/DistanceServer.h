#pragma once

#include "../core/DistanceCache.h"
#include "../providers/HaversineDistanceProvider.h"

#include <cstdint>
#include <memory>
#include <string>
#include <httplib.h>

namespace rest
{

    class DistanceServer
    {
    public:
        DistanceServer(uint16_t port,
                       std::shared_ptr<core::DistanceCache> cache,
                       std::shared_ptr<providers::HaversineDistanceProvider> provider);
        void start();
        void stop();

    private:
        uint16_t port_;
        std::shared_ptr<core::DistanceCache> cache_;
        std::shared_ptr<providers::HaversineDistanceProvider> provider_;
        std::unique_ptr<httplib::Server> server_;
    };

} // namespace rest
