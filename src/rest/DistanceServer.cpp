#include "DistanceServer.h"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rest
{
    namespace
    {
        void setError(httplib::Response &res, int status, const std::string &message)
        {
            nlohmann::json err_json;
            err_json["error"] = message;
            res.status = status;
            res.set_content(err_json.dump(), "application/json");
        }
    } // namespace

    DistanceServer::DistanceServer(uint16_t port,
                                   std::shared_ptr<core::DistanceCache> cache,
                                   std::shared_ptr<providers::HaversineDistanceProvider> provider)
        : port_(port), cache_(std::move(cache)), provider_(std::move(provider))
    {
        if (!cache_)
        {
            throw std::invalid_argument("DistanceServer: cache is required");
        }
    }

    void DistanceServer::start()
    {
        server_ = std::make_unique<httplib::Server>();

        // GET /distance?from=lat,lon&to=lat,lon
        server_->Get("/distance", [this](const httplib::Request &req, httplib::Response &res)
                     {
            auto from = core::parseLatLon(req.get_param_value("from"));
            auto to = core::parseLatLon(req.get_param_value("to"));
            if (!from || !to) {
                setError(res, 400, "Query parameters 'from' and 'to' must be 'lat,lon'");
                return;
            }

            try {
                int distance = cache_->distanceInMeters(*from, *to);
                nlohmann::json result;
                result["from"] = {{"latitude", from->latitude()}, {"longitude", from->longitude()}};
                result["to"] = {{"latitude", to->latitude()}, {"longitude", to->longitude()}};
                result["distance_meters"] = distance;
                res.status = 200;
                res.set_content(result.dump(), "application/json");
            } catch (const std::invalid_argument &ex) {
                setError(res, 400, ex.what());
            } catch (const core::FetchTimeoutError &ex) {
                setError(res, 504, ex.what());
            } catch (const core::DistanceFetchError &ex) {
                setError(res, 502, ex.what());
            } });

        server_->Get("/metrics", [this](const httplib::Request &, httplib::Response &res)
                     {
            nlohmann::json metrics = cache_->getMetrics().toJson();
            metrics["last_road_network_update_ms"] = core::toEpochMillis(cache_->lastKnownUpdate());
            res.status = 200;
            res.set_content(metrics.dump(), "application/json"); });

        // POST /road-network-update
        server_->Post("/road-network-update", [this](const httplib::Request &, httplib::Response &res)
                      {
            if (!provider_) {
                setError(res, 404, "Road network updates are not supported by this provider");
                return;
            }
            provider_->markRoadNetworkUpdated();
            bool polled = cache_->refreshFreshness();
            nlohmann::json result;
            result["last_road_network_update_ms"] = core::toEpochMillis(cache_->lastKnownUpdate());
            result["polled"] = polled;
            res.status = 200;
            res.set_content(result.dump(), "application/json"); });

        std::cout << "===========================================" << std::endl;
        std::cout << "  Road Distance Cache REST API Server" << std::endl;
        std::cout << "===========================================" << std::endl;
        std::cout << "  GET  /distance?from=lat,lon&to=lat,lon" << std::endl;
        std::cout << "  GET  /metrics" << std::endl;
        std::cout << "  POST /road-network-update" << std::endl;
        std::cout << "  Port:   " << port_ << std::endl;
        std::cout << "===========================================" << std::endl;

        spdlog::info("DistanceServer: listening on 0.0.0.0:{}", port_);
        if (!server_->listen("0.0.0.0", port_))
        {
            spdlog::error("DistanceServer: failed to listen on port {}", port_);
            throw std::runtime_error("DistanceServer: failed to listen on port " + std::to_string(port_));
        }
    }

    void DistanceServer::stop()
    {
        if (server_)
        {
            server_->stop();
        }
    }

} // namespace rest
