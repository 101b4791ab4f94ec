#ifndef RUNLEASE_HPP
#define RUNLEASE_HPP

#include "DatabaseManager.hpp"
#include "EngineException.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

// Holds the plan's run lease for the lifetime of one run.
class RunLease {
public:
    // Throws PLAN_ALREADY_RUNNING when another live run holds the plan.
    RunLease(DatabaseManager& db, std::int64_t plan_id, std::string token, std::int64_t stale_after_seconds)
        : db(db),
          plan_id(plan_id),
          token(std::move(token)),
          refresh_interval(std::max<std::int64_t>(stale_after_seconds * 1000 / 3, 1)),
          last_refresh(std::chrono::steady_clock::now())
    {
        if (!db.acquire_run_lease(plan_id, this->token, stale_after_seconds)) {
            THROW_ENGINE_ERROR(ErrorCodes::Code::PLAN_ALREADY_RUNNING, "plan " + std::to_string(plan_id));
        }
    }

    ~RunLease()
    {
        try {
            db.release_run_lease(plan_id, token);
        } catch (const std::exception& ex) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->error("Failed to release run lease of plan {}: {}", plan_id, ex.what());
            }
        }
    }

    RunLease(const RunLease&) = delete;
    RunLease& operator=(const RunLease&) = delete;

    // Throws RUN_LEASE_LOST when another run has taken the plan over.
    void refresh()
    {
        last_refresh = std::chrono::steady_clock::now();
        if (!db.refresh_run_lease(plan_id, token)) {
            THROW_ENGINE_ERROR(ErrorCodes::Code::RUN_LEASE_LOST,
                               "plan " + std::to_string(plan_id) + ", run " + token);
        }
    }

    // Heartbeat for long transfers and hashes; writes at most every third of the stale window.
    void keep_alive()
    {
        if (std::chrono::steady_clock::now() - last_refresh >= refresh_interval) {
            refresh();
        }
    }

    const std::string& id() const { return token; }

private:
    DatabaseManager& db;
    std::int64_t plan_id;
    std::string token;
    std::chrono::milliseconds refresh_interval;
    std::chrono::steady_clock::time_point last_refresh;
};

#endif
