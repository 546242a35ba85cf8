//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Population workers and the per-node set of workers hosting the populations of a run.

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "algorithm.hpp"
#include "mailbox.hpp"
#include "migration.hpp"
#include "report.hpp"

enum class WorkerState
{
    SPAWNED,
    AWAITING_ROSTER,
    RUNNING,
    TERMINATED,
    REPORTED,
    FAILED
};

std::string to_string(WorkerState state);

/**
 * @brief Delivers migrant batches to populations hosted by other nodes.
 */
class IRemoteDelivery
{
  public:
    virtual ~IRemoteDelivery() = default;

    virtual void deliver(const std::string &run_id, const PopulationAddress &target, const MigrantBatch &batch) = 0;
};

/**
 * @brief Evolves a single population on its own thread.
 *
 * The worker initializes its population right away, then waits for the roster of the run before
 * evolving it generation by generation until it terminates.
 */
class PopulationWorker
{
    std::shared_ptr<const Algorithm> algorithm;
    const std::string node;
    const size_t index;
    std::optional<uint64_t> seed;

    std::shared_ptr<Mailbox> inbox;
    std::shared_ptr<IMigrationTransport> transport;
    std::shared_future<Roster> roster;

    std::atomic<WorkerState> state{WorkerState::SPAWNED};
    std::promise<PopulationReport> report_promise;
    std::future<PopulationReport> report;
    std::thread thread;

    void run();
    void setState(WorkerState new_state);

  public:
    PopulationWorker(std::shared_ptr<const Algorithm> algorithm,
                     std::string node,
                     size_t index,
                     std::optional<uint64_t> seed,
                     std::shared_ptr<IMigrationTransport> transport,
                     std::shared_future<Roster> roster);
    ~PopulationWorker();

    PopulationWorker(const PopulationWorker &) = delete;
    PopulationWorker &operator=(const PopulationWorker &) = delete;

    void start();

    WorkerState getState() const
    {
        return state.load();
    }
    size_t getIndex() const
    {
        return index;
    }
    Mailbox &getInbox()
    {
        return *inbox;
    }

    // Blocks until the worker finished. Rethrows the exception the worker failed with.
    PopulationReport awaitReport();
};

/**
 * @brief The population workers of one node, grouped by run.
 *
 * A run proceeds as follows: `spawn` creates and starts the workers, `setRoster` releases them,
 * `deliver` forwards migrants to their mailboxes and `awaitReports` collects the final populations.
 */
class PopulationHost
{
    struct Run
    {
        std::promise<Roster> roster_promise;
        std::shared_future<Roster> roster;
        bool roster_set = false;
        std::map<size_t, std::unique_ptr<PopulationWorker>> workers;
    };

    const std::string node_id;
    std::shared_ptr<const Algorithm> algorithm;
    std::shared_ptr<IRemoteDelivery> remote;

    std::mutex mtx;
    std::map<std::string, std::shared_ptr<Run>> runs;

    std::shared_ptr<Run> getRun(const std::string &run_id);

  public:
    PopulationHost(std::string node_id,
                   std::shared_ptr<const Algorithm> algorithm,
                   std::shared_ptr<IRemoteDelivery> remote = nullptr);
    ~PopulationHost();

    const std::string &node() const
    {
        return node_id;
    }
    const Algorithm &getAlgorithm() const
    {
        return *algorithm;
    }
    void setRemoteDelivery(std::shared_ptr<IRemoteDelivery> remote);

    void spawn(const std::string &run_id, const std::vector<size_t> &indices, std::optional<uint64_t> seed);
    void setRoster(const std::string &run_id, Roster roster);
    // Migrants for a run that is no longer hosted are dropped.
    void deliver(const std::string &run_id, size_t index, MigrantBatch batch);
    // Releases workers still waiting for a roster with an error, so that the run can be collected.
    void abandon(const std::string &run_id);
    // Blocks until all workers of the run finished, rethrows the first worker failure.
    std::vector<PopulationReport> awaitReports(const std::string &run_id);

    std::vector<std::string> activeRuns();
};

/**
 * @brief Routes migrants of one run: to local mailboxes, or through the remote delivery.
 */
class RunTransport : public IMigrationTransport
{
    PopulationHost &host;
    const std::string run_id;
    std::shared_ptr<IRemoteDelivery> remote;

  public:
    RunTransport(PopulationHost &host, std::string run_id, std::shared_ptr<IRemoteDelivery> remote);

    void send(const PopulationAddress &target, MigrantBatch batch) override;
};
