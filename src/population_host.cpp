//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "population_host.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include "cppassert.h"
#include "errors.hpp"
#include "spdlog/spdlog.h"

std::string to_string(WorkerState state)
{
    switch (state)
    {
    case WorkerState::SPAWNED:
        return "spawned";
    case WorkerState::AWAITING_ROSTER:
        return "awaiting roster";
    case WorkerState::RUNNING:
        return "running";
    case WorkerState::TERMINATED:
        return "terminated";
    case WorkerState::REPORTED:
        return "reported";
    case WorkerState::FAILED:
        return "failed";
    }
    return "unknown";
}

// PopulationWorker
PopulationWorker::PopulationWorker(std::shared_ptr<const Algorithm> algorithm,
                                   std::string node,
                                   size_t index,
                                   std::optional<uint64_t> seed,
                                   std::shared_ptr<IMigrationTransport> transport,
                                   std::shared_future<Roster> roster) :
    algorithm(std::move(algorithm)),
    node(std::move(node)),
    index(index),
    seed(seed),
    inbox(std::make_shared<Mailbox>()),
    transport(std::move(transport)),
    roster(std::move(roster)),
    report(report_promise.get_future())
{
}
PopulationWorker::~PopulationWorker()
{
    if (thread.joinable())
        thread.join();
}
void PopulationWorker::start()
{
    t_assert(!thread.joinable(), "A worker should only be started once.");
    thread = std::thread([this]() { run(); });
}
void PopulationWorker::setState(WorkerState new_state)
{
    state = new_state;
    spdlog::debug("population {} on {}: {}", index, node, to_string(new_state));
}
void PopulationWorker::run()
{
    try
    {
        const Lineage &lineage = algorithm->lineage(index);

        OperationContext ctx;
        ctx.objective = algorithm->getObjective();
        ctx.self_index = index;
        ctx.transport = transport;
        ctx.inbox = inbox;
        if (seed.has_value())
            ctx.rng = Rng(static_cast<size_t>(*seed + index));

        Population population;
        population.generation = 1;
        population = applyOperation(std::move(population), *lineage.initializer, ctx);
        if (lineage.initializer->invalidates_fitness)
            population.invalidateFitness();

        // The roster doubles as a barrier: nobody evolves before every population exists.
        setState(WorkerState::AWAITING_ROSTER);
        ctx.roster = roster.get();
        t_assert(ctx.roster.size() == algorithm->numPopulations(), "Roster should contain every population.");
        t_assert(ctx.roster[index].index == index, "Roster should be ordered by population index.");

        auto start = std::chrono::steady_clock::now();
        setState(WorkerState::RUNNING);
        while (true)
        {
            population = lineage.pipeline.apply(std::move(population), ctx);
            if (population.terminated)
                break;
            population.generation++;
        }
        auto time_us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        setState(WorkerState::TERMINATED);

        report_promise.set_value(
            PopulationReport{node, index, static_cast<uint64_t>(time_us.count()), std::move(population)});
        setState(WorkerState::REPORTED);
    }
    catch (std::exception &e)
    {
        spdlog::error("population {} on {} failed: {}", index, node, e.what());
        state = WorkerState::FAILED;
        report_promise.set_exception(std::current_exception());
    }
    catch (...)
    {
        // Reported as a std::exception, which is all the host and the node services handle.
        spdlog::error("population {} on {} failed with a non-standard exception", index, node);
        state = WorkerState::FAILED;
        report_promise.set_exception(std::make_exception_ptr(
            std::runtime_error("population " + std::to_string(index) + " threw a non-standard exception")));
    }
}
PopulationReport PopulationWorker::awaitReport()
{
    PopulationReport result = report.get();
    if (thread.joinable())
        thread.join();
    return result;
}

// PopulationHost
PopulationHost::PopulationHost(std::string node_id,
                               std::shared_ptr<const Algorithm> algorithm,
                               std::shared_ptr<IRemoteDelivery> remote) :
    node_id(std::move(node_id)), algorithm(std::move(algorithm)), remote(std::move(remote))
{
}
PopulationHost::~PopulationHost()
{
    // Workers that never received a roster would otherwise wait forever.
    for (auto &run_id : activeRuns())
        abandon(run_id);

    // Joined without holding the lock, running workers may still deliver migrants.
    std::map<std::string, std::shared_ptr<Run>> remaining;
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::swap(remaining, runs);
    }
    remaining.clear();
}
void PopulationHost::setRemoteDelivery(std::shared_ptr<IRemoteDelivery> remote)
{
    std::lock_guard<std::mutex> lock(mtx);
    this->remote = std::move(remote);
}
std::shared_ptr<PopulationHost::Run> PopulationHost::getRun(const std::string &run_id)
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = runs.find(run_id);
    if (it == runs.end())
        return nullptr;
    return it->second;
}
void PopulationHost::spawn(const std::string &run_id, const std::vector<size_t> &indices, std::optional<uint64_t> seed)
{
    auto run = std::make_shared<Run>();
    run->roster = run->roster_promise.get_future().share();

    std::shared_ptr<IRemoteDelivery> run_remote;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (runs.count(run_id) > 0)
            throw std::invalid_argument("run " + run_id + " is already hosted on " + node_id);
        run_remote = remote;
    }

    auto transport = std::make_shared<RunTransport>(*this, run_id, run_remote);
    for (size_t index : indices)
    {
        if (index >= algorithm->numPopulations())
        {
            throw std::invalid_argument("population index " + std::to_string(index) + " is out of range, there are " +
                                        std::to_string(algorithm->numPopulations()) + " populations");
        }
        if (run->workers.count(index) > 0)
            throw std::invalid_argument("population index " + std::to_string(index) + " is spawned twice");
        run->workers.emplace(index,
                             std::make_unique<PopulationWorker>(algorithm, node_id, index, seed, transport, run->roster));
    }

    // Registered before starting, so that deliveries can find the mailboxes.
    {
        std::lock_guard<std::mutex> lock(mtx);
        runs.emplace(run_id, run);
    }
    for (auto &[index, worker] : run->workers)
        worker->start();

    spdlog::debug("run {}: spawned {} populations on {}", run_id, indices.size(), node_id);
}
void PopulationHost::setRoster(const std::string &run_id, Roster roster)
{
    auto run = getRun(run_id);
    if (run == nullptr)
        throw std::invalid_argument("run " + run_id + " is not hosted on " + node_id);

    std::lock_guard<std::mutex> lock(mtx);
    t_assert(!run->roster_set, "The roster of a run should only be set once.");
    run->roster_set = true;
    run->roster_promise.set_value(std::move(roster));
}
void PopulationHost::deliver(const std::string &run_id, size_t index, MigrantBatch batch)
{
    auto run = getRun(run_id);
    if (run == nullptr)
    {
        spdlog::debug("run {}: dropped migrants for population {}, the run is no longer hosted on {}",
                      run_id,
                      index,
                      node_id);
        return;
    }
    auto it = run->workers.find(index);
    if (it == run->workers.end())
        throw std::invalid_argument("population " + std::to_string(index) + " is not hosted on " + node_id);
    it->second->getInbox().push(std::move(batch));
}
void PopulationHost::abandon(const std::string &run_id)
{
    auto run = getRun(run_id);
    if (run == nullptr)
        return;

    std::lock_guard<std::mutex> lock(mtx);
    if (run->roster_set)
        return;
    run->roster_set = true;
    run->roster_promise.set_exception(
        std::make_exception_ptr(std::runtime_error("run " + run_id + " was abandoned before it started")));
}
std::vector<PopulationReport> PopulationHost::awaitReports(const std::string &run_id)
{
    auto run = getRun(run_id);
    if (run == nullptr)
        throw std::invalid_argument("run " + run_id + " is not hosted on " + node_id);

    std::vector<PopulationReport> reports;
    std::exception_ptr first_failure = nullptr;
    for (auto &[index, worker] : run->workers)
    {
        try
        {
            reports.push_back(worker->awaitReport());
        }
        catch (std::exception &)
        {
            if (first_failure == nullptr)
                first_failure = std::current_exception();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        runs.erase(run_id);
    }
    if (first_failure != nullptr)
        std::rethrow_exception(first_failure);
    return reports;
}
std::vector<std::string> PopulationHost::activeRuns()
{
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> result;
    for (auto &[run_id, _] : runs)
        result.push_back(run_id);
    return result;
}

// RunTransport
RunTransport::RunTransport(PopulationHost &host, std::string run_id, std::shared_ptr<IRemoteDelivery> remote) :
    host(host), run_id(std::move(run_id)), remote(std::move(remote))
{
}
void RunTransport::send(const PopulationAddress &target, MigrantBatch batch)
{
    if (target.node == host.node())
    {
        host.deliver(run_id, target.index, std::move(batch));
        return;
    }
    if (remote == nullptr)
        throw RemoteError("no remote delivery configured to reach " + to_string(target));
    remote->deliver(run_id, target, batch);
}
