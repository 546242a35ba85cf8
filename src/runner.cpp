//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>

#include "spdlog/spdlog.h"

namespace
{
std::string newRunId()
{
    static std::atomic<uint64_t> counter{0};
    std::random_device rd;
    std::ostringstream oss;
    oss << std::hex << rd() << rd() << "-" << counter++;
    return oss.str();
}
} // namespace

// LocalNodeHandle
LocalNodeHandle::LocalNodeHandle(std::shared_ptr<PopulationHost> host) : host(std::move(host))
{
}
void LocalNodeHandle::startPopulations(const std::string &run_id,
                                       const std::vector<size_t> &indices,
                                       std::optional<uint64_t> seed)
{
    host->spawn(run_id, indices, seed);
}
void LocalNodeHandle::setRoster(const std::string &run_id, const Roster &roster)
{
    host->setRoster(run_id, roster);
}
std::vector<PopulationReport> LocalNodeHandle::awaitReports(const std::string &run_id)
{
    return host->awaitReports(run_id);
}
void LocalNodeHandle::abandon(const std::string &run_id)
{
    host->abandon(run_id);
}

std::vector<std::vector<size_t>> splitEvenly(size_t num_populations, size_t num_groups)
{
    if (num_groups == 0)
        throw std::invalid_argument("populations cannot be split into zero groups");

    std::vector<std::vector<size_t>> groups(num_groups);
    size_t index = 0;
    for (size_t group = 0; group < num_groups; ++group)
    {
        size_t group_size = num_populations / num_groups + (group < num_populations % num_groups ? 1 : 0);
        for (size_t i = 0; i < group_size; ++i)
            groups[group].push_back(index++);
    }
    return groups;
}

void validatePopulationGroups(const std::vector<std::vector<size_t>> &groups, size_t num_populations, size_t num_nodes)
{
    if (groups.size() != num_nodes)
    {
        throw std::invalid_argument("expected one population group per node (" + std::to_string(num_nodes) +
                                    "), got " + std::to_string(groups.size()));
    }
    std::vector<char> seen(num_populations, 0);
    for (auto &group : groups)
    {
        for (size_t index : group)
        {
            if (index >= num_populations)
                throw std::invalid_argument("population index " + std::to_string(index) + " is out of range");
            if (seen[index])
                throw std::invalid_argument("population " + std::to_string(index) + " is in more than one group");
            seen[index] = 1;
        }
    }
    auto missing = std::find(seen.begin(), seen.end(), 0);
    if (missing != seen.end())
    {
        throw std::invalid_argument("population " + std::to_string(missing - seen.begin()) +
                                    " is not in any group");
    }
}

// Runner
Runner::Runner(std::shared_ptr<PopulationHost> host, NodeConnectFunction connect_remote) :
    host(std::move(host)), connect_remote(std::move(connect_remote))
{
}

Report Runner::run(const RunOptions &options)
{
    const size_t num_populations = host->getAlgorithm().numPopulations();

    std::vector<std::string> nodes = options.nodes;
    if (nodes.empty())
        nodes.push_back(host->node());

    std::vector<std::vector<size_t>> groups = options.population_groups;
    if (groups.empty())
        groups = splitEvenly(num_populations, nodes.size());
    validatePopulationGroups(groups, num_populations, nodes.size());

    std::vector<std::shared_ptr<INodeHandle>> handles;
    for (auto &node : nodes)
    {
        if (node == host->node())
            handles.push_back(std::make_shared<LocalNodeHandle>(host));
        else if (connect_remote != nullptr)
            handles.push_back(connect_remote(node));
        else
            throw std::invalid_argument("cannot reach node " + node + " from a local-only runner");
    }

    const std::string run_id = newRunId();
    spdlog::info("run {}: {} populations on {} nodes", run_id, num_populations, nodes.size());
    auto start = std::chrono::steady_clock::now();

    Roster roster(num_populations);
    for (size_t group = 0; group < groups.size(); ++group)
    {
        for (size_t index : groups[group])
            roster[index] = PopulationAddress{nodes[group], index};
    }

    // Every worker has to exist before any of them receives the roster.
    size_t started = 0;
    try
    {
        for (; started < handles.size(); ++started)
            handles[started]->startPopulations(run_id, groups[started], options.seed);
        for (auto &handle : handles)
            handle->setRoster(run_id, roster);
    }
    catch (std::exception &e)
    {
        spdlog::error("run {}: failed to start: {}", run_id, e.what());
        for (size_t idx = 0; idx < started; ++idx)
        {
            // Abandoned workers always fail, only the original error is rethrown.
            try
            {
                handles[idx]->abandon(run_id);
                handles[idx]->awaitReports(run_id);
            }
            catch (std::exception &cleanup)
            {
                spdlog::debug("run {}: abandoned node {}: {}", run_id, nodes[idx], cleanup.what());
            }
        }
        throw;
    }

    Report report;
    std::exception_ptr first_failure = nullptr;
    for (size_t idx = 0; idx < handles.size(); ++idx)
    {
        try
        {
            auto reports = handles[idx]->awaitReports(run_id);
            std::move(reports.begin(), reports.end(), std::back_inserter(report.population_reports));
        }
        catch (std::exception &e)
        {
            spdlog::error("run {}: node {} failed: {}", run_id, nodes[idx], e.what());
            if (first_failure == nullptr)
                first_failure = std::current_exception();
        }
    }
    if (first_failure != nullptr)
        std::rethrow_exception(first_failure);

    report.total_time_us = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count());
    std::sort(report.population_reports.begin(),
              report.population_reports.end(),
              [](const PopulationReport &a, const PopulationReport &b) { return a.index < b.index; });

    spdlog::info("run {}: finished in {}us", run_id, report.total_time_us);
    return report;
}

Report run(const Algorithm &algorithm, const RunOptions &options)
{
    auto host = std::make_shared<PopulationHost>("local", std::make_shared<const Algorithm>(algorithm));
    Runner runner(host);
    return runner.run(options);
}
