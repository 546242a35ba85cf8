//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "distribution.hpp"

#include <algorithm>
#include <cstdlib>
#include <thread>

#include "errors.hpp"
#include "spdlog/spdlog.h"

const std::string WORKER_NAME = "worker";

// GrpcNodeConnector
GrpcNodeConnector::GrpcNodeConnector(std::chrono::milliseconds connect_timeout) : connect_timeout(connect_timeout)
{
}
std::shared_ptr<grpc::Channel> GrpcNodeConnector::getChannel(const std::string &node)
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = channels.find(node);
    if (it != channels.end())
        return it->second;
    auto channel = grpc::CreateChannel(node, grpc::InsecureChannelCredentials());
    channels.emplace(node, channel);
    return channel;
}
bool GrpcNodeConnector::connect(const std::string &node)
{
    auto channel = getChannel(node);
    return channel->WaitForConnected(std::chrono::system_clock::now() + connect_timeout);
}
bool GrpcNodeConnector::lookupWorker(const std::string &node)
{
    auto stub = Bootstrap::NewStub(getChannel(node));
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + connect_timeout);
    BootstrapLookupRequest req;
    BootstrapLookupResponse res;
    req.set_name(WORKER_NAME);
    auto status = stub->Lookup(&context, req, &res);
    if (!status.ok())
    {
        spdlog::debug("lookup on {} failed: {}", node, status.error_message());
        return false;
    }
    return res.found();
}
void GrpcNodeConnector::initiate(const std::string &node, const std::string &leader)
{
    auto stub = Bootstrap::NewStub(getChannel(node));
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + connect_timeout);
    BootstrapInitiateRequest req;
    BootstrapInitiateResponse res;
    req.mutable_leader()->set_host(leader);
    checkStatus(stub->Initiate(&context, req, &res), "Initiate", node);
}

void initLeader(const std::vector<std::string> &worker_nodes, INodeConnector &connector, const LeaderOptions &options)
{
    std::vector<std::string> disconnected = worker_nodes;
    std::vector<std::string> uninitiated;

    for (size_t attempt = 0; attempt < options.max_attempts; ++attempt)
    {
        std::vector<std::string> still_disconnected;
        for (auto &node : disconnected)
        {
            if (connector.connect(node))
                uninitiated.push_back(node);
            else
                still_disconnected.push_back(node);
        }
        disconnected = std::move(still_disconnected);

        std::vector<std::string> still_uninitiated;
        for (auto &node : uninitiated)
        {
            if (!connector.lookupWorker(node))
            {
                still_uninitiated.push_back(node);
                continue;
            }
            try
            {
                connector.initiate(node, options.leader_id);
                spdlog::debug("initiated worker on {}", node);
            }
            catch (RemoteError &e)
            {
                spdlog::warn("could not initiate worker on {}: {}", node, e.what());
                still_uninitiated.push_back(node);
            }
        }
        uninitiated = std::move(still_uninitiated);

        if (disconnected.empty() && uninitiated.empty())
        {
            spdlog::info("established connection with all worker nodes");
            return;
        }
        if (attempt + 1 < options.max_attempts)
        {
            spdlog::warn("attempt {} of {}: {} nodes unreachable, {} nodes without a worker",
                         attempt + 1,
                         options.max_attempts,
                         disconnected.size(),
                         uninitiated.size());
            std::this_thread::sleep_for(options.attempt_gap);
        }
    }
    throw BootstrapTimeoutError(disconnected, uninitiated);
}

void initWorker(NodeRuntime &runtime, const WorkerOptions &options)
{
    auto &bootstrap = runtime.getBootstrap();
    bootstrap.registerName(WORKER_NAME);

    auto leader_future = bootstrap.getLeader();
    if (leader_future.wait_for(options.timeout) != std::future_status::ready)
        throw BootstrapTimeoutError(static_cast<long long>(options.timeout.count()));
    const std::string leader = leader_future.get();
    spdlog::info("established connection with the leader node ({})", leader);

    auto channel = grpc::CreateChannel(leader, grpc::InsecureChannelCredentials());
    auto stub = Bootstrap::NewStub(channel);
    watchLeader(
        [&]() {
            grpc::ClientContext context;
            context.set_deadline(std::chrono::system_clock::now() + options.ping_timeout);
            BootstrapPingRequest req;
            BootstrapPingResponse res;
            auto status = stub->Ping(&context, req, &res);
            if (!status.ok())
                spdlog::debug("ping to leader node {} failed: {}", leader, status.error_message());
            return status.ok();
        },
        options);
    spdlog::info("leader node {} is gone", leader);
}

void watchLeader(const std::function<bool()> &ping, const WorkerOptions &options)
{
    size_t missed = 0;
    while (true)
    {
        if (ping())
        {
            missed = 0;
        }
        else if (++missed >= options.max_missed_pings)
        {
            return;
        }
        else
        {
            spdlog::warn("leader did not answer ping ({} of {})", missed, options.max_missed_pings);
        }
        std::this_thread::sleep_for(options.leader_poll_interval);
    }
}

std::string CliOptions::defaultNodeAddress()
{
    const char *node = std::getenv("ARCHIPELAGO_NODE");
    if (node == nullptr || *node == '\0')
        return "127.0.0.1:50051";
    return node;
}

void initFromCliArgs(int argc,
                     const char *const argv[],
                     const Algorithm &algorithm,
                     LeaderFunction leader_fun,
                     const CliOptions &options)
{
    std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);

    if (!args.empty() && args[0] == "leader")
    {
        std::vector<std::string> worker_nodes(args.begin() + 1, args.end());
        NodeRuntime runtime(std::make_shared<const Algorithm>(algorithm), options.node_address);

        LeaderOptions leader_options = options.leader_options;
        if (leader_options.leader_id.empty())
            leader_options.leader_id = runtime.node();
        GrpcNodeConnector connector;
        initLeader(worker_nodes, connector, leader_options);

        std::vector<std::string> nodes = {runtime.node()};
        nodes.insert(nodes.end(), worker_nodes.begin(), worker_nodes.end());
        leader_fun(runtime, nodes);
        return;
    }
    if (args.size() == 1 && args[0] == "worker")
    {
        NodeRuntime runtime(std::make_shared<const Algorithm>(algorithm), options.node_address);
        initWorker(runtime, options.worker_options);
        return;
    }

    std::string joined;
    for (auto &arg : args)
        joined += (joined.empty() ? "" : " ") + arg;
    throw UsageError("got unexpected command line arguments: [" + joined +
                     "]\n\nExpected one of the following:\n\n  leader [worker node] [worker node] ...\n\n  worker");
}
