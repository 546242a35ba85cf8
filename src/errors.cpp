//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "errors.hpp"

#include <sstream>

namespace
{
std::string join(const std::vector<std::string> &items, const std::string &separator)
{
    std::ostringstream oss;
    for (size_t idx = 0; idx < items.size(); ++idx)
    {
        if (idx > 0)
            oss << separator;
        oss << items[idx];
    }
    return oss.str();
}

std::string bootstrapMessage(const std::vector<std::string> &disconnected, const std::vector<std::string> &uninitiated)
{
    std::ostringstream oss;
    oss << "failed to establish connection to all workers within the given time limit";
    if (!disconnected.empty())
        oss << "\n\n  * could not connect to the following nodes: " << join(disconnected, ", ");
    if (!uninitiated.empty())
        oss << "\n\n  * no worker process found on the following nodes: " << join(uninitiated, ", ");
    return oss.str();
}
} // namespace

RepresentationMismatchError::RepresentationMismatchError(const std::string &operation_name,
                                                         const std::string &representation) :
    std::runtime_error("representation mismatch, \"" + operation_name + "\" does not accept " + representation),
    operation_name(operation_name),
    representation(representation)
{
}

InvalidInitializerError::InvalidInitializerError(const std::string &operation_name) :
    std::runtime_error("expected an initializer operation, got: \"" + operation_name + "\"")
{
}

MissingFitnessError::MissingFitnessError(const std::string &operation_name) :
    std::runtime_error("operation \"" + operation_name + "\" requires fitness, but it has not been computed")
{
}

MigrationTimeoutError::MigrationTimeoutError(long long timeout_ms) :
    std::runtime_error("immigration timed out after " + std::to_string(timeout_ms) +
                       "ms, populations are likely waiting for each other")
{
}

BootstrapTimeoutError::BootstrapTimeoutError(std::vector<std::string> disconnected,
                                             std::vector<std::string> uninitiated) :
    std::runtime_error(bootstrapMessage(disconnected, uninitiated)),
    disconnected(std::move(disconnected)),
    uninitiated(std::move(uninitiated))
{
}

BootstrapTimeoutError::BootstrapTimeoutError(long long timeout_ms) :
    std::runtime_error("expected to receive an initial message from the leader node within " +
                       std::to_string(timeout_ms) + "ms, but got none")
{
}
