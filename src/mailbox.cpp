//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "mailbox.hpp"

std::string to_string(const PopulationAddress &address)
{
    return address.node + "/" + std::to_string(address.index);
}

void Mailbox::push(MigrantBatch batch)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        batches.push_back(std::move(batch));
    }
    cv.notify_one();
}

std::optional<MigrantBatch> Mailbox::tryPop()
{
    std::lock_guard<std::mutex> lock(mtx);
    if (batches.empty())
        return std::nullopt;
    MigrantBatch batch = std::move(batches.front());
    batches.pop_front();
    return batch;
}

std::optional<MigrantBatch> Mailbox::popFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mtx);
    if (!cv.wait_for(lock, timeout, [this]() { return !batches.empty(); }))
        return std::nullopt;
    MigrantBatch batch = std::move(batches.front());
    batches.pop_front();
    return batch;
}

size_t Mailbox::size()
{
    std::lock_guard<std::mutex> lock(mtx);
    return batches.size();
}
