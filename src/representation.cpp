//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "representation.hpp"

#include "errors.hpp"

RepresentationRegistry::RepresentationRegistry(const RepresentationRegistry &o)
{
    std::lock_guard<std::mutex> lock(o.mtx);
    representations = o.representations;
}
RepresentationRegistry &RepresentationRegistry::operator=(const RepresentationRegistry &o)
{
    if (this == &o)
        return *this;
    std::map<std::string, RepresentationPtr> copy;
    {
        std::lock_guard<std::mutex> lock(o.mtx);
        copy = o.representations;
    }
    std::lock_guard<std::mutex> lock(mtx);
    representations = std::move(copy);
    return *this;
}
void RepresentationRegistry::add(RepresentationPtr representation)
{
    if (representation == nullptr)
        return;
    std::lock_guard<std::mutex> lock(mtx);
    auto it = representations.find(representation->tag());
    if (it == representations.end())
    {
        representations.emplace(representation->tag(), std::move(representation));
        return;
    }
    if (it->second != representation)
    {
        throw IncompatibleRepresentationError("two different representations share the tag " +
                                              representation->tag());
    }
}
RepresentationPtr RepresentationRegistry::get(const std::string &tag) const
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = representations.find(tag);
    if (it == representations.end())
        throw IncompatibleRepresentationError("unknown representation " + tag);
    return it->second;
}
bool RepresentationRegistry::contains(const std::string &tag) const
{
    std::lock_guard<std::mutex> lock(mtx);
    return representations.find(tag) != representations.end();
}
std::vector<std::string> RepresentationRegistry::tags() const
{
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> result;
    for (auto &[tag, _] : representations)
        result.push_back(tag);
    return result;
}
