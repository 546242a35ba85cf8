//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "vector_representation.hpp"

std::shared_ptr<const RealRepresentation> realRepresentation()
{
    static std::shared_ptr<const RealRepresentation> representation = std::make_shared<RealRepresentation>("real");
    return representation;
}
std::shared_ptr<const BinaryRepresentation> binaryRepresentation()
{
    static std::shared_ptr<const BinaryRepresentation> representation =
        std::make_shared<BinaryRepresentation>("binary");
    return representation;
}
std::shared_ptr<const PermutationRepresentation> permutationRepresentation()
{
    static std::shared_ptr<const PermutationRepresentation> representation =
        std::make_shared<PermutationRepresentation>("permutation");
    return representation;
}
