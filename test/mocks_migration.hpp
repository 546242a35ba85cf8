#pragma once

#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>

#include "migration.hpp"
#include "trompeloeil.hpp"

class MockMigrationTransport : public trompeloeil::mock_interface<IMigrationTransport>
{
  public:
    IMPLEMENT_MOCK2(send);
};
