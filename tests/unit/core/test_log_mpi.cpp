#include "master/Log.hpp"
#include <catch2/catch_all.hpp>
#include <mpi.h>

using namespace gridflow::master::logx;

TEST_CASE("Log levels parse from strings", "[log]")
{
    CHECK(level_from_string("QUIET") == Level::Quiet);
    CHECK(level_from_string("warning") == Level::Warn);
    CHECK(level_from_string("full") == Level::Debug);
    CHECK(level_from_string("nonsense", Level::Error) == Level::Error);
}

TEST_CASE("init picks up the MPI rank and gates by level", "[log][mpi]")
{
    int world_rank = -1;
    MPI_Comm_rank(MPI_COMM_WORLD, &world_rank);

    init({.level = Level::Warn, .rank0_only = true});
    CHECK(rank() == world_rank);
    CHECK(level() == Level::Warn);
    CHECK_FALSE(enabled(Level::Info));
    CHECK(enabled(Level::Error));
    CHECK(enabled(Level::Warn));
    CHECK_FALSE(enabled(Level::Quiet));

    init({.level = Level::Debug});
    CHECK(enabled(Level::Debug));
    LOGD("[test] debug line from rank %d\n", world_rank);

    init({});
}
