#include "master/Log.hpp"
#include <catch2/catch_session.hpp>
#include <mpi.h>

// Catch2 main for tests that need MPI up before the first TEST_CASE runs.
struct MpiSession
{
    MpiSession(int& argc, char**& argv)
    {
        int inited = 0;
        MPI_Initialized(&inited);
        if (!inited)
            MPI_Init(&argc, &argv);
        gridflow::master::logx::init();
    }
    ~MpiSession()
    {
        int finalized = 0;
        MPI_Finalized(&finalized);
        if (!finalized)
            MPI_Finalize();
    }
};

int main(int argc, char** argv)
{
    MpiSession mpi(argc, argv);
    return Catch::Session().run(argc, argv);
}
