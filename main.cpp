#include <chrono>
#include <iostream>
#include <stdexcept>

#include "CastKeeper.hpp"

int main(int argc, char** argv)
{
    try
    {
        CastKeeper cast_keeper(argc, argv, std::chrono::seconds(1));
        return cast_keeper.run();
    }
    catch (std::runtime_error& ex)
    {
        std::cerr << ex.what() << "\n";
    }

    return 1;
}
