#include "app/Application.hpp"
#include "utils/LogManager.hpp"

int main(int argc, char** argv)
{
    const int exit_code = app::Application{ argc, argv }.run();
    utils::LogManager::Shutdown();
    return exit_code;
}
