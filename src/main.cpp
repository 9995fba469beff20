// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#include <exception>

#include <spdlog/spdlog.h>

#include "Application.h"

int main(int argc, char** argv)
{
    try
    {
        kerf::Application::getInstance().run(argc, argv);
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
