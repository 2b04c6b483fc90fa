#include <iostream>

#include "core/DownloadApplication.hpp"
#include "core/DownloadError.hpp"
#include "util/config.hpp"
#include "util/logging.hpp"

int main(int argc, char *argv[])
{
    DownloadConfig config;
    try
    {
        if (!parseCommandLine(argc, argv, config, std::cout))
        {
            return SEGDL_EXIT_OK; // --help
        }
    }
    catch (const DownloadError &e)
    {
        std::cerr << "segdl: " << e.what() << "\n";
        return SEGDL_EXIT_CONFIGURATION;
    }

    initialiseLogging(config);

    DownloadApplication application(config);
    return application.run();
}
