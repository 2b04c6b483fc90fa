#include <cstdlib>
#include <string>

#include <boost/program_options.hpp>

#include "util/config.hpp"
#include "util/file.hpp"
#include "core/DownloadError.hpp"

std::string getStateDirectory()
{
    const char *home = std::getenv("HOME");
    if (!home)
    {
        // Fallback to current directory if HOME is not set
        return ".";
    }

    return std::string(home) + "/." + SEGDL_STATE_DIRECTORY;
}

bool parseCommandLine(int argc, const char *const argv[], DownloadConfig &config, std::ostream &out)
{
    namespace po = boost::program_options;

    po::options_description desc("Usage: segdl <url> [options]");
    po::positional_options_description positional;
    positional.add("url", 1);

    desc.add_options()
        ("help,h", "show this help message")
        ("url", po::value<std::string>(&config.url), "resource to download")
        ("segments,n", po::value<int>(&config.segmentCount)->default_value(SEGDL_DEFAULT_SEGMENTS),
         "number of concurrent segments")
        ("output-dir,o", po::value<std::string>(&config.outputDirectory)->default_value(""),
         "directory for segment files and the merged file")
        ("state", po::value<std::string>(&config.stateFilePath),
         "state record file (default ~/.segdl/state)")
        ("log-file", po::value<std::string>(&config.logFilePath),
         "log file used while the terminal UI is active (default ~/.segdl/segdl.log)")
        ("connect-timeout", po::value<long>(&config.connectTimeoutSecs)->default_value(30),
         "seconds allowed for connecting")
        ("stall-timeout", po::value<long>(&config.stallTimeoutSecs)->default_value(60),
         "seconds without data before a segment fails (0 = never)")
        ("no-ui", "log to stderr instead of showing the terminal UI; Ctrl-C pauses")
        ("restart", "ignore saved state and download from scratch")
        ("verbose,v", "log debug detail");

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION, e.what());
    }

    if (vm.count("help"))
    {
        out << desc << "\n";
        return false;
    }

    if (config.url.empty())
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION, "a URL is required, see --help");
    }

    if (config.segmentCount <= 0)
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION,
                            "segment count must be positive, got " + std::to_string(config.segmentCount));
    }

    if (config.connectTimeoutSecs < 0 || config.stallTimeoutSecs < 0)
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION, "timeouts cannot be negative");
    }

    if (config.stateFilePath.empty())
    {
        config.stateFilePath = joinPath(getStateDirectory(), SEGDL_STATE_FILENAME);
    }

    if (config.logFilePath.empty())
    {
        config.logFilePath = joinPath(getStateDirectory(), SEGDL_LOG_FILENAME);
    }

    config.useUI = vm.count("no-ui") == 0;
    config.forceRestart = vm.count("restart") > 0;
    config.verbose = vm.count("verbose") > 0;
    return true;
}
